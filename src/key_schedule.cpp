// key_schedule.cpp
#include "zkaes/key_schedule.h"

#include <string>

namespace zkaes {

KeyScheduleCells synthesizeKeySchedule(ConstraintSystem& cs, const Chips& chips, const StateCells& key){
    KeyScheduleCells out;
    out.roundKeys[0] = key;

    for(size_t r=1;r<kRoundKeys;r++){
        const StateCells& prev = out.roundKeys[r-1];
        const std::string rk = "rk" + std::to_string(r);

        // SubWord(RotWord(w3)); the rotation is only a choice of cells
        std::array<Bits, 4> t;
        for(size_t j=0;j<4;j++){
            const std::string n = rk + ".sub" + std::to_string(j);
            Cell s = chips.sbox.lookup(cs, prev[kRotWord[j]].value, n);
            out.subWords[r-1][j] = chips.bytes.decompose(cs, s, n);
            t[j] = out.subWords[r-1][j].bits;
        }
        out.rconned[r-1] = chips.bytes.xorConst(cs, t[0], kRcon[r], rk + ".rcon");
        t[0] = out.rconned[r-1];

        std::array<Bits, kBlockBytes> bits;
        for(size_t w=0;w<4;w++){
            for(size_t j=0;j<4;j++){
                const size_t i = 4*w + j;
                const Bits& rhs = (w == 0) ? t[j] : bits[i-4];
                bits[i] = chips.bytes.xorBits(cs, prev[i].bits, rhs, rk + ".x" + std::to_string(i));
            }
        }
        for(size_t i=0;i<kBlockBytes;i++){
            out.roundKeys[r][i] = chips.bytes.compose(cs, bits[i], rk + "[" + std::to_string(i) + "]");
        }
    }
    return out;
}

void assignKeySchedule(ConstraintSystem& cs, const KeyScheduleCells& cells, const KeyScheduleTrace& trace){
    for(size_t i=0;i<kBlockBytes;i++) assignByte(cs, cells.roundKeys[0][i], trace.roundKeys[0][i]);

    for(size_t r=1;r<kRoundKeys;r++){
        for(size_t j=0;j<4;j++) assignByte(cs, cells.subWords[r-1][j], trace.subWords[r-1][j]);
        assignBits(cs, cells.rconned[r-1], trace.rconned[r-1]);
        for(size_t i=0;i<kBlockBytes;i++) assignByte(cs, cells.roundKeys[r][i], trace.roundKeys[r][i]);
    }
}

} // namespace zkaes
