// round.cpp
#include "zkaes/round.h"
#include "zkaes/errors.h"

namespace zkaes {

StateCells synthesizeAddRoundKey(ConstraintSystem& cs, const Chips& chips, const std::array<Bits, kBlockBytes>& state,
                                 const StateCells& roundKey, const std::string& name){
    StateCells out;
    for(size_t i=0;i<kBlockBytes;i++){
        const std::string n = name + "[" + std::to_string(i) + "]";
        Bits x = chips.bytes.xorBits(cs, state[i], roundKey[i].bits, n + ".x");
        out[i] = chips.bytes.compose(cs, x, n);
    }
    return out;
}

RoundCells synthesizeRound(ConstraintSystem& cs, const Chips& chips, const StateCells& state,
                           const StateCells& roundKey, bool final, const std::string& name){
    RoundCells rc;
    rc.final = final;

    // SubBytes
    for(size_t i=0;i<kBlockBytes;i++){
        const std::string n = name + ".sub" + std::to_string(i);
        Cell s = chips.sbox.lookup(cs, state[i].value, n);
        rc.subbed[i] = chips.bytes.decompose(cs, s, n);
    }

    // ShiftRows
    const StateCells shifted = shiftRows(rc.subbed);

    std::array<Bits, kBlockBytes> pre;
    if(final){
        for(size_t i=0;i<kBlockBytes;i++) pre[i] = shifted[i].bits;
    }else{
        // MixColumns: x2 and x3 of every byte once, reused across its column
        for(size_t i=0;i<kBlockBytes;i++){
            const std::string n = name + ".mc" + std::to_string(i);
            rc.doubled[i] = chips.bytes.mulBy2(cs, shifted[i].bits, n + ".x2");
            rc.tripled[i] = chips.bytes.mulBy3(cs, shifted[i].bits, rc.doubled[i], n + ".x3");
        }
        for(size_t c=0;c<4;c++){
            for(size_t r=0;r<4;r++){
                std::array<Bits, 4> t;
                for(size_t j=0;j<4;j++){
                    const size_t k = 4*c + j;
                    switch(kMixColumns[r][j]){
                        case 1: t[j] = shifted[k].bits; break;
                        case 2: t[j] = rc.doubled[k]; break;
                        case 3: t[j] = rc.tripled[k]; break;
                        default: throw SynthesisError("MixColumns coefficient must be 1, 2 or 3");
                    }
                }
                const size_t o = 4*c + r;
                const std::string n = name + ".mix" + std::to_string(o);
                rc.partialLo[o] = chips.bytes.xorBits(cs, t[0], t[1], n + ".lo");
                rc.partialHi[o] = chips.bytes.xorBits(cs, t[2], t[3], n + ".hi");
                rc.mixed[o] = chips.bytes.xorBits(cs, rc.partialLo[o], rc.partialHi[o], n);
            }
        }
        pre = rc.mixed;
    }

    // AddRoundKey
    rc.output = synthesizeAddRoundKey(cs, chips, pre, roundKey, name + ".ark");
    return rc;
}

void assignRound(ConstraintSystem& cs, const RoundCells& cells, const RoundTrace& trace){
    for(size_t i=0;i<kBlockBytes;i++) assignByte(cs, cells.subbed[i], trace.subbed[i]);
    if(!cells.final){
        for(size_t i=0;i<kBlockBytes;i++){
            assignBits(cs, cells.doubled[i], trace.doubled[i]);
            assignBits(cs, cells.tripled[i], trace.tripled[i]);
            assignBits(cs, cells.partialLo[i], trace.partialLo[i]);
            assignBits(cs, cells.partialHi[i], trace.partialHi[i]);
            assignBits(cs, cells.mixed[i], trace.mixed[i]);
        }
    }
    for(size_t i=0;i<kBlockBytes;i++) assignByte(cs, cells.output[i], trace.output[i]);
}

} // namespace zkaes
