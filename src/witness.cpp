// witness.cpp
#include "zkaes/witness.h"
#include "zkaes/errors.h"
#include "zkaes/gf256.h"
#include "zkaes/log.h"

#include <string>

namespace zkaes {

Block toBlock(const std::vector<uint8_t>& bytes, const char* what){
    if(bytes.size() != kBlockBytes)
        throw InputError(std::string(what) + " must be 16 bytes, got " + std::to_string(bytes.size()));
    Block b;
    for(size_t i=0;i<kBlockBytes;i++) b[i] = bytes[i];
    return b;
}

KeyScheduleTrace expandKey(const Block& key){
    KeyScheduleTrace s{};
    s.roundKeys[0] = key;
    for(size_t r=1;r<kRoundKeys;r++){
        const Block& prev = s.roundKeys[r-1];
        Block& cur = s.roundKeys[r];

        Word t;
        for(size_t j=0;j<4;j++){
            s.subWords[r-1][j] = sbox(prev[kRotWord[j]]);
            t[j] = s.subWords[r-1][j];
        }
        s.rconned[r-1] = (uint8_t)(t[0] ^ kRcon[r]);
        t[0] = s.rconned[r-1];

        for(size_t w=0;w<4;w++){
            for(size_t j=0;j<4;j++){
                const size_t i = 4*w + j;
                cur[i] = (uint8_t)(prev[i] ^ (w == 0 ? t[j] : cur[i-4]));
            }
        }
    }
    return s;
}

static uint8_t scaled(uint8_t coef, const RoundTrace& t, size_t k){
    switch(coef){
        case 1: return t.shifted[k];
        case 2: return t.doubled[k];
        case 3: return t.tripled[k];
    }
    throw SynthesisError("MixColumns coefficient must be 1, 2 or 3");
}

RoundTrace roundTrace(const Block& state, const Block& roundKey, bool final){
    RoundTrace t{};
    t.input = state;
    for(size_t i=0;i<kBlockBytes;i++) t.subbed[i] = sbox(state[i]);
    t.shifted = shiftRows(t.subbed);

    if(final){
        t.mixed = t.shifted;
    }else{
        for(size_t i=0;i<kBlockBytes;i++){
            t.doubled[i] = xtime(t.shifted[i]);
            t.tripled[i] = (uint8_t)(t.doubled[i] ^ t.shifted[i]);
        }
        for(size_t c=0;c<4;c++){
            for(size_t r=0;r<4;r++){
                uint8_t v[4];
                for(size_t j=0;j<4;j++) v[j] = scaled(kMixColumns[r][j], t, 4*c + j);
                const size_t o = 4*c + r;
                t.partialLo[o] = (uint8_t)(v[0] ^ v[1]);
                t.partialHi[o] = (uint8_t)(v[2] ^ v[3]);
                t.mixed[o] = (uint8_t)(t.partialLo[o] ^ t.partialHi[o]);
            }
        }
    }

    for(size_t i=0;i<kBlockBytes;i++) t.output[i] = (uint8_t)(t.mixed[i] ^ roundKey[i]);
    return t;
}

BlockTrace encryptBlock(const KeyScheduleTrace& schedule, const Block& plaintext){
    BlockTrace b{};
    b.plaintext = plaintext;
    for(size_t i=0;i<kBlockBytes;i++) b.initial[i] = (uint8_t)(plaintext[i] ^ schedule.roundKeys[0][i]);

    const Block* state = &b.initial;
    for(size_t r=1;r<=kRounds;r++){
        b.rounds[r-1] = roundTrace(*state, schedule.roundKeys[r], r == kRounds);
        state = &b.rounds[r-1].output;
    }
    b.ciphertext = *state;
    return b;
}

AesTrace generateWitness(const Block& key, const std::vector<Block>& plaintexts){
    if(plaintexts.empty()) throw InputError("at least one plaintext block is required");
    AesTrace trace;
    trace.key = key;
    trace.schedule = expandKey(key);
    trace.blocks.reserve(plaintexts.size());
    for(const auto& pt : plaintexts) trace.blocks.push_back(encryptBlock(trace.schedule, pt));
    dbg("witness: " + std::to_string(trace.blocks.size()) + " block(s) traced");
    return trace;
}

AesTrace generateWitness(const std::vector<uint8_t>& key, const std::vector<uint8_t>& plaintext){
    Block k = toBlock(key, "key");
    Block p = toBlock(plaintext, "plaintext");
    return generateWitness(k, std::vector<Block>{p});
}

} // namespace zkaes
