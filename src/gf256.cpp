// gf256.cpp
#include "zkaes/gf256.h"

#include <array>

namespace zkaes {

namespace {

struct SboxTables {
    std::array<uint8_t, 256> forward;
    std::array<uint8_t, 256> inverse;

    SboxTables(){
        for(int i=0;i<256;i++){
            forward[i] = affineTransform(gfInverse((uint8_t)i));
        }
        for(int i=0;i<256;i++){
            inverse[forward[i]] = (uint8_t)i;
        }
    }
};

const SboxTables& tables(){
    static const SboxTables t;
    return t;
}

inline uint8_t rotl8(uint8_t x, int n){
    return (uint8_t)((x << n) | (x >> (8 - n)));
}

} // namespace

uint8_t gfMul(uint8_t a, uint8_t b){
    uint8_t p = 0;
    while(b){
        if(b & 1) p ^= a;
        a = xtime(a);
        b >>= 1;
    }
    return p;
}

// a^254 = a^-1 in GF(2^8); 0^254 = 0.
uint8_t gfInverse(uint8_t a){
    uint8_t result = 1;
    uint8_t base = a;
    unsigned e = 254;
    while(e){
        if(e & 1) result = gfMul(result, base);
        base = gfMul(base, base);
        e >>= 1;
    }
    return a == 0 ? 0 : result;
}

uint8_t affineTransform(uint8_t a){
    return (uint8_t)(a ^ rotl8(a, 1) ^ rotl8(a, 2) ^ rotl8(a, 3) ^ rotl8(a, 4) ^ 0x63);
}

uint8_t sbox(uint8_t a){ return tables().forward[a]; }
uint8_t invSbox(uint8_t a){ return tables().inverse[a]; }

} // namespace zkaes
