// field.cpp
#include "zkaes/field.h"

namespace zkaes {

void initField(){
    static bool inited=false;
    if(!inited){ mcl::bn::initPairing(mcl::BN_SNARK1); inited=true; }
}

Fr frFromU64(uint64_t v){
    Fr r;
    uint8_t buf[8];
    for(int i=0;i<8;i++){
        buf[7-i] = (uint8_t)((v >> (i*8)) & 0xff);
    }
    r.setBigEndianMod(buf, 8);
    return r;
}

Fr frFromI64(int64_t v){
    if(v >= 0) return frFromU64((uint64_t)v);
    Fr r = frFromU64((uint64_t)0 - (uint64_t)v);
    Fr::neg(r, r);
    return r;
}

bool frToByte(const Fr& x, uint8_t& out){
    bool ok = false;
    uint64_t v = x.getUint64(&ok);
    if(!ok || v > 0xff) return false;
    out = (uint8_t)v;
    return true;
}

std::string frToHex(const Fr& x){
    return x.getStr(16);
}

} // namespace zkaes
