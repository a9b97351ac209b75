// hex.cpp
#include "zkaes/hex.h"
#include "zkaes/errors.h"

namespace zkaes {

std::string hexOfBytes(const uint8_t* data, size_t n){
    static const char* H="0123456789abcdef";
    std::string o; o.reserve(n*2);
    for(size_t i=0;i<n;i++){ o.push_back(H[data[i]>>4]); o.push_back(H[data[i]&0xf]); }
    return o;
}

std::vector<uint8_t> parseHexBytes(const std::string& h){
    auto hv=[](char c)->int{
        if('0'<=c&&c<='9') return c-'0';
        if('a'<=c&&c<='f') return 10+(c-'a');
        if('A'<=c&&c<='F') return 10+(c-'A');
        return -1;
    };
    size_t start = (h.size()>=2 && h[0]=='0' && (h[1]=='x'||h[1]=='X')) ? 2 : 0;
    if((h.size()-start) % 2 != 0) throw InputError("hex string has odd length: " + h);

    std::vector<uint8_t> v; v.reserve((h.size()-start)/2);
    for(size_t i=start;i+1<h.size();i+=2){
        int hi=hv(h[i]), lo=hv(h[i+1]);
        if(hi<0||lo<0) throw InputError("invalid hex character in: " + h);
        v.push_back(uint8_t((hi<<4)|lo));
    }
    return v;
}

} // namespace zkaes
