// sbox_table.cpp
#include "zkaes/sbox_table.h"
#include "zkaes/errors.h"
#include "zkaes/gf256.h"

namespace zkaes {

static LookupTable build_table(const char* name, uint8_t (*f)(uint8_t)){
    initField();
    LookupTable t;
    t.name = name;
    t.width = 2;
    t.rows.reserve(256);
    for(uint32_t i=0;i<256;i++){
        t.rows.push_back({frFromU64(i), frFromU64(f((uint8_t)i))});
    }
    return t;
}

LookupTable buildSboxTable(){ return build_table("aes_sbox", sbox); }
LookupTable buildInverseSboxTable(){ return build_table("aes_inv_sbox", invSbox); }

void SboxChip::load(ConstraintSystem& cs){
    if(loaded_) throw SynthesisError("S-box table already loaded");
    table_ = cs.addTable(buildSboxTable());
    loaded_ = true;
}

Cell SboxChip::lookup(ConstraintSystem& cs, Cell input, const std::string& name) const {
    if(!loaded_) throw SynthesisError("S-box lookup before the table was loaded");
    Cell out = cs.privateCell(name);
    cs.lookup(table_, {input, out});
    return out;
}

} // namespace zkaes
