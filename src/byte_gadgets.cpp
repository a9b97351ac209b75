// byte_gadgets.cpp
#include "zkaes/byte_gadgets.h"
#include "zkaes/errors.h"
#include "zkaes/gf256.h"

namespace zkaes {

// ---------------------------- gate templates ---------------------------------

static Term term(int64_t c, std::vector<size_t> slots){
    return Term{frFromI64(c), std::move(slots)};
}

// b * b - b = 0
static Gate bool_gate(){
    return Gate{"bool", 1, {term(1, {0, 0}), term(-1, {0})}};
}

// sum 2^i * b_i - x = 0, slots b0..b7, x
static Gate compose_gate(){
    Gate g{"compose", 9, {}};
    for(size_t i=0;i<8;i++) g.terms.push_back(term(int64_t(1) << i, {i}));
    g.terms.push_back(term(-1, {8}));
    return g;
}

// a + b - 2ab - c = 0
static Gate xor_gate(){
    return Gate{"xor", 3, {term(1, {0}), term(1, {1}), term(-2, {0, 1}), term(-1, {2})}};
}

// a + c - 1 = 0
static Gate not_gate(){
    return Gate{"not", 2, {term(1, {0}), term(1, {1}), term(-1, {})}};
}

static std::string bit_name(const std::string& name, size_t i){
    return name + ".b" + std::to_string(i);
}

// ------------------------------- ByteChip ------------------------------------

void ByteChip::load(ConstraintSystem& cs){
    if(loaded_) throw SynthesisError("byte gates already loaded");
    initField();
    bool_ = cs.addGate(bool_gate());
    compose_ = cs.addGate(compose_gate());
    xor_ = cs.addGate(xor_gate());
    not_ = cs.addGate(not_gate());
    loaded_ = true;
}

ByteCell ByteChip::input(ConstraintSystem& cs, const std::string& name) const {
    return decompose(cs, cs.privateCell(name), name);
}

ByteCell ByteChip::decompose(ConstraintSystem& cs, Cell value, const std::string& name) const {
    if(!loaded_) throw SynthesisError("byte gadget used before load");
    ByteCell out;
    out.value = value;
    std::vector<Cell> slots;
    slots.reserve(9);
    for(size_t i=0;i<8;i++){
        out.bits[i] = cs.privateCell(bit_name(name, i));
        cs.enableGate(bool_, {out.bits[i]});
        slots.push_back(out.bits[i]);
    }
    slots.push_back(value);
    cs.enableGate(compose_, slots);
    return out;
}

ByteCell ByteChip::compose(ConstraintSystem& cs, const Bits& bits, const std::string& name) const {
    if(!loaded_) throw SynthesisError("byte gadget used before load");
    ByteCell out;
    out.bits = bits;
    out.value = cs.privateCell(name);
    std::vector<Cell> slots(bits.begin(), bits.end());
    slots.push_back(out.value);
    cs.enableGate(compose_, slots);
    return out;
}

Cell ByteChip::xorBit(ConstraintSystem& cs, Cell a, Cell b, const std::string& name) const {
    Cell c = cs.privateCell(name);
    cs.enableGate(xor_, {a, b, c});
    return c;
}

Bits ByteChip::xorBits(ConstraintSystem& cs, const Bits& a, const Bits& b, const std::string& name) const {
    if(!loaded_) throw SynthesisError("byte gadget used before load");
    Bits out;
    for(size_t i=0;i<8;i++) out[i] = xorBit(cs, a[i], b[i], bit_name(name, i));
    return out;
}

Bits ByteChip::xorConst(ConstraintSystem& cs, const Bits& a, uint8_t c, const std::string& name) const {
    if(!loaded_) throw SynthesisError("byte gadget used before load");
    Bits out = a;
    for(size_t i=0;i<8;i++){
        if(!((c >> i) & 1)) continue;
        out[i] = cs.privateCell(bit_name(name, i));
        cs.enableGate(not_, {a[i], out[i]});
    }
    return out;
}

// (a << 1) ^ (a7 ? 0x1B : 0): bit i is a[i-1], XORed with a7 where 0x1B has a 1.
Bits ByteChip::mulBy2(ConstraintSystem& cs, const Bits& a, const std::string& name) const {
    if(!loaded_) throw SynthesisError("byte gadget used before load");
    Bits out;
    for(size_t i=0;i<8;i++){
        bool reduce = (kGfReduction >> i) & 1;
        if(i == 0){
            // the shift brings in a zero, so the bit is a7 itself (0x1B is odd)
            out[0] = a[7];
        }else if(reduce){
            out[i] = xorBit(cs, a[i-1], a[7], bit_name(name, i));
        }else{
            out[i] = a[i-1];
        }
    }
    return out;
}

Bits ByteChip::mulBy3(ConstraintSystem& cs, const Bits& a, const Bits& doubled, const std::string& name) const {
    return xorBits(cs, doubled, a, name);
}

// ------------------------------- witness -------------------------------------

void assignBits(ConstraintSystem& cs, const Bits& bits, uint8_t v){
    for(size_t i=0;i<8;i++) cs.assign(bits[i], frFromU64((v >> i) & 1));
}

void assignByte(ConstraintSystem& cs, const ByteCell& cell, uint8_t v){
    cs.assign(cell.value, frFromU64(v));
    assignBits(cs, cell.bits, v);
}

} // namespace zkaes
