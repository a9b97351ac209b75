// byte_gadgets.h
//
// Byte cells with their bit decomposition, and the bitwise operations AES
// needs (XOR, XOR with a constant, GF(2^8) doubling) built from custom gates
// over the bits. Field addition is not XOR, so every XOR goes through bits:
//   xor(a, b) = a + b - 2ab   per bit.
// Bits produced by xor/not gates from boolean inputs are boolean themselves
// and are not re-checked; fresh bits get a boolean gate.
#pragma once
#include "zkaes/constraint_system.h"
#include "zkaes/sbox_table.h"

#include <array>
#include <cstdint>
#include <string>

namespace zkaes {

// Little-endian: bits[0] is the least significant bit.
using Bits = std::array<Cell, 8>;

struct ByteCell {
    Cell value;
    Bits bits;
};

class ByteChip {
public:
    // Registers the bool / compose / xor / not gates. Once per constraint system.
    void load(ConstraintSystem& cs);
    bool loaded() const { return loaded_; }

    // Fresh private byte, range checked through its decomposition.
    ByteCell input(ConstraintSystem& cs, const std::string& name) const;
    // Attach 8 boolean bits to an existing cell and recompose them to it.
    ByteCell decompose(ConstraintSystem& cs, Cell value, const std::string& name) const;
    // Byte cell for bits that are already known to be boolean.
    ByteCell compose(ConstraintSystem& cs, const Bits& bits, const std::string& name) const;

    Bits xorBits(ConstraintSystem& cs, const Bits& a, const Bits& b, const std::string& name) const;
    // XOR with a circuit constant: 0 bits are wired through, 1 bits negated.
    Bits xorConst(ConstraintSystem& cs, const Bits& a, uint8_t c, const std::string& name) const;

    // GF(2^8) multiply by 2: shift left, XOR 0x1B in when bit 7 was set.
    Bits mulBy2(ConstraintSystem& cs, const Bits& a, const std::string& name) const;
    // Multiply by 3 = (a * 2) XOR a; takes the already computed doubling.
    Bits mulBy3(ConstraintSystem& cs, const Bits& a, const Bits& doubled, const std::string& name) const;

private:
    Cell xorBit(ConstraintSystem& cs, Cell a, Cell b, const std::string& name) const;

    GateId bool_ = 0;
    GateId compose_ = 0;
    GateId xor_ = 0;
    GateId not_ = 0;
    bool loaded_ = false;
};

// Shared gadgets of one circuit.
struct Chips {
    ByteChip bytes;
    SboxChip sbox;

    void load(ConstraintSystem& cs) {
        bytes.load(cs);
        sbox.load(cs);
    }
};

void assignBits(ConstraintSystem& cs, const Bits& bits, uint8_t v);
void assignByte(ConstraintSystem& cs, const ByteCell& cell, uint8_t v);

} // namespace zkaes
