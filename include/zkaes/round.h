// round.h
//
// One AES round over byte cells:
//   SubBytes     16 S-box lookups, outputs decomposed to bits
//   ShiftRows    relabelling of cells, no constraints
//   MixColumns   x2 / x3 per byte over bits, then (t0^t1)^(t2^t3) per output
//   AddRoundKey  bitwise XOR with the round key, recomposed to bytes
// The final round skips MixColumns.
#pragma once
#include "zkaes/byte_gadgets.h"
#include "zkaes/key_schedule.h"
#include "zkaes/witness.h"

#include <array>
#include <string>

namespace zkaes {

struct RoundCells {
    bool final = false;
    std::array<ByteCell, kBlockBytes> subbed;
    // MixColumns, indexed by ShiftRows output position. Empty in the final round.
    std::array<Bits, kBlockBytes> doubled;
    std::array<Bits, kBlockBytes> tripled;
    std::array<Bits, kBlockBytes> partialLo;
    std::array<Bits, kBlockBytes> partialHi;
    std::array<Bits, kBlockBytes> mixed;
    StateCells output;
};

// state ^ roundKey, recomposed to bytes.
StateCells synthesizeAddRoundKey(ConstraintSystem& cs, const Chips& chips, const std::array<Bits, kBlockBytes>& state,
                                 const StateCells& roundKey, const std::string& name);

RoundCells synthesizeRound(ConstraintSystem& cs, const Chips& chips, const StateCells& state,
                           const StateCells& roundKey, bool final, const std::string& name);

void assignRound(ConstraintSystem& cs, const RoundCells& cells, const RoundTrace& trace);

} // namespace zkaes
