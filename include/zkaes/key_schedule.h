// key_schedule.h
//
// AES-128 key expansion circuit. Eleven round keys of 16 byte cells each;
// round key 0 is the master key itself. For round key i:
//   w0 = prev.w0 ^ (SubWord(RotWord(prev.w3)) ^ Rcon[i])
//   wj = prev.wj ^ w(j-1)              j = 1..3
// RotWord is wiring, SubWord is four S-box lookups, Rcon is a constant.
#pragma once
#include "zkaes/byte_gadgets.h"
#include "zkaes/state.h"
#include "zkaes/witness.h"

#include <array>

namespace zkaes {

using StateCells = std::array<ByteCell, kBlockBytes>;

struct KeyScheduleCells {
    std::array<StateCells, kRoundKeys> roundKeys;
    std::array<std::array<ByteCell, 4>, kRounds> subWords;
    std::array<Bits, kRounds> rconned;
};

KeyScheduleCells synthesizeKeySchedule(ConstraintSystem& cs, const Chips& chips, const StateCells& key);
void assignKeySchedule(ConstraintSystem& cs, const KeyScheduleCells& cells, const KeyScheduleTrace& trace);

} // namespace zkaes
