// state.h
//
// AES-128 state layout and fixed constants, shared by the witness generator
// and the circuit. State byte 4*c + r sits in row r of column c, which is
// also the order bytes are read from the input block.
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

namespace zkaes {

constexpr size_t kBlockBytes = 16;
constexpr size_t kRounds = 10;
constexpr size_t kRoundKeys = kRounds + 1;

using Block = std::array<uint8_t, kBlockBytes>;
using Word = std::array<uint8_t, 4>;

// kRcon[i] is the round constant for round key i; kRcon[0] is unused.
constexpr std::array<uint8_t, kRoundKeys> kRcon = {
    0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80, 0x1b, 0x36};

// RotWord of the last word of a round key, as indices into that key.
constexpr std::array<size_t, 4> kRotWord = {13, 14, 15, 12};

// Row r of the MixColumns matrix gives output row r of a column.
constexpr uint8_t kMixColumns[4][4] = {
    {2, 3, 1, 1},
    {1, 2, 3, 1},
    {1, 1, 2, 3},
    {3, 1, 1, 2},
};

// ShiftRows as a gather: out[i] = in[kShiftRows[i]].
// Row r is rotated left by r: out[4c + r] = in[4((c + r) % 4) + r].
constexpr std::array<size_t, kBlockBytes> kShiftRows = {
    0, 5, 10, 15,
    4, 9, 14, 3,
    8, 13, 2, 7,
    12, 1, 6, 11};

template <class T>
std::array<T, kBlockBytes> shiftRows(const std::array<T, kBlockBytes>& in) {
    std::array<T, kBlockBytes> out;
    for (size_t i = 0; i < kBlockBytes; i++) out[i] = in[kShiftRows[i]];
    return out;
}

} // namespace zkaes
