// witness.h
//
// Witness generation: runs AES-128 directly and records every intermediate
// byte the circuit declares a cell for, in the circuit's own decomposition
// (SubBytes, ShiftRows, x2, x3, the two partial XORs of each MixColumns
// output, AddRoundKey). Bits are not stored; they are taken from these
// bytes at assignment time.
#pragma once
#include "zkaes/state.h"

#include <cstdint>
#include <vector>

namespace zkaes {

struct KeyScheduleTrace {
    std::array<Block, kRoundKeys> roundKeys;
    // subWords[i] = SubWord(RotWord(last word of roundKeys[i])).
    std::array<Word, kRounds> subWords;
    // rconned[i] = subWords[i][0] ^ kRcon[i + 1].
    std::array<uint8_t, kRounds> rconned;
};

struct RoundTrace {
    Block input;
    Block subbed;     // SubBytes, pre-ShiftRows positions
    Block shifted;
    // MixColumns intermediates, indexed like `shifted`. Zero in the final round.
    Block doubled;
    Block tripled;
    Block partialLo;  // t0 ^ t1 of the output's matrix row
    Block partialHi;  // t2 ^ t3
    Block mixed;      // equals `shifted` in the final round
    Block output;
};

struct BlockTrace {
    Block plaintext;
    Block initial;    // plaintext ^ roundKeys[0]
    std::array<RoundTrace, kRounds> rounds;
    Block ciphertext;
};

struct AesTrace {
    Block key;
    KeyScheduleTrace schedule;
    std::vector<BlockTrace> blocks;
};

// Throws InputError unless bytes holds exactly 16 bytes. `what` names the
// argument in the message.
Block toBlock(const std::vector<uint8_t>& bytes, const char* what);

KeyScheduleTrace expandKey(const Block& key);
RoundTrace roundTrace(const Block& state, const Block& roundKey, bool final);
BlockTrace encryptBlock(const KeyScheduleTrace& schedule, const Block& plaintext);

// Throws InputError when plaintexts is empty.
AesTrace generateWitness(const Block& key, const std::vector<Block>& plaintexts);
AesTrace generateWitness(const std::vector<uint8_t>& key, const std::vector<uint8_t>& plaintext);

} // namespace zkaes
