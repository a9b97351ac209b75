// aes128_circuit.h
//
// AES-128 encryption circuit: one key schedule shared by `blocks`
// single-block encryptions. Key and plaintext are private; ciphertext bytes
// are public, and with publicPlaintext the plaintext bytes too.
//
// Public input order: ciphertext of block 0 (byte 0 first), block 1, ...,
// then, with publicPlaintext, plaintext of block 0, block 1, ...
//
// Usage:
//   Aes128Circuit circuit;
//   circuit.synthesize(cs);                       // constraints only
//   auto trace = generateWitness(key, plaintext);
//   circuit.assign(cs, trace);                    // values
//   backend checks / proves against circuit.publicInputs(trace)
#pragma once
#include "zkaes/key_schedule.h"
#include "zkaes/round.h"
#include "zkaes/witness.h"

#include <vector>

namespace zkaes {

struct Aes128Options {
    size_t blocks = 1;
    bool publicPlaintext = false;
};

class Aes128Circuit {
public:
    // Throws InputError when options.blocks is 0.
    explicit Aes128Circuit(Aes128Options options = Aes128Options());

    const Aes128Options& options() const { return options_; }
    bool synthesized() const { return synthesized_; }

    // Declares every cell and constraint. Independent of any witness.
    void synthesize(ConstraintSystem& cs);
    // Fills the private cells from a trace. Throws SynthesisError unless the
    // handle is the one synthesize() was called on.
    void assign(ConstraintSystem& cs, const AesTrace& trace) const;

    const std::vector<Cell>& publicCells() const { return public_; }
    std::vector<Fr> publicInputs(const AesTrace& trace) const;
    std::vector<Fr> publicInputs(const std::vector<Block>& ciphertexts, const std::vector<Block>& plaintexts) const;

    const StateCells& keyCells() const;
    const KeyScheduleCells& keySchedule() const;
    const StateCells& ciphertextCells(size_t block) const;
    const RoundCells& roundCells(size_t block, size_t round) const;

private:
    struct BlockCells {
        std::array<Cell, kBlockBytes> ciphertextPublic;
        std::array<Cell, kBlockBytes> plaintextPublic;
        StateCells plaintext;
        StateCells initial;
        std::array<RoundCells, kRounds> rounds;
    };

    void requireSynthesized(const char* what) const;

    Aes128Options options_;
    bool synthesized_ = false;
    const ConstraintSystem* cs_ = nullptr;
    Chips chips_;
    StateCells key_;
    KeyScheduleCells schedule_;
    std::vector<BlockCells> blocks_;
    std::vector<Cell> public_;
};

} // namespace zkaes
