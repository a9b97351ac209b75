// aes128_circuit.cpp
#include "zkaes/aes128_circuit.h"
#include "zkaes/errors.h"
#include "zkaes/log.h"

#include <string>
#include <utility>

namespace zkaes {

static std::string idx(const std::string& prefix, size_t i){
    return prefix + "[" + std::to_string(i) + "]";
}

Aes128Circuit::Aes128Circuit(Aes128Options options) : options_(options) {
    if(options_.blocks == 0) throw InputError("AES circuit needs at least one block");
    initField();
}

void Aes128Circuit::synthesize(ConstraintSystem& cs){
    if(synthesized_) throw SynthesisError("AES circuit already synthesized");

    // Built into locals; members change only once everything is declared.
    Chips chips;
    chips.load(cs);

    std::vector<BlockCells> blocks(options_.blocks);
    std::vector<Cell> pub;

    // Public cells first, so their allocation order is the instance order.
    for(size_t b=0;b<blocks.size();b++){
        for(size_t i=0;i<kBlockBytes;i++){
            blocks[b].ciphertextPublic[i] = cs.publicCell(idx("ct" + std::to_string(b), i));
            pub.push_back(blocks[b].ciphertextPublic[i]);
        }
    }
    if(options_.publicPlaintext){
        for(size_t b=0;b<blocks.size();b++){
            for(size_t i=0;i<kBlockBytes;i++){
                blocks[b].plaintextPublic[i] = cs.publicCell(idx("pt" + std::to_string(b), i));
                pub.push_back(blocks[b].plaintextPublic[i]);
            }
        }
    }

    StateCells key;
    for(size_t i=0;i<kBlockBytes;i++) key[i] = chips.bytes.input(cs, idx("key", i));
    KeyScheduleCells schedule = synthesizeKeySchedule(cs, chips, key);
    dbg("key schedule synthesized");

    for(size_t b=0;b<blocks.size();b++){
        BlockCells& bc = blocks[b];
        const std::string p = "blk" + std::to_string(b);

        std::array<Bits, kBlockBytes> ptBits;
        for(size_t i=0;i<kBlockBytes;i++){
            bc.plaintext[i] = chips.bytes.input(cs, idx(p + ".pt", i));
            if(options_.publicPlaintext) cs.copy(bc.plaintext[i].value, bc.plaintextPublic[i]);
            ptBits[i] = bc.plaintext[i].bits;
        }

        // round 0: AddRoundKey only
        bc.initial = synthesizeAddRoundKey(cs, chips, ptBits, schedule.roundKeys[0], p + ".r0");

        const StateCells* state = &bc.initial;
        for(size_t r=1;r<=kRounds;r++){
            bc.rounds[r-1] = synthesizeRound(cs, chips, *state, schedule.roundKeys[r], r == kRounds,
                                             p + ".r" + std::to_string(r));
            state = &bc.rounds[r-1].output;
        }

        for(size_t i=0;i<kBlockBytes;i++) cs.copy((*state)[i].value, bc.ciphertextPublic[i]);
        dbg(p + " synthesized");
    }

    chips_ = chips;
    key_ = key;
    schedule_ = schedule;
    blocks_ = std::move(blocks);
    public_ = std::move(pub);
    cs_ = &cs;
    synthesized_ = true;
}

void Aes128Circuit::assign(ConstraintSystem& cs, const AesTrace& trace) const {
    requireSynthesized("assign");
    if(&cs != cs_) throw SynthesisError("assign called with a different constraint system than synthesize");
    if(trace.blocks.size() != blocks_.size())
        throw InputError("trace has " + std::to_string(trace.blocks.size()) + " block(s), circuit expects " +
                         std::to_string(blocks_.size()));

    assignKeySchedule(cs, schedule_, trace.schedule);

    for(size_t b=0;b<blocks_.size();b++){
        const BlockCells& bc = blocks_[b];
        const BlockTrace& bt = trace.blocks[b];
        for(size_t i=0;i<kBlockBytes;i++){
            assignByte(cs, bc.plaintext[i], bt.plaintext[i]);
            assignByte(cs, bc.initial[i], bt.initial[i]);
        }
        for(size_t r=0;r<kRounds;r++) assignRound(cs, bc.rounds[r], bt.rounds[r]);
    }
    dbg("witness assigned");
}

std::vector<Fr> Aes128Circuit::publicInputs(const AesTrace& trace) const {
    std::vector<Block> cts, pts;
    for(const auto& b : trace.blocks){
        cts.push_back(b.ciphertext);
        pts.push_back(b.plaintext);
    }
    return publicInputs(cts, pts);
}

std::vector<Fr> Aes128Circuit::publicInputs(const std::vector<Block>& ciphertexts,
                                            const std::vector<Block>& plaintexts) const {
    if(ciphertexts.size() != options_.blocks)
        throw InputError("expected " + std::to_string(options_.blocks) + " ciphertext block(s), got " +
                         std::to_string(ciphertexts.size()));
    if(options_.publicPlaintext && plaintexts.size() != options_.blocks)
        throw InputError("expected " + std::to_string(options_.blocks) + " plaintext block(s), got " +
                         std::to_string(plaintexts.size()));

    std::vector<Fr> out;
    for(const auto& ct : ciphertexts)
        for(uint8_t v : ct) out.push_back(frFromU64(v));
    if(options_.publicPlaintext){
        for(const auto& pt : plaintexts)
            for(uint8_t v : pt) out.push_back(frFromU64(v));
    }
    return out;
}

const StateCells& Aes128Circuit::keyCells() const {
    requireSynthesized("keyCells");
    return key_;
}

const KeyScheduleCells& Aes128Circuit::keySchedule() const {
    requireSynthesized("keySchedule");
    return schedule_;
}

const StateCells& Aes128Circuit::ciphertextCells(size_t block) const {
    return roundCells(block, kRounds).output;
}

const RoundCells& Aes128Circuit::roundCells(size_t block, size_t round) const {
    requireSynthesized("roundCells");
    if(block >= blocks_.size() || round < 1 || round > kRounds)
        throw InputError("no round " + std::to_string(round) + " in block " + std::to_string(block));
    return blocks_[block].rounds[round-1];
}

void Aes128Circuit::requireSynthesized(const char* what) const {
    if(!synthesized_) throw SynthesisError(std::string(what) + " called before synthesize");
}

} // namespace zkaes
