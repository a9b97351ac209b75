// key_schedule_test.cpp
#include "zkaes/hex.h"
#include "zkaes/key_schedule.h"
#include "zkaes/mock_prover.h"
#include "zkaes/witness.h"

#include <gtest/gtest.h>

using namespace zkaes;

// Expansion of the all-zero key, one 32-bit word per entry.
static const char* kZeroKeyWords[44] = {
    "00000000", "00000000", "00000000", "00000000", "62636363", "62636363", "62636363",
    "62636363", "9b9898c9", "f9fbfbaa", "9b9898c9", "f9fbfbaa", "90973450", "696ccffa",
    "f2f45733", "0b0fac99", "ee06da7b", "876a1581", "759e42b2", "7e91ee2b", "7f2e2b88",
    "f8443e09", "8dda7cbb", "f34b9290", "ec614b85", "1425758c", "99ff0937", "6ab49ba7",
    "21751787", "3550620b", "acaf6b3c", "c61bf09b", "0ef90333", "3ba96138", "97060a04",
    "511dfa9f", "b1d4d8e2", "8a7db9da", "1d7bb3de", "4c664941", "b4ef5bcb", "3e92e211",
    "23e951cf", "6f8f188e",
};

static Block block_of(const std::string& h){
    return toBlock(parseHexBytes(h), "block");
}

static std::string hex_of(const Block& b){
    return hexOfBytes(b.data(), b.size());
}

TEST(ExpandKey, ZeroKey){
    KeyScheduleTrace s = expandKey(Block{});
    for(size_t w=0;w<44;w++){
        EXPECT_EQ(hexOfBytes(s.roundKeys[w / 4].data() + 4 * (w % 4), 4), kZeroKeyWords[w]) << "word " << w;
    }
    EXPECT_EQ(s.subWords[0][0], 0x63);
    EXPECT_EQ(s.rconned[0], 0x62);
}

TEST(ExpandKey, Fips197AppendixA){
    KeyScheduleTrace s = expandKey(block_of("2b7e151628aed2a6abf7158809cf4f3c"));
    EXPECT_EQ(hex_of(s.roundKeys[1]), "a0fafe1788542cb123a339392a6c7605");
    EXPECT_EQ(hex_of(s.roundKeys[10]), "d014f9a8c9ee2589e13f0cc8b6630ca6");
}

class KeyScheduleCircuit : public ::testing::Test {
protected:
    void SetUp() override {
        chips.load(p);
        for(size_t i=0;i<kBlockBytes;i++) key[i] = chips.bytes.input(p, "key[" + std::to_string(i) + "]");
        cells = synthesizeKeySchedule(p, chips, key);
    }

    uint8_t byteAt(Cell c){
        auto v = p.value(c);
        uint8_t b = 0;
        EXPECT_TRUE(v && frToByte(*v, b));
        return b;
    }

    MockProver p;
    Chips chips;
    StateCells key;
    KeyScheduleCells cells;
};

TEST_F(KeyScheduleCircuit, RoundKeyZeroIsTheKey){
    for(size_t i=0;i<kBlockBytes;i++) EXPECT_EQ(cells.roundKeys[0][i].value, key[i].value);
    // four S-box lookups per derived round key
    EXPECT_EQ(p.stats().lookups, 4 * kRounds);
}

TEST_F(KeyScheduleCircuit, ZeroKeySatisfiesAndMatchesExpansion){
    assignKeySchedule(p, cells, expandKey(Block{}));
    EXPECT_TRUE(p.verify({}).empty());

    for(size_t w=0;w<44;w++){
        Block rk;
        for(size_t i=0;i<kBlockBytes;i++) rk[i] = byteAt(cells.roundKeys[w / 4][i].value);
        EXPECT_EQ(hexOfBytes(rk.data() + 4 * (w % 4), 4), kZeroKeyWords[w]) << "word " << w;
    }
}

TEST_F(KeyScheduleCircuit, Fips197Key){
    assignKeySchedule(p, cells, expandKey(block_of("2b7e151628aed2a6abf7158809cf4f3c")));
    EXPECT_TRUE(p.verify({}).empty());
    Block rk10;
    for(size_t i=0;i<kBlockBytes;i++) rk10[i] = byteAt(cells.roundKeys[10][i].value);
    EXPECT_EQ(hex_of(rk10), "d014f9a8c9ee2589e13f0cc8b6630ca6");
}

TEST_F(KeyScheduleCircuit, TamperedRoundKeyByteFails){
    assignKeySchedule(p, cells, expandKey(Block{}));
    // rk1[0] = 0x62; claim 0x63 consistently in value and bits
    assignByte(p, cells.roundKeys[1][0], 0x63);
    EXPECT_FALSE(p.verify({}).empty());
}

TEST_F(KeyScheduleCircuit, WrongSubWordFails){
    KeyScheduleTrace t = expandKey(Block{});
    assignKeySchedule(p, cells, t);
    // SubWord output not matching the S-box of the rotated word
    assignByte(p, cells.subWords[3][1], (uint8_t)(t.subWords[3][1] ^ 1));
    auto f = p.verify({});
    ASSERT_FALSE(f.empty());
    bool lookupFailed = false;
    for(const auto& x : f) lookupFailed |= x.kind == VerifyFailure::Kind::Lookup;
    EXPECT_TRUE(lookupFailed);
}
