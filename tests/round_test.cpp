// round_test.cpp
#include "zkaes/mock_prover.h"
#include "zkaes/round.h"
#include "zkaes/witness.h"

#include <gtest/gtest.h>

using namespace zkaes;

TEST(ShiftRows, RowRRotatesLeftByR){
    std::array<size_t, kBlockBytes> idx;
    for(size_t i=0;i<kBlockBytes;i++) idx[i] = i;
    auto s = shiftRows(idx);
    for(size_t c=0;c<4;c++)
        for(size_t r=0;r<4;r++) EXPECT_EQ(s[4*c + r], 4*((c + r) % 4) + r);

    auto x = idx;
    for(int i=0;i<4;i++) x = shiftRows(x);
    EXPECT_EQ(x, idx);
}

TEST(RoundTrace, Fips197FirstRound){
    // FIPS-197 appendix B, round 1
    const Block in = {0x19,0x3d,0xe3,0xbe, 0xa0,0xf4,0xe2,0x2b, 0x9a,0xc6,0x8d,0x2a, 0xe9,0xf8,0x48,0x08};
    const Block rk = {0xa0,0xfa,0xfe,0x17, 0x88,0x54,0x2c,0xb1, 0x23,0xa3,0x39,0x39, 0x2a,0x6c,0x76,0x05};
    const Block mixed = {0x04,0x66,0x81,0xe5, 0xe0,0xcb,0x19,0x9a, 0x48,0xf8,0xd3,0x7a, 0x28,0x06,0x26,0x4c};
    const Block out = {0xa4,0x9c,0x7f,0xf2, 0x68,0x9f,0x35,0x2b, 0x6b,0x5b,0xea,0x43, 0x02,0x6a,0x50,0x49};

    RoundTrace t = roundTrace(in, rk, false);
    EXPECT_EQ(t.subbed[0], 0xd4);
    EXPECT_EQ(t.shifted[1], 0xbf);
    EXPECT_EQ(t.mixed, mixed);
    EXPECT_EQ(t.output, out);
}

TEST(RoundTrace, FinalRoundSkipsMixColumns){
    const Block in = {0xeb,0x59,0x8b,0x1b, 0x40,0x2e,0xa1,0xc3, 0xf2,0x38,0x13,0x42, 0x1e,0x84,0xe7,0xd2};
    const Block rk = {0xd0,0x14,0xf9,0xa8, 0xc9,0xee,0x25,0x89, 0xe1,0x3f,0x0c,0xc8, 0xb6,0x63,0x0c,0xa6};
    const Block out = {0x39,0x25,0x84,0x1d, 0x02,0xdc,0x09,0xfb, 0xdc,0x11,0x85,0x97, 0x19,0x6a,0x0b,0x32};

    RoundTrace t = roundTrace(in, rk, true);
    EXPECT_EQ(t.mixed, t.shifted);
    EXPECT_EQ(t.doubled, Block{});
    EXPECT_EQ(t.output, out);
}

class RoundCircuit : public ::testing::TestWithParam<bool> {
protected:
    void SetUp() override {
        chips.load(p);
        for(size_t i=0;i<kBlockBytes;i++){
            state[i] = chips.bytes.input(p, "s[" + std::to_string(i) + "]");
            key[i] = chips.bytes.input(p, "k[" + std::to_string(i) + "]");
        }
        cells = synthesizeRound(p, chips, state, key, GetParam(), "r");
    }

    void assignInputs(const Block& s, const Block& k){
        for(size_t i=0;i<kBlockBytes;i++){
            assignByte(p, state[i], s[i]);
            assignByte(p, key[i], k[i]);
        }
    }

    MockProver p;
    Chips chips;
    StateCells state, key;
    RoundCells cells;
};

static void sample(Block& s, Block& k){
    for(size_t i=0;i<kBlockBytes;i++){
        s[i] = (uint8_t)(17 * i + 3);
        k[i] = (uint8_t)(0xa5 ^ (29 * i));
    }
}

TEST_P(RoundCircuit, WitnessSatisfiesRound){
    Block s, k;
    sample(s, k);
    assignInputs(s, k);
    assignRound(p, cells, roundTrace(s, k, GetParam()));
    EXPECT_TRUE(p.verify({}).empty());
    EXPECT_EQ(cells.final, GetParam());
}

TEST_P(RoundCircuit, WrongOutputByteFails){
    Block s, k;
    sample(s, k);
    assignInputs(s, k);
    RoundTrace t = roundTrace(s, k, GetParam());
    assignRound(p, cells, t);
    assignByte(p, cells.output[5], (uint8_t)(t.output[5] ^ 0x40));
    EXPECT_FALSE(p.verify({}).empty());
}

TEST_P(RoundCircuit, TraceFromOtherStateFails){
    Block s, k;
    sample(s, k);
    assignInputs(s, k);
    s[0] ^= 1;
    assignRound(p, cells, roundTrace(s, k, GetParam()));
    EXPECT_FALSE(p.verify({}).empty());
}

TEST_P(RoundCircuit, ShiftRowsIsWiringOnly){
    // SubBytes and AddRoundKey on 16 bytes, MixColumns only in full rounds
    CircuitStats st = p.stats();
    EXPECT_EQ(st.lookups, kBlockBytes);
    if(GetParam()){
        EXPECT_EQ(st.gateUsage.at("xor"), 8 * kBlockBytes);
    }else{
        // x2: 3, x3: 8, lo/hi/mixed: 24, AddRoundKey: 8
        EXPECT_EQ(st.gateUsage.at("xor"), (3 + 8 + 24 + 8) * kBlockBytes);
    }
}

INSTANTIATE_TEST_SUITE_P(FullAndFinal, RoundCircuit, ::testing::Values(false, true));
