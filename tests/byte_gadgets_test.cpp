// byte_gadgets_test.cpp
#include "zkaes/byte_gadgets.h"
#include "zkaes/errors.h"
#include "zkaes/gf256.h"
#include "zkaes/mock_prover.h"

#include <gtest/gtest.h>

using namespace zkaes;

namespace {

class ByteChipTest : public ::testing::Test {
protected:
    void SetUp() override { chip.load(p); }

    uint8_t read(const Bits& bits){
        uint8_t v = 0;
        for(size_t i=0;i<8;i++){
            auto x = p.value(bits[i]);
            EXPECT_TRUE(x.has_value());
            uint8_t b = 0;
            EXPECT_TRUE(x && frToByte(*x, b) && b <= 1);
            v |= (uint8_t)(b << i);
        }
        return v;
    }

    MockProver p;
    ByteChip chip;
};

} // namespace

TEST_F(ByteChipTest, DecomposeAcceptsEveryByte){
    ByteCell x = chip.input(p, "x");
    for(int v : {0, 1, 0x5a, 0xff}){
        assignByte(p, x, (uint8_t)v);
        EXPECT_TRUE(p.verify({}).empty()) << "v=" << v;
    }
}

TEST_F(ByteChipTest, DecomposeRejectsOutOfRangeValue){
    ByteCell x = chip.input(p, "x");
    assignBits(p, x.bits, 0xff);
    p.assign(x.value, frFromU64(256));
    auto f = p.verify({});
    ASSERT_EQ(f.size(), 1u);
    EXPECT_EQ(f[0].name, "compose");
}

TEST_F(ByteChipTest, NonBooleanBitIsRejected){
    ByteCell x = chip.input(p, "x");
    // 2 = 0b10 with bit0 set to 2 instead of bit1 set to 1
    assignBits(p, x.bits, 0);
    p.assign(x.bits[0], frFromU64(2));
    p.assign(x.value, frFromU64(2));
    auto f = p.verify({});
    ASSERT_EQ(f.size(), 1u);
    EXPECT_EQ(f[0].name, "bool");
}

TEST_F(ByteChipTest, XorBits){
    ByteCell a = chip.input(p, "a");
    ByteCell b = chip.input(p, "b");
    Bits c = chip.xorBits(p, a.bits, b.bits, "c");
    assignByte(p, a, 0xc3);
    assignByte(p, b, 0x5a);
    assignBits(p, c, 0xc3 ^ 0x5a);
    EXPECT_TRUE(p.verify({}).empty());
    EXPECT_EQ(read(c), 0x99);

    p.assign(c[3], frFromU64(0));
    auto f = p.verify({});
    ASSERT_EQ(f.size(), 1u);
    EXPECT_EQ(f[0].name, "xor");
}

TEST_F(ByteChipTest, XorConstWiresZeroBitsThrough){
    ByteCell a = chip.input(p, "a");
    Bits c = chip.xorConst(p, a.bits, 0x1b, "c");
    // 0x1b = 0b00011011: bits 2, 5, 6, 7 are the input's own cells
    EXPECT_EQ(c[2], a.bits[2]);
    EXPECT_EQ(c[7], a.bits[7]);
    EXPECT_NE(c[0], a.bits[0]);
    EXPECT_EQ(p.stats().gateUsage.at("not"), 4u);

    assignByte(p, a, 0x36);
    assignBits(p, c, 0x36 ^ 0x1b);
    EXPECT_TRUE(p.verify({}).empty());
    EXPECT_EQ(read(c), 0x2d);
}

TEST_F(ByteChipTest, XorConstZeroAddsNothing){
    ByteCell a = chip.input(p, "a");
    const size_t before = p.numCells();
    Bits c = chip.xorConst(p, a.bits, 0, "c");
    EXPECT_EQ(p.numCells(), before);
    EXPECT_EQ(c, a.bits);
}

TEST_F(ByteChipTest, MulBy2UsesThreeXors){
    ByteCell a = chip.input(p, "a");
    Bits d = chip.mulBy2(p, a.bits, "d");
    EXPECT_EQ(p.stats().gateUsage.count("xor") ? p.stats().gateUsage.at("xor") : 0u, 3u);
    EXPECT_EQ(d[0], a.bits[7]);
    EXPECT_EQ(d[2], a.bits[1]);

    for(int v : {0x01, 0x57, 0x80, 0xae, 0xff}){
        assignByte(p, a, (uint8_t)v);
        assignBits(p, d, xtime((uint8_t)v));
        EXPECT_TRUE(p.verify({}).empty()) << "v=" << v;
        EXPECT_EQ(read(d), xtime((uint8_t)v));
    }
    assignByte(p, a, 0x80);
    assignBits(p, d, 0x1b);
    EXPECT_TRUE(p.verify({}).empty());
}

TEST_F(ByteChipTest, MulBy2RejectsUnreducedShift){
    ByteCell a = chip.input(p, "a");
    Bits d = chip.mulBy2(p, a.bits, "d");
    assignByte(p, a, 0x80);
    assignBits(p, d, 0x00);
    EXPECT_FALSE(p.verify({}).empty());
}

TEST_F(ByteChipTest, MulBy3){
    ByteCell a = chip.input(p, "a");
    Bits d = chip.mulBy2(p, a.bits, "d");
    Bits t = chip.mulBy3(p, a.bits, d, "t");
    for(int v : {0x01, 0x57, 0xd4, 0xff}){
        assignByte(p, a, (uint8_t)v);
        assignBits(p, d, xtime((uint8_t)v));
        assignBits(p, t, gfMul((uint8_t)v, 3));
        EXPECT_TRUE(p.verify({}).empty()) << "v=" << v;
    }
}

TEST_F(ByteChipTest, ComposeBindsBitsToValue){
    ByteCell a = chip.input(p, "a");
    ByteCell b = chip.input(p, "b");
    ByteCell c = chip.compose(p, chip.xorBits(p, a.bits, b.bits, "x"), "c");
    assignByte(p, a, 0x0f);
    assignByte(p, b, 0xf0);
    assignByte(p, c, 0xff);
    EXPECT_TRUE(p.verify({}).empty());

    p.assign(c.value, frFromU64(0xfe));
    EXPECT_FALSE(p.verify({}).empty());
}

TEST(ByteChip, UseBeforeLoadThrows){
    MockProver p;
    ByteChip chip;
    EXPECT_FALSE(chip.loaded());
    EXPECT_THROW(chip.input(p, "x"), SynthesisError);
    chip.load(p);
    EXPECT_THROW(chip.load(p), SynthesisError);
}
