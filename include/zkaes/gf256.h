// gf256.h
// Arithmetic in GF(2^8) modulo the AES polynomial x^8 + x^4 + x^3 + x + 1.
#pragma once
#include <cstdint>

namespace zkaes {

// Low byte of the AES reduction polynomial 0x11B.
constexpr uint8_t kGfReduction = 0x1b;

// Multiply by x: left shift, reduced when the top bit was set.
inline uint8_t xtime(uint8_t a) {
    return (uint8_t)((a << 1) ^ ((a & 0x80) ? kGfReduction : 0));
}

uint8_t gfMul(uint8_t a, uint8_t b);

// Multiplicative inverse, with 0 mapped to 0 as AES does.
uint8_t gfInverse(uint8_t a);

uint8_t affineTransform(uint8_t a);

// S-box built from gfInverse and affineTransform.
uint8_t sbox(uint8_t a);
uint8_t invSbox(uint8_t a);

} // namespace zkaes
