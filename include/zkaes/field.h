// field.h
// Scalar field of BN254 (alt_bn128) via Herumi mcl (https://github.com/herumi/mcl).
// Every circuit value, byte or bit, is an element of this field.
//
// Link flags:  -lmcl

#pragma once
#include <mcl/bn.hpp>
#include <cstdint>
#include <string>

namespace zkaes {

using Fr = mcl::bn::Fr;

// Initialise the BN_SNARK1 curve parameters. Idempotent.
void initField();

Fr frFromU64(uint64_t v);
Fr frFromI64(int64_t v);

// True when x is a canonical byte value; the byte is written to out.
bool frToByte(const Fr& x, uint8_t& out);

std::string frToHex(const Fr& x);

} // namespace zkaes
