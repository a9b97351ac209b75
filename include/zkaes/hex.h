// hex.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace zkaes {

std::string hexOfBytes(const uint8_t* data, size_t n);

// Accepts an optional "0x" prefix and either case. Throws InputError on
// odd length or non-hex characters.
std::vector<uint8_t> parseHexBytes(const std::string& h);

} // namespace zkaes
