// cli_args.h
// Flag parsing for the zkaes command-line driver.
#pragma once
#include <cstddef>
#include <string>

namespace zkaes {

struct CliArgs {
    std::string mode;
    std::string key, plaintext, ciphertext, json;
    bool random = false;
    bool publicPlaintext = false;
    bool debug = false;
    size_t blocks = 0;  // 0: not given
};

// argv[1] is the mode, flags follow. Throws InputError on an unknown flag,
// a flag missing its value, or a --blocks value that is not a positive integer.
CliArgs parseCliArgs(int argc, const char* const* argv);

} // namespace zkaes
