// reference_aes.h
// Independent AES-128 single-block encryption through OpenSSL EVP, used to
// cross-check the witness generator.
#pragma once
#include "zkaes/state.h"

namespace zkaes {

// Throws std::runtime_error if OpenSSL reports a failure.
Block referenceEncrypt(const Block& key, const Block& plaintext);

} // namespace zkaes
