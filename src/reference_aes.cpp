// reference_aes.cpp
#include "zkaes/reference_aes.h"

#include <openssl/evp.h>
#include <stdexcept>

namespace zkaes {

Block referenceEncrypt(const Block& key, const Block& plaintext){
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if(!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");

    Block out{};
    int len = 0, fin = 0;
    bool ok = EVP_EncryptInit_ex(ctx, EVP_aes_128_ecb(), nullptr, key.data(), nullptr) == 1
           && EVP_CIPHER_CTX_set_padding(ctx, 0) == 1
           && EVP_EncryptUpdate(ctx, out.data(), &len, plaintext.data(), (int)plaintext.size()) == 1
           && EVP_EncryptFinal_ex(ctx, out.data() + len, &fin) == 1;
    EVP_CIPHER_CTX_free(ctx);

    if(!ok || len + fin != (int)kBlockBytes) throw std::runtime_error("OpenSSL AES-128-ECB encryption failed");
    return out;
}

} // namespace zkaes
