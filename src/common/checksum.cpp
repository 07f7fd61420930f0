#include "common/checksum.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>

namespace checksum {

bool sha256Hex(const std::string& data, std::string& hex, std::string& error) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        error = "Failed to create OpenSSL context";
        return false;
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        error = "Failed to initialize digest";
        return false;
    }

    if (!data.empty() && EVP_DigestUpdate(ctx, data.data(), data.size()) != 1) {
        EVP_MD_CTX_free(ctx);
        error = "Failed to update digest";
        return false;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(ctx);
        error = "Failed to finalize digest";
        return false;
    }
    EVP_MD_CTX_free(ctx);

    std::stringstream ss;
    for (unsigned int i = 0; i < hashLen; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    hex = ss.str();
    return true;
}

} // namespace checksum
