#include "zapwire/crypto/CodeHash.hpp"

#include "zapwire/Types.hpp"
#include "zapwire/crypto/Random.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace zapwire::crypto {

namespace {

constexpr std::string_view kCodeHashSalt = "zapwire/relay/code-hash/v1";
constexpr int kCodeHashIterations = 100000;

}  // namespace

std::string relay_code_hash(std::string_view code) {
    std::array<std::uint8_t, kCodeHashHexLength / 2> derived{};
    if (PKCS5_PBKDF2_HMAC(code.data(), static_cast<int>(code.size()),
                          reinterpret_cast<const unsigned char*>(kCodeHashSalt.data()),
                          static_cast<int>(kCodeHashSalt.size()),
                          kCodeHashIterations, EVP_sha256(),
                          static_cast<int>(derived.size()), derived.data()) != 1) {
        throw std::runtime_error("PKCS5_PBKDF2_HMAC failed");
    }
    auto hex = to_hex(derived);
    secure_wipe(derived);
    return hex;
}

bool is_code_hash(std::string_view text) {
    return text.size() == kCodeHashHexLength && std::all_of(text.begin(), text.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0 || (ch >= 'a' && ch <= 'f');
    });
}

}  // namespace zapwire::crypto
