#include "zapwire/crypto/Sha256.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace zapwire::crypto {

void Sha256::ContextDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Sha256::Sha256()
    : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

Sha256::~Sha256() = default;

void Sha256::update(std::span<const std::uint8_t> data) {
    if (finalized_) {
        throw std::logic_error("Sha256 already finalized");
    }
    if (data.empty()) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

void Sha256::update(std::string_view text) {
    update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

Digest Sha256::finalize() {
    if (finalized_) {
        throw std::logic_error("Sha256 already finalized");
    }
    Digest out{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &length) != 1 || length != out.size()) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    finalized_ = true;
    return out;
}

Digest Sha256::digest(std::span<const std::uint8_t> data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

std::string Sha256::hex_digest(std::span<const std::uint8_t> data) {
    const auto bytes = digest(data);
    return to_hex(bytes);
}

}  // namespace zapwire::crypto
