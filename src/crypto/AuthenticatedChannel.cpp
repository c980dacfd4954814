#include "zapwire/crypto/AuthenticatedChannel.hpp"

#include "zapwire/crypto/Random.hpp"
#include "zapwire/crypto/Sha256.hpp"

#include <openssl/evp.h>

#include <limits>
#include <memory>
#include <stdexcept>

namespace zapwire::crypto {

namespace {

struct CipherContextDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;

CipherContext make_context() {
    CipherContext ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }
    return ctx;
}

}  // namespace

AuthenticatedChannel::AuthenticatedChannel(const SharedSecret& secret)
    : key_(Sha256::digest(secret.bytes())) {}

AuthenticatedChannel::~AuthenticatedChannel() {
    secure_wipe(key_);
}

ByteBuffer AuthenticatedChannel::seal(std::span<const std::uint8_t> plaintext) const {
    if (plaintext.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument("plaintext too large to seal");
    }

    ByteBuffer frame(kNonceSize + plaintext.size() + kTagSize);
    auto* nonce = frame.data();
    auto* ciphertext = frame.data() + kNonceSize;
    auto* tag = frame.data() + kNonceSize + plaintext.size();
    random_bytes(std::span<std::uint8_t>(nonce, kNonceSize));

    auto ctx = make_context();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1) {
        throw std::runtime_error("EVP_EncryptInit_ex (cipher) failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1) {
        throw std::runtime_error("EVP_CTRL_AEAD_SET_IVLEN failed");
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce) != 1) {
        throw std::runtime_error("EVP_EncryptInit_ex (key/nonce) failed");
    }

    int length = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), ciphertext, &length, plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
        throw std::runtime_error("EVP_EncryptUpdate failed");
    }
    int final_length = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext + length, &final_length) != 1) {
        throw std::runtime_error("EVP_EncryptFinal_ex failed");
    }
    if (static_cast<std::size_t>(length + final_length) != plaintext.size()) {
        throw std::runtime_error("unexpected ciphertext length");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(kTagSize), tag) != 1) {
        throw std::runtime_error("EVP_CTRL_AEAD_GET_TAG failed");
    }
    return frame;
}

std::optional<ByteBuffer> AuthenticatedChannel::open(std::span<const std::uint8_t> frame) const {
    if (frame.size() < kOverhead ||
        frame.size() - kOverhead > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return std::nullopt;
    }
    const auto ciphertext_size = frame.size() - kOverhead;
    const auto* nonce = frame.data();
    const auto* ciphertext = frame.data() + kNonceSize;
    ByteBuffer tag(frame.end() - kTagSize, frame.end());

    auto ctx = make_context();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce) != 1) {
        throw std::runtime_error("EVP_DecryptInit_ex failed");
    }

    // One spare byte keeps the output pointer valid for empty messages.
    ByteBuffer plaintext(ciphertext_size + 1);
    int length = 0;
    if (ciphertext_size > 0 &&
        EVP_DecryptUpdate(ctx.get(), plaintext.data(), &length, ciphertext, static_cast<int>(ciphertext_size)) != 1) {
        return std::nullopt;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(kTagSize), tag.data()) != 1) {
        throw std::runtime_error("EVP_CTRL_AEAD_SET_TAG failed");
    }
    int final_length = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + length, &final_length) <= 0) {
        secure_wipe(plaintext);
        return std::nullopt;
    }
    plaintext.resize(static_cast<std::size_t>(length + final_length));
    return plaintext;
}

}  // namespace zapwire::crypto
