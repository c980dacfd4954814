#include "zapwire/crypto/CodeExchange.hpp"

#include "zapwire/Error.hpp"
#include "zapwire/crypto/Random.hpp"
#include "zapwire/crypto/Sha256.hpp"

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

namespace zapwire::crypto {

namespace {

constexpr std::string_view kPasswordDomain = "zapwire/spake2/w/v1";
constexpr std::string_view kSeedM = "zapwire/spake2/M/P-256";
constexpr std::string_view kSeedN = "zapwire/spake2/N/P-256";
constexpr std::string_view kSenderIdentity = "zapwire-sender";
constexpr std::string_view kReceiverIdentity = "zapwire-receiver";
constexpr std::size_t kScalarSize = 32;
constexpr std::size_t kCompressedPointSize = 33;
constexpr std::size_t kUncompressedPointSize = 65;

struct BnDeleter {
    void operator()(BIGNUM* bn) const noexcept { BN_clear_free(bn); }
};
struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const noexcept { BN_CTX_free(ctx); }
};
struct GroupDeleter {
    void operator()(EC_GROUP* group) const noexcept { EC_GROUP_free(group); }
};
struct PointDeleter {
    void operator()(EC_POINT* point) const noexcept { EC_POINT_clear_free(point); }
};

using BigNum = std::unique_ptr<BIGNUM, BnDeleter>;
using BnContext = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using Group = std::unique_ptr<EC_GROUP, GroupDeleter>;
using Point = std::unique_ptr<EC_POINT, PointDeleter>;

BigNum make_bn() {
    BigNum bn(BN_new());
    if (!bn) {
        throw std::runtime_error("BN_new failed");
    }
    return bn;
}

Point make_point(const EC_GROUP* group) {
    Point point(EC_POINT_new(group));
    if (!point) {
        throw std::runtime_error("EC_POINT_new failed");
    }
    return point;
}

[[noreturn]] void exchange_failed(const std::string& reason) {
    ERR_clear_error();
    throw Error(ErrorCode::KeyExchangeFailed, reason);
}

// Wide reduction of two digests keeps the bias of w negligible.
BigNum derive_password_scalar(std::string_view code, const BIGNUM* order, BN_CTX* ctx) {
    std::array<std::uint8_t, 64> wide{};
    for (std::uint8_t block = 0; block < 2; ++block) {
        Sha256 hasher;
        hasher.update(kPasswordDomain);
        const std::uint8_t counter[1] = {block};
        hasher.update(counter);
        hasher.update(code);
        const auto digest = hasher.finalize();
        std::copy(digest.begin(), digest.end(), wide.begin() + block * digest.size());
    }
    BigNum wide_bn(BN_bin2bn(wide.data(), static_cast<int>(wide.size()), nullptr));
    secure_wipe(wide);
    if (!wide_bn) {
        throw std::runtime_error("BN_bin2bn failed");
    }
    auto w = make_bn();
    if (BN_nnmod(w.get(), wide_bn.get(), order, ctx) != 1) {
        throw std::runtime_error("BN_nnmod failed");
    }
    return w;
}

// Try-and-increment hash to curve: nobody knows the discrete log of the result.
Point derive_blinding_point(const EC_GROUP* group, std::string_view seed, BN_CTX* ctx) {
    auto prime = make_bn();
    if (EC_GROUP_get_curve(group, prime.get(), nullptr, nullptr, ctx) != 1) {
        throw std::runtime_error("EC_GROUP_get_curve failed");
    }
    auto point = make_point(group);
    for (int counter = 0; counter < 256; ++counter) {
        Sha256 hasher;
        hasher.update(seed);
        const std::uint8_t counter_byte[1] = {static_cast<std::uint8_t>(counter)};
        hasher.update(counter_byte);
        const auto digest = hasher.finalize();
        BigNum x(BN_bin2bn(digest.data(), static_cast<int>(digest.size()), nullptr));
        if (!x) {
            throw std::runtime_error("BN_bin2bn failed");
        }
        if (BN_cmp(x.get(), prime.get()) >= 0) {
            continue;
        }
        if (EC_POINT_set_compressed_coordinates(group, point.get(), x.get(), 0, ctx) == 1) {
            return point;
        }
        ERR_clear_error();
    }
    throw std::runtime_error("unable to derive SPAKE2 blinding point");
}

ByteBuffer encode_point(const EC_GROUP* group,
                        const EC_POINT* point,
                        point_conversion_form_t form,
                        std::size_t expected,
                        BN_CTX* ctx) {
    ByteBuffer out(expected);
    const auto written = EC_POINT_point2oct(group, point, form, out.data(), out.size(), ctx);
    if (written != expected) {
        throw std::runtime_error("EC_POINT_point2oct failed");
    }
    return out;
}

void append_field(Sha256& hasher, std::span<const std::uint8_t> field) {
    const auto length = static_cast<std::uint32_t>(field.size());
    const std::uint8_t prefix[4] = {
        static_cast<std::uint8_t>((length >> 24) & 0xFFu),
        static_cast<std::uint8_t>((length >> 16) & 0xFFu),
        static_cast<std::uint8_t>((length >> 8) & 0xFFu),
        static_cast<std::uint8_t>(length & 0xFFu),
    };
    hasher.update(prefix);
    hasher.update(field);
}

void append_field(Sha256& hasher, std::string_view field) {
    append_field(hasher, std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(field.data()),
                                                       field.size()));
}

}  // namespace

SharedSecret::SharedSecret(const std::array<std::uint8_t, kSize>& bytes)
    : bytes_(bytes) {}

SharedSecret::~SharedSecret() {
    secure_wipe(bytes_);
}

bool SharedSecret::operator==(const SharedSecret& other) const noexcept {
    return CRYPTO_memcmp(bytes_.data(), other.bytes_.data(), bytes_.size()) == 0;
}

struct CodeExchange::State {
    Group group;
    BnContext ctx;
    BigNum password;
    BigNum scalar;
    Point blind_m;
    Point blind_n;
    ByteBuffer own_point;
};

CodeExchange::CodeExchange(std::string_view code, Role role)
    : role_(role),
      state_(std::make_unique<State>()) {
    auto& state = *state_;
    state.group.reset(EC_GROUP_new_by_curve_name(NID_X9_62_prime256v1));
    if (!state.group) {
        throw std::runtime_error("EC_GROUP_new_by_curve_name failed");
    }
    state.ctx.reset(BN_CTX_new());
    if (!state.ctx) {
        throw std::runtime_error("BN_CTX_new failed");
    }
    const auto* group = state.group.get();
    auto* ctx = state.ctx.get();
    const BIGNUM* order = EC_GROUP_get0_order(group);

    state.password = derive_password_scalar(code, order, ctx);
    state.blind_m = derive_blinding_point(group, kSeedM, ctx);
    state.blind_n = derive_blinding_point(group, kSeedN, ctx);

    state.scalar = make_bn();
    do {
        if (BN_priv_rand_range(state.scalar.get(), order) != 1) {
            throw std::runtime_error("BN_priv_rand_range failed");
        }
    } while (BN_is_zero(state.scalar.get()));

    // T = s*G + w*(M or N)
    const EC_POINT* own_blind = role_ == Role::Sender ? state.blind_m.get() : state.blind_n.get();
    auto element = make_point(group);
    if (EC_POINT_mul(group, element.get(), state.scalar.get(), own_blind, state.password.get(), ctx) != 1) {
        throw std::runtime_error("EC_POINT_mul failed");
    }
    state.own_point = encode_point(group, element.get(), POINT_CONVERSION_COMPRESSED, kCompressedPointSize, ctx);

    outbound_.reserve(kPayloadSize);
    outbound_.push_back(static_cast<std::uint8_t>(role_));
    outbound_.insert(outbound_.end(), state.own_point.begin(), state.own_point.end());
}

CodeExchange::~CodeExchange() = default;

SharedSecret CodeExchange::finish(std::span<const std::uint8_t> peer_payload) {
    if (finished_) {
        exchange_failed("exchange already finished");
    }
    finished_ = true;

    if (peer_payload.size() != kPayloadSize) {
        exchange_failed("unexpected payload length " + std::to_string(peer_payload.size()));
    }
    const auto peer_tag = peer_payload[0];
    if (peer_tag == static_cast<std::uint8_t>(role_)) {
        exchange_failed("peer payload carries our own role");
    }
    if (peer_tag != static_cast<std::uint8_t>(Role::Sender) && peer_tag != static_cast<std::uint8_t>(Role::Receiver)) {
        exchange_failed("unknown role tag in payload");
    }

    auto& state = *state_;
    const auto* group = state.group.get();
    auto* ctx = state.ctx.get();
    const auto peer_point_bytes = peer_payload.subspan(1);

    auto peer_point = make_point(group);
    if (EC_POINT_oct2point(group, peer_point.get(), peer_point_bytes.data(), peer_point_bytes.size(), ctx) != 1) {
        exchange_failed("peer element is not a valid curve point");
    }
    if (EC_POINT_is_at_infinity(group, peer_point.get()) == 1 ||
        EC_POINT_is_on_curve(group, peer_point.get(), ctx) != 1) {
        exchange_failed("peer element is not a valid curve point");
    }

    // K = s * (T_peer - w*(N or M))
    const EC_POINT* peer_blind = role_ == Role::Sender ? state.blind_n.get() : state.blind_m.get();
    auto unblind = make_point(group);
    if (EC_POINT_mul(group, unblind.get(), nullptr, peer_blind, state.password.get(), ctx) != 1 ||
        EC_POINT_invert(group, unblind.get(), ctx) != 1) {
        throw std::runtime_error("EC_POINT_mul failed");
    }
    auto base = make_point(group);
    if (EC_POINT_add(group, base.get(), peer_point.get(), unblind.get(), ctx) != 1) {
        throw std::runtime_error("EC_POINT_add failed");
    }
    auto shared_point = make_point(group);
    if (EC_POINT_mul(group, shared_point.get(), nullptr, base.get(), state.scalar.get(), ctx) != 1) {
        throw std::runtime_error("EC_POINT_mul failed");
    }
    if (EC_POINT_is_at_infinity(group, shared_point.get()) == 1) {
        exchange_failed("degenerate shared element");
    }

    auto shared_bytes = encode_point(group, shared_point.get(), POINT_CONVERSION_UNCOMPRESSED,
                                     kUncompressedPointSize, ctx);
    std::array<std::uint8_t, kScalarSize> password_bytes{};
    if (BN_bn2binpad(state.password.get(), password_bytes.data(), static_cast<int>(password_bytes.size())) !=
        static_cast<int>(password_bytes.size())) {
        throw std::runtime_error("BN_bn2binpad failed");
    }

    const ByteBuffer peer_bytes(peer_point_bytes.begin(), peer_point_bytes.end());
    const auto& sender_point = role_ == Role::Sender ? state.own_point : peer_bytes;
    const auto& receiver_point = role_ == Role::Sender ? peer_bytes : state.own_point;

    Sha256 transcript;
    append_field(transcript, kSenderIdentity);
    append_field(transcript, kReceiverIdentity);
    append_field(transcript, sender_point);
    append_field(transcript, receiver_point);
    append_field(transcript, shared_bytes);
    append_field(transcript, password_bytes);
    auto secret = transcript.finalize();

    secure_wipe(shared_bytes);
    secure_wipe(password_bytes);
    SharedSecret result(secret);
    secure_wipe(secret);

    // The ephemeral scalar is single use.
    BN_clear(state.scalar.get());
    return result;
}

}  // namespace zapwire::crypto
