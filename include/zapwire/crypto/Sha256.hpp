#pragma once

#include "zapwire/Types.hpp"

#include <memory>
#include <span>
#include <string_view>

struct evp_md_ctx_st;

namespace zapwire::crypto {

class Sha256 {
public:
    static constexpr std::size_t kDigestSize = 32;

    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(std::span<const std::uint8_t> data);
    void update(std::string_view text);
    Digest finalize();

    static Digest digest(std::span<const std::uint8_t> data);
    static std::string hex_digest(std::span<const std::uint8_t> data);

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };

    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
    bool finalized_{false};
};

}  // namespace zapwire::crypto
