#pragma once

#include "dedup/core/result.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace dedup::hash {

/**
 * @brief Incremental SHA-256 over OpenSSL's EVP interface
 *
 * update() may be called any number of times; the digest only depends on the
 * concatenated bytes, never on how they were split.
 */
class Sha256 {
public:
    static constexpr std::size_t kDigestLength = 32;
    static constexpr std::size_t kHexLength = kDigestLength * 2;

    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;
    Sha256(Sha256&&) noexcept;
    Sha256& operator=(Sha256&&) noexcept;

    Result<void> update(const void* data, std::size_t length);

    /// Lower-case hex digest; the hasher must not be updated afterwards
    Result<std::string> finish();

    /// One-shot digest of an in-memory buffer
    static Result<std::string> hex_digest(std::string_view data);

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };

    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
    bool ready_ = false;
};

std::string to_hex(const unsigned char* bytes, std::size_t length);

} // namespace dedup::hash
