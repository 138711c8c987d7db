#include "dedup/hash/sha256.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>

namespace dedup::hash {

void Sha256::ContextDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Sha256::Sha256()
    : ctx_(EVP_MD_CTX_new()) {
    ready_ = ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) == 1;
}

Sha256::~Sha256() = default;
Sha256::Sha256(Sha256&&) noexcept = default;
Sha256& Sha256::operator=(Sha256&&) noexcept = default;

Result<void> Sha256::update(const void* data, std::size_t length) {
    if (!ready_) {
        return Err<void>(make_error(ErrorKind::GenericIOFailure, "SHA-256 context is not initialised"));
    }
    if (length == 0) {
        return Ok();
    }
    if (EVP_DigestUpdate(ctx_.get(), data, length) != 1) {
        return Err<void>(make_error(ErrorKind::GenericIOFailure, "EVP_DigestUpdate failed"));
    }
    return Ok();
}

Result<std::string> Sha256::finish() {
    if (!ready_) {
        return Err<std::string>(make_error(ErrorKind::GenericIOFailure, "SHA-256 context is not initialised"));
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    ready_ = false;
    if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1 || length != kDigestLength) {
        return Err<std::string>(make_error(ErrorKind::GenericIOFailure, "EVP_DigestFinal_ex failed"));
    }
    return Ok(to_hex(digest, length));
}

Result<std::string> Sha256::hex_digest(std::string_view data) {
    Sha256 hasher;
    if (auto res = hasher.update(data.data(), data.size()); res.is_error()) {
        return Err<std::string>(res.error());
    }
    return hasher.finish();
}

std::string to_hex(const unsigned char* bytes, std::size_t length) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

} // namespace dedup::hash
