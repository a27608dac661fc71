#include "chunkup/core/hash.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace chunkup {
namespace {

Error openssl_error(const std::string& what) {
    const unsigned long code = ERR_get_error();
    if (code == 0) {
        return make_error(ErrorCode::IoError, what + ": no queued OpenSSL error");
    }
    std::array<char, 256> buffer{};
    ERR_error_string_n(code, buffer.data(), buffer.size());
    return make_error(ErrorCode::IoError, what + ": " + buffer.data());
}

} // namespace

void Sha256::ContextFree::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        error_ = openssl_error("EVP_MD_CTX_new failed");
    } else if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        error_ = openssl_error("EVP_DigestInit_ex failed");
    }
}

Sha256::~Sha256() = default;
Sha256::Sha256(Sha256&&) noexcept = default;
Sha256& Sha256::operator=(Sha256&&) noexcept = default;

Result<void> Sha256::update(const std::uint8_t* data, std::size_t size) {
    if (error_) {
        return Err<void>(*error_);
    }
    if (!ctx_) {
        return Fail<void>(ErrorCode::InvalidState, "Digest already finished");
    }
    if (size == 0) {
        return Ok();
    }
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        error_ = openssl_error("EVP_DigestUpdate failed");
        return Err<void>(*error_);
    }
    return Ok();
}

Result<std::string> Sha256::hex() {
    if (error_) {
        return Err<std::string>(*error_);
    }
    if (!ctx_) {
        return Fail<std::string>(ErrorCode::InvalidState, "Digest already finished");
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    const bool finished = EVP_DigestFinal_ex(ctx_.get(), digest.data(), &length) == 1;
    ctx_.reset();
    if (!finished) {
        error_ = openssl_error("EVP_DigestFinal_ex failed");
        return Err<std::string>(*error_);
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(digest[i]);
    }
    return Ok(oss.str());
}

Result<std::string> sha256_hex(const std::vector<std::uint8_t>& data) {
    Sha256 digest;
    if (auto res = digest.update(data); res.is_error()) {
        return Err<std::string>(res.error());
    }
    return digest.hex();
}

Result<std::string> sha256_hex(const std::string& text) {
    Sha256 digest;
    if (auto res = digest.update(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
        res.is_error()) {
        return Err<std::string>(res.error());
    }
    return digest.hex();
}

Result<std::string> sha256_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Fail<std::string>(ErrorCode::IoError, "Failed to open file: " + path.string());
    }

    Sha256 digest;
    char buffer[4096];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        auto res = digest.update(reinterpret_cast<const std::uint8_t*>(buffer),
                                 static_cast<std::size_t>(input.gcount()));
        if (res.is_error()) {
            return Err<std::string>(res.error());
        }
    }
    if (input.bad()) {
        return Fail<std::string>(ErrorCode::IoError, "Failed to read file: " + path.string());
    }
    return digest.hex();
}

} // namespace chunkup
