#pragma once

#include "chunkup/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace chunkup {

/**
 * @brief Incremental SHA-256 digest over OpenSSL EVP, rendered as 64 lowercase hex digits
 *
 * Used for the optional whole-file content hash that the server verifies
 * after assembly. A digest that failed once stays failed.
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;
    Sha256(Sha256&&) noexcept;
    Sha256& operator=(Sha256&&) noexcept;

    Result<void> update(const std::uint8_t* data, std::size_t size);
    Result<void> update(const std::vector<std::uint8_t>& data) { return update(data.data(), data.size()); }

    /// Finish the digest; further updates fail
    Result<std::string> hex();

private:
    struct ContextFree {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };

    std::unique_ptr<evp_md_ctx_st, ContextFree> ctx_;
    std::optional<Error> error_;
};

Result<std::string> sha256_hex(const std::vector<std::uint8_t>& data);

Result<std::string> sha256_hex(const std::string& text);

Result<std::string> sha256_file(const std::filesystem::path& path);

} // namespace chunkup
