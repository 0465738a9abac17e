/**
 * @file checksum.cpp
 * @brief Implementation of checksum utilities
 */

#include <matchops/sync/core/checksum.h>

#include <openssl/evp.h>

#include <array>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace matchops::sync {

namespace {

/**
 * @brief RAII wrapper for EVP_MD_CTX
 */
class evp_md_ctx_wrapper {
public:
    evp_md_ctx_wrapper() : ctx_(EVP_MD_CTX_new()) {}

    ~evp_md_ctx_wrapper() {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
    }

    evp_md_ctx_wrapper(const evp_md_ctx_wrapper&) = delete;
    auto operator=(const evp_md_ctx_wrapper&) -> evp_md_ctx_wrapper& = delete;

    [[nodiscard]] auto get() const -> EVP_MD_CTX* { return ctx_; }
    [[nodiscard]] explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

auto to_hex(const unsigned char* data, unsigned int length) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

}  // namespace

auto checksum::sha256(std::string_view data) -> std::string {
    evp_md_ctx_wrapper ctx;
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    return to_hex(digest.data(), digest_len);
}

auto checksum::verify_sha256(std::string_view data, std::string_view expected) -> bool {
    return sha256(data) == expected;
}

auto checksum::short_hash(std::string_view hash, std::size_t length) -> std::string {
    return std::string(hash.substr(0, length));
}

}  // namespace matchops::sync
