/**
 * @file checksum.h
 * @brief SHA-256 digests for item comparison and checkpoint integrity
 */

#ifndef MATCHOPS_SYNC_CORE_CHECKSUM_H
#define MATCHOPS_SYNC_CORE_CHECKSUM_H

#include <cstddef>
#include <string>
#include <string_view>

namespace matchops::sync {

/**
 * @brief Checksum utilities backed by OpenSSL
 */
class checksum {
public:
    /**
     * @brief Calculate SHA-256 hash of data
     * @param data Input bytes
     * @return Lowercase hex digest (64 characters)
     */
    [[nodiscard]] static auto sha256(std::string_view data) -> std::string;

    /**
     * @brief Compare data against an expected hex digest
     */
    [[nodiscard]] static auto verify_sha256(std::string_view data,
                                            std::string_view expected) -> bool;

    /**
     * @brief Leading characters of a digest, for log messages
     */
    [[nodiscard]] static auto short_hash(std::string_view hash,
                                         std::size_t length = 12) -> std::string;
};

}  // namespace matchops::sync

#endif  // MATCHOPS_SYNC_CORE_CHECKSUM_H
