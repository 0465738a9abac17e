/**
 * @file data_accessor.cpp
 * @brief item_record helpers
 */

#include <matchops/sync/storage/data_accessor.h>
#include <matchops/sync/core/checksum.h>

namespace matchops::sync {

auto item_record::content_hash() const -> std::string {
    std::string canonical;
    canonical.reserve(id.size() + payload.size() + 1);
    canonical += id;
    canonical += '\0';
    canonical += payload;
    return checksum::sha256(canonical);
}

}  // namespace matchops::sync
