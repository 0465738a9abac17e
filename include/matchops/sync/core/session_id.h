/**
 * @file session_id.h
 * @brief Identifier of one migration run
 */

#ifndef MATCHOPS_SYNC_CORE_SESSION_ID_H
#define MATCHOPS_SYNC_CORE_SESSION_ID_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace matchops::sync {

/**
 * @brief Unique identifier for a migration session (16-byte UUID)
 *
 * Stored in the checkpoint so a resumed run can be correlated in logs with
 * the run that was interrupted.
 */
struct session_id {
    std::array<uint8_t, 16> bytes{};

    constexpr session_id() noexcept = default;

    [[nodiscard]] static auto generate() -> session_id;

    /**
     * @brief Convert to UUID text (xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx)
     */
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] static auto from_string(std::string_view str)
        -> std::optional<session_id>;

    [[nodiscard]] constexpr auto is_null() const noexcept -> bool {
        for (const auto& b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr auto operator==(const session_id& other) const
        noexcept -> bool = default;
};

}  // namespace matchops::sync

#endif  // MATCHOPS_SYNC_CORE_SESSION_ID_H
