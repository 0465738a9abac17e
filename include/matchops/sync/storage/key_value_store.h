/**
 * @file key_value_store.h
 * @brief Durable key-value storage used for checkpoints and the source pointer
 */

#ifndef MATCHOPS_SYNC_STORAGE_KEY_VALUE_STORE_H
#define MATCHOPS_SYNC_STORAGE_KEY_VALUE_STORE_H

#include <matchops/sync/core/types.h>

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace matchops::sync {

/**
 * @brief Minimal string key-value storage
 *
 * Implementations must provide read-your-writes consistency within one
 * process.
 */
class key_value_store {
public:
    virtual ~key_value_store() = default;

    /**
     * @brief Read a value
     * @return The value, std::nullopt if the key is absent, or storage_read_error
     */
    [[nodiscard]] virtual auto get(const std::string& key)
        -> result<std::optional<std::string>> = 0;

    [[nodiscard]] virtual auto set(const std::string& key, const std::string& value)
        -> result<void> = 0;

    /**
     * @brief Remove a key; removing an absent key succeeds
     */
    [[nodiscard]] virtual auto remove(const std::string& key) -> result<void> = 0;
};

/**
 * @brief In-process key_value_store
 */
class memory_key_value_store : public key_value_store {
public:
    [[nodiscard]] auto get(const std::string& key)
        -> result<std::optional<std::string>> override;
    [[nodiscard]] auto set(const std::string& key, const std::string& value)
        -> result<void> override;
    [[nodiscard]] auto remove(const std::string& key) -> result<void> override;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

/**
 * @brief key_value_store keeping one file per key in a directory
 *
 * Values are written to a temporary file which then replaces the previous
 * file, so a crash leaves either the old or the new value on disk.
 */
class file_key_value_store : public key_value_store {
public:
    explicit file_key_value_store(std::filesystem::path directory);

    [[nodiscard]] auto get(const std::string& key)
        -> result<std::optional<std::string>> override;
    [[nodiscard]] auto set(const std::string& key, const std::string& value)
        -> result<void> override;
    [[nodiscard]] auto remove(const std::string& key) -> result<void> override;

    [[nodiscard]] auto directory() const -> const std::filesystem::path& {
        return directory_;
    }

    /**
     * @brief File backing a key
     */
    [[nodiscard]] auto path_for(const std::string& key) const -> std::filesystem::path;

private:
    std::filesystem::path directory_;
    std::mutex mutex_;
};

}  // namespace matchops::sync

#endif  // MATCHOPS_SYNC_STORAGE_KEY_VALUE_STORE_H
