/**
 * @file key_value_store.cpp
 * @brief In-memory and file-backed key-value stores
 */

#include <matchops/sync/storage/key_value_store.h>
#include <matchops/sync/core/logging.h>

#include <cctype>
#include <fstream>
#include <sstream>

namespace matchops::sync {

// ============================================================================
// memory_key_value_store
// ============================================================================

auto memory_key_value_store::get(const std::string& key)
    -> result<std::optional<std::string>> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{it->second};
}

auto memory_key_value_store::set(const std::string& key, const std::string& value)
    -> result<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
    return {};
}

auto memory_key_value_store::remove(const std::string& key) -> result<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.erase(key);
    return {};
}

auto memory_key_value_store::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
}

// ============================================================================
// file_key_value_store
// ============================================================================

file_key_value_store::file_key_value_store(std::filesystem::path directory)
    : directory_(std::move(directory)) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        MS_LOG_ERROR(log_category::storage,
            "Failed to create store directory: " + directory_.string() +
            " (" + ec.message() + ")");
    }
}

auto file_key_value_store::path_for(const std::string& key) const
    -> std::filesystem::path {
    std::string name;
    name.reserve(key.size());
    for (char c : key) {
        auto uc = static_cast<unsigned char>(c);
        name += (std::isalnum(uc) || c == '.' || c == '-' || c == '_') ? c : '_';
    }
    return directory_ / (name + ".kv");
}

auto file_key_value_store::get(const std::string& key)
    -> result<std::optional<std::string>> {
    std::lock_guard<std::mutex> lock(mutex_);

    auto path = path_for(key);
    if (!std::filesystem::exists(path)) {
        return std::optional<std::string>{};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        MS_LOG_ERROR(log_category::storage, "Failed to open value file: " + path.string());
        return unexpected(error(error_code::storage_read_error,
            "failed to open " + path.string()));
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return std::optional<std::string>{oss.str()};
}

auto file_key_value_store::set(const std::string& key, const std::string& value)
    -> result<void> {
    std::lock_guard<std::mutex> lock(mutex_);

    auto path = path_for(key);
    auto temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            MS_LOG_ERROR(log_category::storage,
                "Failed to open value file for writing: " + temp_path.string());
            return unexpected(error(error_code::storage_write_error,
                "failed to open " + temp_path.string() + " for writing"));
        }
        file << value;
        file.flush();
        if (!file) {
            return unexpected(error(error_code::storage_write_error,
                "failed to write " + temp_path.string()));
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        MS_LOG_ERROR(log_category::storage,
            "Failed to replace value file: " + path.string() + " (" + ec.message() + ")");
        std::filesystem::remove(temp_path, ec);
        return unexpected(error(error_code::storage_write_error,
            "failed to replace " + path.string()));
    }

    return {};
}

auto file_key_value_store::remove(const std::string& key) -> result<void> {
    std::lock_guard<std::mutex> lock(mutex_);

    auto path = path_for(key);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return unexpected(error(error_code::storage_write_error,
            "failed to remove " + path.string() + ": " + ec.message()));
    }
    return {};
}

}  // namespace matchops::sync
