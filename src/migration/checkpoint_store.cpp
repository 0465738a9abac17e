/**
 * @file checkpoint_store.cpp
 * @brief Implementation of checkpoint_store
 */

#include <matchops/sync/migration/checkpoint_store.h>
#include <matchops/sync/core/checksum.h>
#include <matchops/sync/core/logging.h>

#include <charconv>
#include <iomanip>
#include <optional>
#include <sstream>
#include <vector>

namespace matchops::sync {

// ============================================================================
// JSON serialization helpers (simple implementation without external library)
// ============================================================================

namespace {

constexpr const char* checksum_field = ",\n  \"checksum\": \"";

auto escape_json_string(const std::string& s) -> std::string {
    std::ostringstream o;
    for (auto c : s) {
        switch (c) {
            case '"': o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\b': o << "\\b"; break;
            case '\f': o << "\\f"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    o << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                      << static_cast<int>(c) << std::dec;
                } else {
                    o << c;
                }
        }
    }
    return o.str();
}

void append_utf8(std::string& out, unsigned int code) {
    if (code < 0x80) {
        out += static_cast<char>(code);
    } else if (code < 0x800) {
        out += static_cast<char>(0xC0 | (code >> 6));
        out += static_cast<char>(0x80 | (code & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (code >> 12));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
    }
}

/**
 * @return std::nullopt for a malformed or truncated escape sequence
 */
auto unescape_json_string(const std::string& s) -> std::optional<std::string> {
    std::string out;
    out.reserve(s.size());

    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\') {
            out += s[i];
            continue;
        }
        if (i + 1 >= s.size()) {
            return std::nullopt;
        }
        switch (s[i + 1]) {
            case '"': out += '"'; ++i; break;
            case '\\': out += '\\'; ++i; break;
            case '/': out += '/'; ++i; break;
            case 'b': out += '\b'; ++i; break;
            case 'f': out += '\f'; ++i; break;
            case 'n': out += '\n'; ++i; break;
            case 'r': out += '\r'; ++i; break;
            case 't': out += '\t'; ++i; break;
            case 'u': {
                if (i + 6 > s.size()) {
                    return std::nullopt;
                }
                const char* first = s.data() + i + 2;
                const char* last = first + 4;
                unsigned int code = 0;
                auto [end, ec] = std::from_chars(first, last, code, 16);
                // Surrogate pairs are not produced by the writer.
                if (ec != std::errc{} || end != last || (code >= 0xD800 && code <= 0xDFFF)) {
                    return std::nullopt;
                }
                append_utf8(out, code);
                i += 5;
                break;
            }
            default:
                return std::nullopt;
        }
    }
    return out;
}

auto to_millis(std::chrono::system_clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

auto from_millis(int64_t ms) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point{std::chrono::milliseconds{ms}};
}

/**
 * @brief Index just past the end of the string literal starting at @p open
 */
auto skip_string(const std::string& json, std::size_t open) -> std::size_t {
    auto pos = open + 1;
    while (pos < json.size()) {
        if (json[pos] == '\\') {
            pos += 2;
            continue;
        }
        if (json[pos] == '"') {
            return pos + 1;
        }
        ++pos;
    }
    return std::string::npos;
}

auto find_value_start(const std::string& json, const std::string& key)
    -> std::size_t {
    auto key_pos = json.find("\"" + key + "\":");
    if (key_pos == std::string::npos) {
        return std::string::npos;
    }

    auto value_start = key_pos + key.size() + 3;
    while (value_start < json.size() &&
           (json[value_start] == ' ' || json[value_start] == '\n' ||
            json[value_start] == '\t' || json[value_start] == '\r')) {
        ++value_start;
    }
    return value_start < json.size() ? value_start : std::string::npos;
}

/**
 * @brief Raw scalar value for @p key; strings are returned still escaped
 */
auto extract_json_value(const std::string& json, const std::string& key)
    -> std::optional<std::string> {
    auto value_start = find_value_start(json, key);
    if (value_start == std::string::npos) {
        return std::nullopt;
    }

    if (json[value_start] == '"') {
        auto end = skip_string(json, value_start);
        if (end == std::string::npos) {
            return std::nullopt;
        }
        return json.substr(value_start + 1, end - value_start - 2);
    }

    auto value_end = value_start;
    while (value_end < json.size() && json[value_end] != ',' &&
           json[value_end] != '\n' && json[value_end] != '}' &&
           json[value_end] != ']') {
        ++value_end;
    }

    auto value = json.substr(value_start, value_end - value_start);
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.pop_back();
    }
    return value;
}

/**
 * @brief Bracketed array text for @p key, including the brackets
 */
auto extract_json_array(const std::string& json, const std::string& key)
    -> std::optional<std::string> {
    auto start = find_value_start(json, key);
    if (start == std::string::npos || json[start] != '[') {
        return std::nullopt;
    }

    auto pos = start + 1;
    while (pos < json.size()) {
        if (json[pos] == '"') {
            pos = skip_string(json, pos);
            if (pos == std::string::npos) {
                return std::nullopt;
            }
            continue;
        }
        if (json[pos] == ']') {
            return json.substr(start, pos - start + 1);
        }
        ++pos;
    }
    return std::nullopt;
}

auto parse_string_array(const std::string& array) -> std::optional<std::vector<std::string>> {
    std::vector<std::string> values;
    std::size_t pos = 0;
    while ((pos = array.find('"', pos)) != std::string::npos) {
        auto end = skip_string(array, pos);
        if (end == std::string::npos) {
            break;
        }
        auto value = unescape_json_string(array.substr(pos + 1, end - pos - 2));
        if (!value) {
            return std::nullopt;
        }
        values.push_back(std::move(*value));
        pos = end;
    }
    return values;
}

/**
 * @brief Split an array of flat objects into the text of each object
 */
auto split_object_array(const std::string& array) -> std::vector<std::string> {
    std::vector<std::string> objects;
    std::size_t pos = 0;
    while ((pos = array.find('{', pos)) != std::string::npos) {
        auto end = array.find('}', pos);
        if (end == std::string::npos) {
            break;
        }
        objects.push_back(array.substr(pos, end - pos + 1));
        pos = end + 1;
    }
    return objects;
}

auto serialize_body(const migration_checkpoint& cp) -> std::string {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"version\": " << checkpoint_store::format_version << ",\n";
    oss << "  \"session_id\": \"" << cp.session.to_string() << "\",\n";
    oss << "  \"direction\": \"" << to_string(cp.direction) << "\",\n";
    oss << "  \"phase\": \"" << to_string(cp.phase) << "\",\n";
    oss << "  \"items_processed\": " << cp.items_processed << ",\n";
    if (cp.total_items) {
        oss << "  \"total_items\": " << *cp.total_items << ",\n";
    } else {
        oss << "  \"total_items\": null,\n";
    }
    oss << "  \"error_count\": " << cp.error_count << ",\n";
    oss << "  \"started_at\": " << to_millis(cp.started_at) << ",\n";
    oss << "  \"last_updated_at\": " << to_millis(cp.last_updated_at) << ",\n";
    if (cp.paused_at) {
        oss << "  \"paused_at\": " << to_millis(*cp.paused_at) << ",\n";
    } else {
        oss << "  \"paused_at\": null,\n";
    }
    oss << "  \"last_item_id\": \"" << escape_json_string(cp.last_item_id) << "\",\n";
    if (cp.failure) {
        oss << "  \"failure\": \"" << escape_json_string(*cp.failure) << "\",\n";
    } else {
        oss << "  \"failure\": null,\n";
    }
    oss << "  \"source_name\": \"" << escape_json_string(cp.source_name) << "\",\n";
    oss << "  \"destination_name\": \"" << escape_json_string(cp.destination_name) << "\",\n";

    oss << "  \"errors\": [";
    for (std::size_t i = 0; i < cp.errors.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << "\"" << escape_json_string(cp.errors[i]) << "\"";
    }
    oss << "],\n";

    oss << "  \"phase_timestamps\": [";
    for (std::size_t i = 0; i < cp.phase_timestamps.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << "{\"entered\": \"" << to_string(cp.phase_timestamps[i].phase)
            << "\", \"at\": " << to_millis(cp.phase_timestamps[i].at) << "}";
    }
    oss << "]\n";
    oss << "}";
    return oss.str();
}

auto parse_optional_uint(const std::optional<std::string>& raw)
    -> std::optional<uint64_t> {
    if (!raw || *raw == "null") {
        return std::nullopt;
    }
    return std::stoull(*raw);
}

}  // namespace

// ============================================================================
// checkpoint_store
// ============================================================================

checkpoint_store::checkpoint_store(key_value_store& store, checkpoint_store_config config)
    : store_(store)
    , config_(std::move(config)) {
}

auto checkpoint_store::serialize(const migration_checkpoint& checkpoint) -> std::string {
    auto body = serialize_body(checkpoint);
    auto digest = checksum::sha256(body);

    // Insert the checksum as the last field: "...\n}" -> "...,\n  "checksum": "..."\n}"
    std::string document = body.substr(0, body.size() - 2);
    document += checksum_field;
    document += digest;
    document += "\"\n}";
    return document;
}

auto checkpoint_store::deserialize(const std::string& json) -> result<migration_checkpoint> {
    auto field_pos = json.rfind(checksum_field);
    if (field_pos == std::string::npos) {
        return unexpected(error(error_code::checkpoint_corrupted, "missing checksum"));
    }

    auto stored_digest = extract_json_value(json.substr(field_pos + 1), "checksum");
    auto body = json.substr(0, field_pos) + "\n}";
    if (!stored_digest || !checksum::verify_sha256(body, *stored_digest)) {
        return unexpected(error(error_code::checkpoint_corrupted, "checksum mismatch"));
    }

    auto version = extract_json_value(body, "version");
    if (!version || *version != std::to_string(format_version)) {
        return unexpected(error(error_code::checkpoint_corrupted,
            "unsupported checkpoint version: " + version.value_or("none")));
    }

    migration_checkpoint cp;

    auto session = extract_json_value(body, "session_id");
    auto parsed_session = session ? session_id::from_string(*session) : std::nullopt;
    if (!parsed_session) {
        return unexpected(error(error_code::checkpoint_corrupted, "invalid session id"));
    }
    cp.session = *parsed_session;

    auto phase_name = extract_json_value(body, "phase");
    auto phase = phase_name ? parse_phase(*phase_name) : std::nullopt;
    if (!phase || !is_resumable(*phase)) {
        return unexpected(error(error_code::checkpoint_unsupported_phase,
            "cannot resume from phase '" + phase_name.value_or("") + "'"));
    }
    cp.phase = *phase;

    auto direction_name = extract_json_value(body, "direction");
    auto direction = direction_name ? parse_direction(*direction_name) : std::nullopt;
    if (!direction) {
        return unexpected(error(error_code::checkpoint_corrupted,
            "unknown direction '" + direction_name.value_or("") + "'"));
    }
    cp.direction = *direction;

    try {
        auto processed = extract_json_value(body, "items_processed");
        auto errors = extract_json_value(body, "error_count");
        auto started = extract_json_value(body, "started_at");
        auto updated = extract_json_value(body, "last_updated_at");
        if (!processed || !errors || !started || !updated) {
            return unexpected(error(error_code::checkpoint_corrupted,
                "missing numeric field"));
        }

        cp.items_processed = std::stoull(*processed);
        cp.error_count = std::stoull(*errors);
        cp.total_items = parse_optional_uint(extract_json_value(body, "total_items"));
        cp.started_at = from_millis(std::stoll(*started));
        cp.last_updated_at = from_millis(std::stoll(*updated));

        auto paused = extract_json_value(body, "paused_at");
        if (paused && *paused != "null") {
            cp.paused_at = from_millis(std::stoll(*paused));
        }

        if (auto timestamps = extract_json_array(body, "phase_timestamps")) {
            for (const auto& object : split_object_array(*timestamps)) {
                auto entered = extract_json_value(object, "entered");
                auto at = extract_json_value(object, "at");
                auto entered_phase = entered ? parse_phase(*entered) : std::nullopt;
                if (!entered_phase || !at) {
                    continue;
                }
                cp.phase_timestamps.push_back({*entered_phase, from_millis(std::stoll(*at))});
            }
        }
    } catch (const std::exception& e) {
        return unexpected(error(error_code::checkpoint_corrupted,
            std::string("invalid numeric field: ") + e.what()));
    }

    if (cp.total_items && cp.items_processed > *cp.total_items) {
        return unexpected(error(error_code::checkpoint_corrupted,
            "items_processed exceeds total_items"));
    }

    auto text_field = [&body](const char* key, std::string& target) -> result<void> {
        auto value = unescape_json_string(extract_json_value(body, key).value_or(""));
        if (!value) {
            return unexpected(error(error_code::checkpoint_corrupted,
                std::string("malformed escape in ") + key));
        }
        target = std::move(*value);
        return {};
    };

    if (auto parsed = text_field("last_item_id", cp.last_item_id); !parsed) {
        return unexpected(parsed.error());
    }
    if (auto parsed = text_field("source_name", cp.source_name); !parsed) {
        return unexpected(parsed.error());
    }
    if (auto parsed = text_field("destination_name", cp.destination_name); !parsed) {
        return unexpected(parsed.error());
    }

    auto failure_start = find_value_start(body, "failure");
    if (failure_start != std::string::npos && body[failure_start] == '"') {
        std::string failure;
        if (auto parsed = text_field("failure", failure); !parsed) {
            return unexpected(parsed.error());
        }
        cp.failure = std::move(failure);
    }

    if (auto errors = extract_json_array(body, "errors")) {
        auto parsed = parse_string_array(*errors);
        if (!parsed) {
            return unexpected(error(error_code::checkpoint_corrupted,
                "malformed escape in errors"));
        }
        cp.errors = std::move(*parsed);
    }

    return cp;
}

auto checkpoint_store::save(const migration_checkpoint& checkpoint) -> result<void> {
    auto json = serialize(checkpoint);
    result<void> stored;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stored = store_.set(config_.storage_key, json);
    }
    if (!stored) {
        MS_LOG_ERROR(log_category::checkpoint,
            "Failed to persist checkpoint: " + stored.error().message);
        return unexpected(error(error_code::checkpoint_write_error,
            "failed to persist checkpoint: " + stored.error().message));
    }

    MS_LOG_TRACE(log_category::checkpoint,
        "Checkpoint saved: " + checkpoint.session.to_string() + " (" +
        std::to_string(checkpoint.items_processed) + " items, phase " +
        to_string(checkpoint.phase) + ")");
    return {};
}

auto checkpoint_store::load() -> result<std::optional<migration_checkpoint>> {
    result<std::optional<std::string>> raw = std::optional<std::string>{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        raw = store_.get(config_.storage_key);
    }
    if (!raw) {
        return unexpected(error(error_code::checkpoint_read_error,
            "failed to read checkpoint: " + raw.error().message));
    }
    if (!raw.value()) {
        return std::optional<migration_checkpoint>{};
    }

    auto parsed = deserialize(*raw.value());
    if (!parsed) {
        MS_LOG_WARN(log_category::checkpoint,
            "Stored checkpoint is not resumable: " + parsed.error().message);
        return unexpected(parsed.error());
    }

    if (config_.state_ttl.count() > 0) {
        auto age = std::chrono::system_clock::now() - parsed.value().last_updated_at;
        if (age > config_.state_ttl) {
            MS_LOG_INFO(log_category::checkpoint,
                "Stored checkpoint expired: " + parsed.value().session.to_string());
            return unexpected(error(error_code::checkpoint_expired,
                "checkpoint older than " + std::to_string(config_.state_ttl.count()) + "s"));
        }
    }

    MS_LOG_DEBUG(log_category::checkpoint,
        "Checkpoint recovered: " + parsed.value().session.to_string() + " (" +
        std::to_string(parsed.value().items_processed) + " items processed)");
    return std::optional<migration_checkpoint>{std::move(parsed).value()};
}

auto checkpoint_store::clear() -> result<void> {
    result<void> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = store_.remove(config_.storage_key);
    }
    if (!removed) {
        return unexpected(error(error_code::checkpoint_write_error,
            "failed to clear checkpoint: " + removed.error().message));
    }
    MS_LOG_TRACE(log_category::checkpoint, "Checkpoint cleared");
    return {};
}

auto checkpoint_store::has_checkpoint() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    auto raw = store_.get(config_.storage_key);
    return raw && raw.value().has_value();
}

}  // namespace matchops::sync
