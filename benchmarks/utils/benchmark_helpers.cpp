/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <iomanip>
#include <iterator>
#include <sstream>

namespace matchops::sync::benchmark {

// test_data_generator implementation

auto test_data_generator::generate_payload(std::size_t size, uint32_t seed) -> std::string {
    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);

    static const char* const names[] = {
        "goal", "assist", "substitution", "yellow_card", "corner", "free_kick",
        "penalty", "offside", "save", "shot"
    };
    std::uniform_int_distribution<std::size_t> name_dis(0, std::size(names) - 1);
    std::uniform_int_distribution<int> minute_dis(1, 90);

    std::string payload = "{\"events\":[";
    bool first = true;
    while (payload.size() + 2 < size) {
        if (!first) {
            payload += ',';
        }
        first = false;
        payload += "{\"type\":\"";
        payload += names[name_dis(gen)];
        payload += "\",\"minute\":" + std::to_string(minute_dis(gen)) + "}";
    }
    payload += "]}";
    return payload;
}

void test_data_generator::populate(memory_data_accessor& store,
                                   std::size_t count,
                                   std::size_t payload_size,
                                   uint32_t seed) {
    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    auto now = std::chrono::system_clock::now();

    for (std::size_t i = 1; i <= count; ++i) {
        std::ostringstream id;
        id << "item-" << std::setw(5) << std::setfill('0') << i;

        item_record record;
        record.id = id.str();
        record.payload = generate_payload(payload_size, gen());
        record.updated_at = now;
        store.put(std::move(record));
    }
}

auto test_data_generator::make_checkpoint(uint64_t items_processed,
                                          uint64_t total_items,
                                          std::size_t errors) -> migration_checkpoint {
    auto now = std::chrono::system_clock::now();

    migration_checkpoint cp;
    cp.session = session_id::generate();
    cp.phase = migration_phase::transferring;
    cp.items_processed = items_processed;
    cp.total_items = total_items;
    cp.started_at = now - std::chrono::minutes(3);
    cp.last_updated_at = now;
    cp.phase_timestamps = {{migration_phase::scanning, cp.started_at},
                           {migration_phase::transferring, cp.started_at}};
    cp.last_item_id = "item-00042";
    cp.source_name = "local";
    cp.destination_name = "cloud";
    for (std::size_t i = 0; i < errors; ++i) {
        cp.record_error("item-" + std::to_string(i) + ": read failed", errors);
    }
    return cp;
}

// temp_directory implementation

temp_directory::temp_directory(const std::string& prefix) {
    path_ = std::filesystem::temp_directory_path() /
            (prefix + "_" + std::to_string(std::random_device{}()));

    std::error_code ec;
    std::filesystem::create_directories(path_, ec);
}

temp_directory::~temp_directory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

// Utility functions

auto format_bytes(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= sizes::MB) {
        oss << static_cast<double>(bytes) / sizes::MB << " MB";
    } else if (bytes >= sizes::KB) {
        oss << static_cast<double>(bytes) / sizes::KB << " KB";
    } else {
        oss << bytes << " B";
    }

    return oss.str();
}

auto benchmark_config(std::size_t batch_size) -> migration_config {
    migration_config config;
    config.batch_size = batch_size;
    config.verify_sample_size = 10;
    config.retry.initial_delay = std::chrono::milliseconds(0);
    config.retry.max_delay = std::chrono::milliseconds(0);
    return config;
}

}  // namespace matchops::sync::benchmark
