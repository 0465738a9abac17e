/**
 * @file basic_migration.cpp
 * @brief Migrate every item from the local store to the cloud store
 *
 * This example demonstrates:
 * - Wiring a migration_engine to two data stores and a durable checkpoint
 * - Pre-flight estimate and preview through migration_control
 * - Progress reporting with percentage, speed and ETA
 * - Switching the active data source on completion
 */

#include <matchops/sync/sync.h>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

using namespace matchops::sync;

namespace {

void print_usage(const char* program) {
    std::cout << "Basic Migration Example - matchops_sync" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --items <n>          Items in the local store (default: 500)" << std::endl;
    std::cout << "  --batch <n>          Items per batch (default: 50)" << std::endl;
    std::cout << "  --state-dir <path>   Directory for checkpoint and pointer" << std::endl;
    std::cout << "  --json-logs          Emit log records as JSON" << std::endl;
    std::cout << "  --help               Show this help message" << std::endl;
}

void print_progress(const migration_progress& progress) {
    constexpr int bar_width = 30;
    double pct = progress.percentage.value_or(0.0);
    int filled = static_cast<int>(pct / 100.0 * bar_width);

    std::cout << "\r" << std::left << std::setw(13) << to_string(progress.phase) << " [";
    for (int i = 0; i < bar_width; ++i) {
        if (progress.is_indeterminate()) std::cout << "?";
        else if (i < filled) std::cout << "=";
        else if (i == filled) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] ";
    if (progress.percentage) {
        std::cout << std::fixed << std::setprecision(1) << *progress.percentage << "%";
    } else {
        std::cout << progress.items_processed << " items";
    }
    std::cout << " | " << std::setprecision(0) << progress.transfer_speed << " items/s"
              << " | ETA " << progress.estimated_time_remaining_text << "     " << std::flush;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::size_t item_count = 500;
    std::size_t batch_size = 50;
    std::filesystem::path state_dir =
        std::filesystem::temp_directory_path() / "matchops_sync_basic_example";
    bool json_logs = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--items") {
            if (++i >= argc) {
                std::cerr << "Error: --items requires an argument" << std::endl;
                return 1;
            }
            item_count = static_cast<std::size_t>(std::stoul(argv[i]));
        } else if (arg == "--batch") {
            if (++i >= argc) {
                std::cerr << "Error: --batch requires an argument" << std::endl;
                return 1;
            }
            batch_size = static_cast<std::size_t>(std::stoul(argv[i]));
        } else if (arg == "--state-dir") {
            if (++i >= argc) {
                std::cerr << "Error: --state-dir requires an argument" << std::endl;
                return 1;
            }
            state_dir = argv[i];
        } else if (arg == "--json-logs") {
            json_logs = true;
        }
    }

    auto& logger = get_logger();
    logger.set_level(log_level::warn);
    if (json_logs) {
        logger.set_output_format(log_output_format::json);
    }

    std::cout << "========================================" << std::endl;
    std::cout << "    Basic Migration Example" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "  Version: " << version::to_string() << std::endl;
    std::cout << "  Items: " << item_count << std::endl;
    std::cout << "  Batch size: " << batch_size << std::endl;
    std::cout << "  State directory: " << state_dir << std::endl;
    std::cout << std::endl;

    file_key_value_store state(state_dir);
    checkpoint_store checkpoints(state);
    active_source_pointer pointer(state, "local");
    resource_lock_manager locks;

    memory_data_accessor local("local");
    memory_data_accessor cloud("cloud");
    local.populate(item_count, "match");

    migration_config config;
    config.batch_size = batch_size;

    migration_engine engine(locks, checkpoints, local, cloud, pointer, config);
    migration_control control(engine, checkpoints, {
        .on_progress = print_progress,
    });

    std::cout << "[1/3] Estimating..." << std::endl;
    auto estimate = control.estimate_migration(local);
    if (!estimate) {
        std::cerr << "Estimate failed: " << estimate.error().message << std::endl;
        return 1;
    }
    std::cout << "  " << estimate.value().item_count << " items, ~"
              << estimate.value().estimated_total_bytes << " bytes, confidence "
              << to_string(estimate.value().confidence) << std::endl;

    auto preview = control.preview_migration(local, 5);
    if (!preview) {
        std::cerr << "Preview failed: " << preview.error().message << std::endl;
        return 1;
    }
    for (const auto& warning : preview.value().warnings) {
        std::cout << "  Warning: " << warning << std::endl;
    }
    if (!preview.value().can_proceed) {
        std::cerr << "Migration cannot proceed" << std::endl;
        return 1;
    }

    std::cout << "[2/3] Migrating " << pointer.get() << " -> " << cloud.name() << "..."
              << std::endl;
    auto outcome = engine.run();
    std::cout << std::endl;

    if (!outcome) {
        std::cerr << "Migration not started: " << outcome.error().message << std::endl;
        return 1;
    }

    std::cout << "[3/3] Result: " << to_string(outcome.value().phase) << std::endl;
    std::cout << "  Items processed: " << outcome.value().items_processed << std::endl;
    std::cout << "  Item errors: " << outcome.value().error_count << std::endl;
    if (outcome.value().cause) {
        std::cout << "  Cause: " << outcome.value().cause->message << std::endl;
    }
    std::cout << "  Active source: " << pointer.get() << std::endl;

    return outcome.value().succeeded() ? 0 : 1;
}
