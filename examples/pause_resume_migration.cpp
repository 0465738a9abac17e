/**
 * @file pause_resume_migration.cpp
 * @brief Background migration with pause, resume and cancel
 *
 * This example demonstrates:
 * - Running the engine on its worker pool with start()
 * - Pausing and resuming through migration_control
 * - Discarding a checkpoint left by an earlier run of this program
 * - Cancelling without touching the active source
 */

#include <matchops/sync/sync.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

using namespace matchops::sync;

namespace {

std::atomic<int> interrupt_count{0};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        interrupt_count.fetch_add(1);
    }
}

void print_usage(const char* program) {
    std::cout << "Pause/Resume Migration Example - matchops_sync" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --items <n>              Items in the local store (default: 2000)" << std::endl;
    std::cout << "  --auto-pause <percent>   Pause automatically at this percentage" << std::endl;
    std::cout << "  --pause-duration <ms>    Time to stay paused (default: 2000ms)" << std::endl;
    std::cout << "  --state-dir <path>       Directory for checkpoint and pointer" << std::endl;
    std::cout << "  --help                   Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Interactive controls:" << std::endl;
    std::cout << "  Press Ctrl+C once to pause, again to resume, a third time to cancel" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::size_t item_count = 2000;
    std::optional<double> auto_pause_percent;
    std::chrono::milliseconds pause_duration{2000};
    std::filesystem::path state_dir =
        std::filesystem::temp_directory_path() / "matchops_sync_pause_example";

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
        } else if (arg == "--auto-pause") {
            if (++i >= argc) {
                std::cerr << "Error: --auto-pause requires a percentage argument" << std::endl;
                return 1;
            }
            auto_pause_percent = std::stod(argv[i]);
        } else if (arg == "--pause-duration") {
            if (++i >= argc) {
                std::cerr << "Error: --pause-duration requires a milliseconds argument" << std::endl;
                return 1;
            }
            pause_duration = std::chrono::milliseconds{std::stoi(argv[i])};
        } else if (arg == "--state-dir") {
            if (++i >= argc) {
                std::cerr << "Error: --state-dir requires an argument" << std::endl;
                return 1;
            }
            state_dir = argv[i];
        }
    }

    get_logger().set_level(log_level::info);

    file_key_value_store state(state_dir);
    checkpoint_store checkpoints(state);
    active_source_pointer pointer(state, "local");
    resource_lock_manager locks;

    memory_data_accessor local("local");
    memory_data_accessor cloud("cloud");
    local.populate(item_count, "match");
    local.set_latency(std::chrono::microseconds(500));

    migration_config config;
    config.batch_size = 25;

    migration_engine engine(locks, checkpoints, local, cloud, pointer, config);

    std::atomic<double> current_percentage{0.0};
    control_callbacks callbacks;
    callbacks.on_pause = [] { std::cout << std::endl << "[Paused]" << std::endl; };
    callbacks.on_resume = [] { std::cout << "[Resumed]" << std::endl; };
    callbacks.on_cancel = [](const cancellation_info& info) {
        std::cout << std::endl << "[Cancelled] reason=" << to_string(info.reason)
                  << " items=" << info.items_processed
                  << " cleanup=" << (info.cleanup_completed ? "done" : "pending")
                  << std::endl;
    };
    callbacks.on_progress = [&](const migration_progress& progress) {
        current_percentage = progress.percentage.value_or(0.0);
        std::cout << "\r" << std::left << std::setw(13) << to_string(progress.phase)
                  << std::fixed << std::setprecision(1) << current_percentage.load() << "%"
                  << " | ETA " << progress.estimated_time_remaining_text << "     "
                  << std::flush;
    };

    migration_control control(engine, checkpoints, callbacks);

    std::signal(SIGINT, signal_handler);

    // The stores are in memory, so a checkpoint from an earlier run cannot be
    // continued here.
    if (control.state().resume_data) {
        std::cout << "Discarding checkpoint from an earlier run" << std::endl;
        if (auto cancelled = control.cancel_migration(); !cancelled) {
            std::cerr << "Cancel failed: " << cancelled.error().message << std::endl;
            return 1;
        }
    }

    if (auto started = engine.start(); !started) {
        std::cerr << "Start failed: " << started.error().message << std::endl;
        return 1;
    }

    bool auto_paused = false;
    int handled_interrupts = 0;

    while (true) {
        auto phase = engine.phase();
        if (!engine.is_running() && phase != migration_phase::paused) {
            break;
        }

        if (auto_pause_percent && !auto_paused && current_percentage >= *auto_pause_percent) {
            auto_paused = true;
            if (auto paused = control.pause_migration(); !paused) {
                std::cerr << "Pause failed: " << paused.error().message << std::endl;
            } else {
                static_cast<void>(engine.wait());
                std::this_thread::sleep_for(pause_duration);
                if (auto resumed = control.resume_migration(); !resumed) {
                    std::cerr << "Resume failed: " << resumed.error().message << std::endl;
                }
            }
        }

        int interrupts = interrupt_count.load();
        if (interrupts > handled_interrupts) {
            handled_interrupts = interrupts;
            result<void> command = {};
            if (interrupts == 1) {
                command = control.pause_migration();
            } else if (interrupts == 2) {
                command = control.resume_migration();
            } else {
                command = control.cancel_migration();
            }
            if (!command) {
                std::cerr << std::endl << "Command failed: " << command.error().message
                          << std::endl;
            }
        }

        std::this_thread::sleep_for(std::chrono::milliseconds{50});
    }

    auto outcome = engine.wait();
    std::cout << std::endl;
    if (!outcome) {
        std::cerr << "No migration ran: " << outcome.error().message << std::endl;
        return 1;
    }

    std::cout << "Result: " << to_string(outcome.value().phase)
              << " (" << outcome.value().items_processed << " items)" << std::endl;
    std::cout << "Active source: " << pointer.get() << std::endl;
    return outcome.value().succeeded() ? 0 : 1;
}
