/**
 * @file migration_engine.h
 * @brief Resumable bulk transfer between two data stores
 * @version 0.1.0
 *
 * This file defines the migration_engine class which moves every item of a
 * source data_accessor into a destination, then verifies the copy and flips
 * the active_source_pointer. Progress is checkpointed after every batch so a
 * paused, failed or interrupted run resumes where it stopped.
 */

#ifndef MATCHOPS_SYNC_MIGRATION_MIGRATION_ENGINE_H
#define MATCHOPS_SYNC_MIGRATION_MIGRATION_ENGINE_H

#include <matchops/sync/adapters/thread_pool_adapter.h>
#include <matchops/sync/core/types.h>
#include <matchops/sync/lock/resource_lock_manager.h>
#include <matchops/sync/migration/checkpoint_store.h>
#include <matchops/sync/migration/migration_config.h>
#include <matchops/sync/migration/migration_types.h>
#include <matchops/sync/storage/active_source_pointer.h>
#include <matchops/sync/storage/data_accessor.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace matchops::sync {

/**
 * @brief Final state of one run of the engine
 */
struct migration_outcome {
    migration_phase phase{migration_phase::idle};   ///< paused, completed, cancelled or failed
    session_id session;
    uint64_t items_processed{0};
    std::optional<uint64_t> total_items;
    uint64_t error_count{0};
    std::vector<std::string> errors;
    std::optional<error> cause;                     ///< Set when phase is failed

    [[nodiscard]] auto succeeded() const noexcept -> bool {
        return phase == migration_phase::completed;
    }
};

using progress_callback = std::function<void(const migration_progress&)>;
using phase_listener = std::function<void(migration_phase from, migration_phase to)>;
using subscription_id = uint64_t;

/**
 * @brief State machine driving scan -> transfer -> verify -> switch
 *
 * One engine drives at most one run at a time. A run executes either on the
 * calling thread (run(), run_from_checkpoint()) or on a single worker of
 * the task pool (start(), resume()).
 *
 * Cooperative control: request_pause() and request_cancel() only take effect
 * between batches. The switch phase is never interrupted; a cancel arriving
 * during it is dropped once the run completes.
 *
 * Guarantees:
 * - the checkpoint is saved before the corresponding progress is published
 * - the destination lock is held for one batch at a time and for the
 *   pointer update, never across a batch boundary
 * - only a completed run changes the active_source_pointer
 *
 * @code
 * migration_engine engine(locks, checkpoints, local, cloud, pointer);
 * engine.subscribe([](const migration_progress& p) {
 *     std::cout << p.estimated_time_remaining_text << "\n";
 * });
 *
 * auto outcome = engine.run();
 * if (outcome && outcome.value().succeeded()) {
 *     // pointer.get() == cloud.name()
 * }
 * @endcode
 */
class migration_engine {
public:
    /**
     * @param locks Lock manager shared with ordinary writers
     * @param checkpoints Durable checkpoint storage
     * @param source Store items are read from
     * @param destination Store items are upserted into
     * @param pointer Pointer flipped to destination.name() on completion
     * @param config Engine configuration
     * @param pool Pool for start()/resume(); created on first use when empty
     */
    migration_engine(resource_lock_manager& locks,
                     checkpoint_store& checkpoints,
                     data_accessor& source,
                     data_accessor& destination,
                     active_source_pointer& pointer,
                     migration_config config = {},
                     std::shared_ptr<adapters::task_pool_interface> pool = {});

    /**
     * @brief Pauses a running worker and waits for it to stop
     */
    ~migration_engine();

    migration_engine(const migration_engine&) = delete;
    auto operator=(const migration_engine&) -> migration_engine& = delete;

    // ========================================================================
    // Running
    // ========================================================================

    /**
     * @brief Run a fresh migration on the calling thread
     * @return Outcome, or migration_in_progress / invalid_configuration
     */
    [[nodiscard]] auto run() -> result<migration_outcome>;

    /**
     * @brief Continue the stored checkpoint on the calling thread
     * @return Outcome, or migration_not_found / checkpoint_* errors
     */
    [[nodiscard]] auto run_from_checkpoint() -> result<migration_outcome>;

    /**
     * @brief run() on the worker pool
     */
    [[nodiscard]] auto start() -> result<void>;

    /**
     * @brief run_from_checkpoint() on the worker pool
     *
     * If a pause was requested but not yet honoured, the request is
     * withdrawn instead. If the run is already winding down into paused,
     * the resume is queued and the run restarts on the pool once it has
     * paused.
     */
    [[nodiscard]] auto resume() -> result<void>;

    /**
     * @brief Wait for the background run to finish
     *
     * Follows a run restarted by a queued resume.
     *
     * @return Its outcome, or migration_not_found if nothing ran
     */
    [[nodiscard]] auto wait() -> result<migration_outcome>;

    // ========================================================================
    // Control
    // ========================================================================

    /**
     * @brief Ask the running batch loop to pause at the next batch boundary
     * @return invalid_state_transition if no pausable run is active
     */
    [[nodiscard]] auto request_pause() -> result<void>;

    /**
     * @brief Ask the run to cancel at the next batch boundary
     *
     * A paused run with no worker is cancelled immediately and its checkpoint
     * deleted. A run already winding down into paused is cancelled as soon as
     * it has paused. During switching the request is deferred.
     *
     * @return invalid_state_transition if there is nothing to cancel
     */
    [[nodiscard]] auto request_cancel(
        cancellation_reason reason = cancellation_reason::user_request) -> result<void>;

    // ========================================================================
    // Observation
    // ========================================================================

    [[nodiscard]] auto phase() const -> migration_phase;

    [[nodiscard]] auto progress() const -> migration_progress;

    /**
     * @brief Whether a run is executing (a paused run is not)
     */
    [[nodiscard]] auto is_running() const -> bool;

    /**
     * @brief Whether a pause was requested and the run has not stopped yet
     */
    [[nodiscard]] auto is_pause_pending() const -> bool;

    /**
     * @brief Whether a cancel was requested and not yet honoured
     */
    [[nodiscard]] auto is_cancel_pending() const -> bool;

    [[nodiscard]] auto checkpoint() const -> std::optional<migration_checkpoint>;

    [[nodiscard]] auto last_outcome() const -> std::optional<migration_outcome>;

    /**
     * @brief Receive a progress snapshot after every saved checkpoint
     *
     * Callbacks run on the migrating thread; exceptions they throw are logged
     * and ignored.
     */
    auto subscribe(progress_callback callback) -> subscription_id;

    void unsubscribe(subscription_id id);

    /**
     * @brief Observe every phase transition
     */
    void set_phase_listener(phase_listener listener);

    [[nodiscard]] auto config() const -> const migration_config&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace matchops::sync

#endif  // MATCHOPS_SYNC_MIGRATION_MIGRATION_ENGINE_H
