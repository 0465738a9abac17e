/**
 * @file migration_engine.cpp
 * @brief Implementation of migration_engine
 */

#include <matchops/sync/migration/migration_engine.h>
#include <matchops/sync/core/logging.h>
#include <matchops/sync/migration/progress_estimator.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <map>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace matchops::sync {

namespace {

auto now() -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::now();
}

auto make_context(const migration_checkpoint& cp, migration_phase phase)
    -> migration_log_context {
    migration_log_context ctx;
    ctx.session_id = cp.session.to_string();
    ctx.phase = to_string(phase);
    ctx.items_processed = cp.items_processed;
    ctx.total_items = cp.total_items;
    return ctx;
}

}  // namespace

/**
 * @brief State owned by the engine for the current or last run
 */
struct migration_session {
    migration_phase phase{migration_phase::idle};
    migration_checkpoint checkpoint;
    progress_estimator estimator;
};

// ============================================================================
// migration_engine::impl
// ============================================================================

class migration_engine::impl {
public:
    /**
     * @brief Why a run is winding down after a control request
     */
    enum class stop_kind : uint8_t {
        none,
        pause,
        cancel
    };

    /**
     * @brief Command received while the run was winding down
     */
    struct queued_command {
        bool resume{false};
        cancellation_reason reason{cancellation_reason::user_request};
    };

    /**
     * @brief Ends the current run on scope exit and applies a queued command
     */
    class run_scope {
    public:
        explicit run_scope(impl& owner) : owner_(owner) {}
        ~run_scope() { owner_.end_run(); }

        run_scope(const run_scope&) = delete;
        auto operator=(const run_scope&) -> run_scope& = delete;

    private:
        impl& owner_;
    };

    impl(resource_lock_manager& locks,
         checkpoint_store& checkpoints,
         data_accessor& source,
         data_accessor& destination,
         active_source_pointer& pointer,
         migration_config config,
         std::shared_ptr<adapters::task_pool_interface> pool)
        : locks_(locks)
        , checkpoints_(checkpoints)
        , source_(source)
        , destination_(destination)
        , pointer_(pointer)
        , config_(std::move(config))
        , pool_(std::move(pool))
        , session_(std::make_unique<migration_session>()) {
    }

    // ------------------------------------------------------------------------
    // Run preparation
    // ------------------------------------------------------------------------

    auto prepare_fresh() -> result<migration_checkpoint> {
        if (checkpoints_.has_checkpoint()) {
            MS_LOG_WARN(log_category::engine,
                "Starting a fresh migration; the stored checkpoint is replaced");
        }

        token_.reset();

        migration_checkpoint cp;
        cp.session = session_id::generate();
        cp.direction = config_.direction;
        cp.started_at = now();
        cp.last_updated_at = cp.started_at;
        cp.source_name = source_.name();
        cp.destination_name = destination_.name();

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            session_ = std::make_unique<migration_session>();
            session_->checkpoint = cp;
        }

        auto ctx = make_context(cp, migration_phase::idle);
        MS_LOG_INFO_CTX(log_category::engine,
            "Migration started: " + cp.source_name + " -> " + cp.destination_name, ctx);

        if (auto moved = transition(cp, migration_phase::scanning); !moved) {
            return unexpected(moved.error());
        }
        if (auto saved = save(cp); !saved) {
            auto outcome = fail(cp, saved.error());
            return unexpected(*outcome.cause);
        }
        return cp;
    }

    auto prepare_resume() -> result<migration_checkpoint> {
        auto loaded = checkpoints_.load();
        if (!loaded) {
            return unexpected(loaded.error());
        }
        if (!loaded.value()) {
            return unexpected(error(error_code::migration_not_found,
                "no migration checkpoint to resume"));
        }

        migration_checkpoint cp = std::move(*loaded.value());
        if (cp.direction != config_.direction) {
            return unexpected(error(error_code::invalid_configuration,
                std::string("checkpoint direction ") + to_string(cp.direction) +
                " does not match engine direction " + to_string(config_.direction)));
        }
        if (cp.source_name != source_.name() || cp.destination_name != destination_.name()) {
            MS_LOG_WARN(log_category::engine,
                "Resuming checkpoint recorded for " + cp.source_name + " -> " +
                cp.destination_name);
        }

        token_.reset();

        migration_phase resume_phase = cp.phase;
        cp.paused_at.reset();
        cp.failure.reset();
        cp.last_updated_at = now();

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            session_ = std::make_unique<migration_session>();
            session_->phase = migration_phase::paused;
            session_->checkpoint = cp;
        }

        auto ctx = make_context(cp, resume_phase);
        MS_LOG_INFO_CTX(log_category::engine, "Resuming migration", ctx);

        if (auto moved = transition(cp, resume_phase); !moved) {
            return unexpected(moved.error());
        }
        if (auto saved = save(cp); !saved) {
            auto outcome = fail(cp, saved.error());
            return unexpected(*outcome.cause);
        }
        return cp;
    }

    // ------------------------------------------------------------------------
    // Execution
    // ------------------------------------------------------------------------

    auto execute(migration_checkpoint cp, bool fresh) -> migration_outcome {
        try {
            return execute_steps(cp, fresh);
        } catch (const std::exception& e) {
            return fail(cp, error(error_code::internal_error,
                std::string("unexpected exception: ") + e.what()));
        }
    }

    auto execute_steps(migration_checkpoint& cp, bool fresh) -> migration_outcome {
        bool need_scan = cp.phase == migration_phase::scanning;
        bool need_transfer = need_scan || cp.phase == migration_phase::transferring;

        if (need_scan) {
            if (auto scanned = scan(cp, fresh); !scanned) {
                return fail(cp, scanned.error());
            }
            if (auto stop = check_interrupt(cp)) {
                return *stop;
            }
            if (auto entered = enter(cp, migration_phase::transferring); !entered) {
                return fail(cp, entered.error());
            }
        }

        if (need_transfer) {
            if (auto stop = transfer(cp)) {
                return *stop;
            }
            if (auto stop = check_interrupt(cp)) {
                return *stop;
            }
            if (auto entered = enter(cp, migration_phase::verifying); !entered) {
                return fail(cp, entered.error());
            }
        }

        if (auto verified = verify(cp); !verified) {
            return fail(cp, verified.error());
        }
        if (auto stop = check_interrupt(cp)) {
            return *stop;
        }

        return switch_source(cp);
    }

    auto scan(migration_checkpoint& cp, bool fresh) -> result<void> {
        auto counted = with_retry("count source", [&] { return source_.count(); });
        if (counted) {
            cp.total_items = counted.value();
        } else if (counted.error().code == error_code::not_supported) {
            cp.total_items.reset();
            MS_LOG_INFO(log_category::engine,
                "Source cannot report a total; progress is indeterminate");
        } else {
            return unexpected(counted.error());
        }

        if (fresh && config_.clear_destination_on_start) {
            auto handle = acquire_destination();
            if (!handle) {
                return unexpected(handle.error());
            }
            auto cleared = with_retry("clear destination",
                                      [&] { return destination_.clear(); });
            if (!cleared) {
                return cleared;
            }
            MS_LOG_DEBUG(log_category::engine, "Destination cleared: " + destination_.name());
        }

        cp.last_updated_at = now();
        if (auto saved = save(cp); !saved) {
            return saved;
        }
        publish(cp);
        return {};
    }

    /**
     * @return Outcome when the run stopped, std::nullopt when the source is
     *         exhausted
     */
    auto transfer(migration_checkpoint& cp) -> std::optional<migration_outcome> {
        session_->estimator.record(cp.items_processed, now());

        while (true) {
            if (auto stop = check_interrupt(cp)) {
                return stop;
            }

            auto page = with_retry("list source items", [&] {
                return source_.list_item_ids(cp.items_processed, config_.batch_size);
            });
            if (!page) {
                return fail(cp, page.error());
            }
            const auto& ids = page.value();
            if (ids.empty()) {
                break;
            }

            {
                auto handle = acquire_destination();
                if (!handle) {
                    return fail(cp, handle.error());
                }

                for (const auto& id : ids) {
                    if (auto copied = copy_item(id); !copied) {
                        if (is_fatal(copied.error().code)) {
                            return fail(cp, copied.error());
                        }
                        cp.record_error(id + ": " + copied.error().message,
                                        config_.errors.max_recorded_errors);
                        MS_LOG_WARN(log_category::engine,
                            "Item skipped: " + id + " (" + copied.error().message + ")");
                    }
                    ++cp.items_processed;
                    cp.last_item_id = id;
                }
            }

            cp.last_updated_at = now();
            if (auto saved = save(cp); !saved) {
                return fail(cp, saved.error());
            }
            session_->estimator.record(cp.items_processed, cp.last_updated_at);
            publish(cp);

            if (config_.errors.exceeded(cp.error_count, cp.items_processed)) {
                return fail(cp, error(error_code::error_threshold_exceeded,
                    std::to_string(cp.error_count) + " of " +
                    std::to_string(cp.items_processed) + " items failed"));
            }

            if (ids.size() < config_.batch_size) {
                break;
            }
            if (config_.inter_batch_delay.count() > 0) {
                std::this_thread::sleep_for(config_.inter_batch_delay);
            }
        }

        auto ctx = make_context(cp, migration_phase::transferring);
        MS_LOG_INFO_CTX(log_category::engine, "Transfer finished", ctx);
        return std::nullopt;
    }

    auto copy_item(const std::string& id) -> result<void> {
        auto record = with_retry("read " + id, [&] { return source_.read_item(id); });
        if (!record) {
            return unexpected(record.error());
        }
        return with_retry("write " + id,
                          [&] { return destination_.upsert_item(record.value()); });
    }

    auto verify(migration_checkpoint& cp) -> result<void> {
        uint64_t expected = cp.items_processed - std::min(cp.error_count, cp.items_processed);

        auto counted = with_retry("count destination", [&] { return destination_.count(); });
        if (counted) {
            uint64_t actual = counted.value();
            bool matches = config_.clear_destination_on_start ? actual == expected
                                                              : actual >= expected;
            if (!matches) {
                return unexpected(error(error_code::verification_mismatch,
                    "destination holds " + std::to_string(actual) +
                    " items, expected " + std::to_string(expected)));
            }
        } else if (counted.error().code == error_code::not_supported) {
            MS_LOG_WARN(log_category::engine,
                "Destination cannot report a count; verifying by sample only");
        } else {
            return unexpected(counted.error());
        }

        uint64_t samples = std::min<uint64_t>(config_.verify_sample_size, cp.items_processed);
        uint64_t missing = 0;
        for (uint64_t i = 0; i < samples; ++i) {
            uint64_t offset = i * cp.items_processed / samples;
            auto ids = with_retry("list source items",
                                  [&] { return source_.list_item_ids(offset, 1); });
            if (!ids) {
                return unexpected(ids.error());
            }
            if (ids.value().empty()) {
                continue;
            }
            const auto& id = ids.value().front();

            auto original = with_retry("read " + id, [&] { return source_.read_item(id); });
            if (!original) {
                if (is_fatal(original.error().code)) {
                    return unexpected(original.error());
                }
                continue;
            }

            auto copy = with_retry("read " + id, [&] { return destination_.read_item(id); });
            if (!copy) {
                if (is_fatal(copy.error().code)) {
                    return unexpected(copy.error());
                }
                if (++missing > cp.error_count) {
                    return unexpected(error(error_code::verification_mismatch,
                        "item missing from destination: " + id));
                }
                continue;
            }

            if (original.value().content_hash() != copy.value().content_hash()) {
                return unexpected(error(error_code::verification_mismatch,
                    "content differs for item: " + id));
            }
        }

        auto ctx = make_context(cp, migration_phase::verifying);
        MS_LOG_INFO_CTX(log_category::engine,
            "Verification passed (" + std::to_string(samples) + " items sampled)", ctx);
        return {};
    }

    auto switch_source(migration_checkpoint& cp) -> migration_outcome {
        if (auto moved = transition(cp, migration_phase::switching); !moved) {
            return fail(cp, moved.error());
        }

        {
            auto handle = acquire_destination();
            if (!handle) {
                return fail(cp, handle.error());
            }
            if (auto set = pointer_.set(destination_.name()); !set) {
                return fail(cp, set.error());
            }
        }

        cp.last_updated_at = now();
        if (auto moved = transition(cp, migration_phase::completed); !moved) {
            return fail(cp, moved.error());
        }
        if (auto cleared = checkpoints_.clear(); !cleared) {
            MS_LOG_WARN(log_category::engine,
                "Completed migration left its checkpoint behind: " + cleared.error().message);
        }
        if (token_.cancel_requested()) {
            MS_LOG_INFO(log_category::engine, "Cancel request arrived after switching; ignored");
        }
        token_.reset();

        publish(cp);

        auto ctx = make_context(cp, migration_phase::completed);
        ctx.duration_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                cp.last_updated_at - cp.started_at).count());
        MS_LOG_INFO_CTX(log_category::engine,
            "Migration completed; active source is now " + destination_.name(), ctx);
        return finish(cp, migration_phase::completed, std::nullopt);
    }

    // ------------------------------------------------------------------------
    // Stopping
    // ------------------------------------------------------------------------

    /**
     * @brief Honour a pending pause or cancel at a batch boundary
     *
     * The decision is taken under command_mutex_ so resume() and
     * request_cancel() either withdraw the request first or see the run as
     * stopping and queue behind it.
     */
    auto check_interrupt(migration_checkpoint& cp) -> std::optional<migration_outcome> {
        std::optional<cancellation_reason> cancel_reason;
        bool pause_now = false;
        {
            std::lock_guard<std::mutex> lock(command_mutex_);
            if (token_.cancel_requested()) {
                cancel_reason = token_.reason();
                stopping_ = stop_kind::cancel;
            } else if (token_.pause_requested()) {
                token_.clear_pause();
                stopping_ = stop_kind::pause;
                pause_now = true;
            }
        }

        if (cancel_reason) {
            return cancel(cp, *cancel_reason);
        }
        if (pause_now) {
            return pause(cp);
        }
        return std::nullopt;
    }

    auto pause(migration_checkpoint& cp) -> migration_outcome {
        cp.paused_at = now();
        cp.last_updated_at = *cp.paused_at;
        if (auto saved = save(cp); !saved) {
            cp.paused_at.reset();
            return fail(cp, saved.error());
        }
        if (auto moved = transition(cp, migration_phase::paused); !moved) {
            return fail(cp, moved.error());
        }
        publish(cp);

        auto ctx = make_context(cp, migration_phase::paused);
        MS_LOG_INFO_CTX(log_category::engine, "Migration paused", ctx);
        return finish(cp, migration_phase::paused, std::nullopt);
    }

    auto cancel(migration_checkpoint& cp, cancellation_reason reason) -> migration_outcome {
        if (auto cleared = checkpoints_.clear(); !cleared) {
            MS_LOG_WARN(log_category::engine,
                "Cancelled migration left its checkpoint behind: " + cleared.error().message);
        }
        if (auto moved = transition(cp, migration_phase::cancelled); !moved) {
            return fail(cp, moved.error());
        }
        token_.reset();

        auto ctx = make_context(cp, migration_phase::cancelled);
        MS_LOG_INFO_CTX(log_category::engine,
            std::string("Migration cancelled (") + to_string(reason) +
            "); active source unchanged", ctx);
        return finish(cp, migration_phase::cancelled, std::nullopt);
    }

    auto fail(migration_checkpoint& cp, const error& cause) -> migration_outcome {
        cp.failure = cause.message;
        cp.last_updated_at = now();

        if (auto moved = transition(cp, migration_phase::failed); !moved) {
            MS_LOG_ERROR(log_category::engine, moved.error().message);
        }
        if (is_resumable(cp.phase)) {
            if (auto saved = save(cp); !saved) {
                MS_LOG_ERROR(log_category::engine,
                    "Failed migration could not be checkpointed: " + saved.error().message);
            }
        }
        token_.reset();

        auto ctx = make_context(cp, migration_phase::failed);
        ctx.error_message = cause.message;
        MS_LOG_ERROR_CTX(log_category::engine,
            std::string("Migration failed: ") + to_string(cause.code), ctx);
        return finish(cp, migration_phase::failed, cause);
    }

    auto finish(const migration_checkpoint& cp, migration_phase phase,
                std::optional<error> cause) -> migration_outcome {
        migration_outcome outcome;
        outcome.phase = phase;
        outcome.session = cp.session;
        outcome.items_processed = cp.items_processed;
        outcome.total_items = cp.total_items;
        outcome.error_count = cp.error_count;
        outcome.errors = cp.errors;
        outcome.cause = std::move(cause);

        std::lock_guard<std::mutex> lock(state_mutex_);
        last_outcome_ = outcome;
        return outcome;
    }

    /**
     * @brief Cancel a paused run that has no worker
     */
    void cancel_paused(cancellation_reason reason) {
        migration_checkpoint cp;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            cp = session_->checkpoint;
        }
        static_cast<void>(cancel(cp, reason));
    }

    /**
     * @brief Mark the run finished, or hand it to a command queued while it stopped
     *
     * A queued command only applies to a run that ended paused.
     */
    void end_run() {
        std::optional<queued_command> next;
        {
            std::lock_guard<std::mutex> lock(command_mutex_);
            stopping_ = stop_kind::none;
            next = std::exchange(queued_, std::nullopt);

            migration_phase current = current_phase();
            if (next && (shutting_down_ || current != migration_phase::paused)) {
                MS_LOG_INFO(log_category::engine,
                    std::string("Queued ") + (next->resume ? "resume" : "cancel") +
                    " dropped; run ended " + to_string(current));
                next.reset();
            }
            if (!next) {
                running_.store(false);
                return;
            }
        }

        if (!next->resume) {
            cancel_paused(next->reason);
            running_.store(false);
            return;
        }

        MS_LOG_INFO(log_category::engine, "Applying resume queued during pause");
        auto prepared = prepare_resume();
        if (!prepared) {
            MS_LOG_ERROR(log_category::engine,
                "Queued resume failed: " + prepared.error().message);
            running_.store(false);
            return;
        }
        if (auto launched = launch(std::move(prepared).value(), false); !launched) {
            MS_LOG_ERROR(log_category::engine, launched.error().message);
        }
    }

    /**
     * @brief Wait for the worker, following any run relaunched by a queued resume
     */
    void join() {
        while (true) {
            std::shared_future<void> worker;
            uint64_t generation = 0;
            {
                std::lock_guard<std::mutex> lock(worker_mutex_);
                worker = worker_;
                generation = launches_;
            }
            if (worker.valid()) {
                worker.wait();
            }

            std::lock_guard<std::mutex> lock(worker_mutex_);
            if (generation == launches_) {
                return;
            }
        }
    }

    auto current_phase() const -> migration_phase {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return session_->phase;
    }

    // ------------------------------------------------------------------------
    // Helpers
    // ------------------------------------------------------------------------

    auto transition(migration_checkpoint& cp, migration_phase to) -> result<void> {
        migration_phase from;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            from = session_->phase;
            if (!is_valid_transition(from, to)) {
                return unexpected(error(error_code::invalid_state_transition,
                    std::string("invalid transition ") + to_string(from) + " -> " +
                    to_string(to)));
            }
            session_->phase = to;
            cp.phase_timestamps.push_back({to, now()});
            if (is_resumable(to) || to == migration_phase::completed) {
                cp.phase = to;
            }
            session_->checkpoint = cp;
        }

        MS_LOG_DEBUG(log_category::engine,
            std::string("Phase ") + to_string(from) + " -> " + to_string(to));

        phase_listener listener;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            listener = listener_;
        }
        if (listener) {
            try {
                listener(from, to);
            } catch (const std::exception& e) {
                MS_LOG_WARN(log_category::engine,
                    std::string("Phase listener threw: ") + e.what());
            }
        }
        return {};
    }

    /**
     * @brief Transition to an active phase and checkpoint it
     */
    auto enter(migration_checkpoint& cp, migration_phase to) -> result<void> {
        if (auto moved = transition(cp, to); !moved) {
            return moved;
        }
        cp.last_updated_at = now();
        if (auto saved = save(cp); !saved) {
            return saved;
        }
        publish(cp);
        return {};
    }

    auto save(const migration_checkpoint& cp) -> result<void> {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            session_->checkpoint = cp;
        }
        return checkpoints_.save(cp);
    }

    void publish(const migration_checkpoint& cp) {
        migration_progress snapshot;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            session_->checkpoint = cp;
            snapshot = snapshot_locked();
        }

        std::vector<progress_callback> callbacks;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            callbacks.reserve(subscribers_.size());
            for (const auto& [id, callback] : subscribers_) {
                callbacks.push_back(callback);
            }
        }

        for (const auto& callback : callbacks) {
            try {
                callback(snapshot);
            } catch (const std::exception& e) {
                MS_LOG_WARN(log_category::progress,
                    std::string("Progress subscriber threw: ") + e.what());
            }
        }
    }

    auto snapshot_locked() const -> migration_progress {
        auto progress = session_->estimator.snapshot(session_->checkpoint, now());
        progress.phase = session_->phase;
        return progress;
    }

    template <typename Op>
    auto with_retry(const std::string& what, Op&& op) -> decltype(op()) {
        const auto& policy = config_.retry;
        for (uint32_t attempt = 1;; ++attempt) {
            auto outcome = op();
            if (outcome || !is_retryable(outcome.error().code)) {
                return outcome;
            }
            if (attempt >= policy.max_attempts) {
                return unexpected(error(error_code::fatal_transport_error,
                    what + " failed after " + std::to_string(attempt) + " attempts: " +
                    outcome.error().message));
            }

            auto delay = policy.delay_for(attempt);
            migration_log_context ctx;
            ctx.attempt = attempt;
            ctx.duration_ms = static_cast<uint64_t>(delay.count());
            ctx.error_message = outcome.error().message;
            MS_LOG_WARN_CTX(log_category::engine, "Retrying " + what, ctx);
            std::this_thread::sleep_for(delay);
        }
    }

    auto acquire_destination() -> result<lock_handle> {
        const auto& policy = config_.retry;
        for (uint32_t attempt = 1;; ++attempt) {
            auto handle = locks_.acquire(config_.destination_resource, config_.lock_timeout);
            if (handle) {
                return handle;
            }
            if (attempt >= policy.max_attempts) {
                return unexpected(error(error_code::lock_timeout,
                    "destination lock not acquired after " + std::to_string(attempt) +
                    " attempts"));
            }
            MS_LOG_WARN(log_category::engine,
                "Destination lock busy: " + config_.destination_resource);
            std::this_thread::sleep_for(policy.delay_for(attempt));
        }
    }

    auto ensure_pool() -> std::shared_ptr<adapters::task_pool_interface> {
        std::lock_guard<std::mutex> lock(worker_mutex_);
        if (!pool_) {
            pool_ = adapters::task_pool_factory::create(1, "matchops_migration");
        }
        return pool_;
    }

    auto launch(migration_checkpoint cp, bool fresh) -> result<void> {
        auto pool = ensure_pool();
        try {
            std::lock_guard<std::mutex> lock(worker_mutex_);
            auto future = pool->submit([this, cp = std::move(cp), fresh]() {
                run_scope scope(*this);
                static_cast<void>(execute(cp, fresh));
            });
            worker_ = future.share();
            ++launches_;
        } catch (const std::exception& e) {
            running_.store(false);
            return unexpected(error(error_code::internal_error,
                std::string("failed to start migration worker: ") + e.what()));
        }
        return {};
    }

    resource_lock_manager& locks_;
    checkpoint_store& checkpoints_;
    data_accessor& source_;
    data_accessor& destination_;
    active_source_pointer& pointer_;
    migration_config config_;
    std::shared_ptr<adapters::task_pool_interface> pool_;

    cancellation_token token_;
    std::atomic<bool> running_{false};

    mutable std::mutex command_mutex_;
    stop_kind stopping_{stop_kind::none};
    std::optional<queued_command> queued_;
    bool shutting_down_{false};

    mutable std::mutex state_mutex_;
    std::unique_ptr<migration_session> session_;
    std::optional<migration_outcome> last_outcome_;

    std::mutex worker_mutex_;
    std::shared_future<void> worker_;
    uint64_t launches_{0};

    std::mutex callbacks_mutex_;
    std::map<subscription_id, progress_callback> subscribers_;
    subscription_id next_subscription_{1};
    phase_listener listener_;
};

// ============================================================================
// migration_engine
// ============================================================================

migration_engine::migration_engine(resource_lock_manager& locks,
                                   checkpoint_store& checkpoints,
                                   data_accessor& source,
                                   data_accessor& destination,
                                   active_source_pointer& pointer,
                                   migration_config config,
                                   std::shared_ptr<adapters::task_pool_interface> pool)
    : impl_(std::make_unique<impl>(locks, checkpoints, source, destination, pointer,
                                   std::move(config), std::move(pool))) {
}

migration_engine::~migration_engine() {
    {
        std::lock_guard<std::mutex> lock(impl_->command_mutex_);
        impl_->shutting_down_ = true;
        impl_->queued_.reset();
    }
    if (impl_->running_.load()) {
        if (auto paused = request_pause(); !paused) {
            MS_LOG_DEBUG(log_category::engine,
                "Engine destroyed without pausing: " + paused.error().message);
        }
    }
    impl_->join();
}

auto migration_engine::run() -> result<migration_outcome> {
    if (auto valid = impl_->config_.validate(); !valid) {
        return unexpected(valid.error());
    }
    if (impl_->running_.exchange(true)) {
        return unexpected(error(error_code::migration_in_progress,
            "a migration is already running"));
    }
    impl::run_scope scope(*impl_);

    auto prepared = impl_->prepare_fresh();
    if (!prepared) {
        return unexpected(prepared.error());
    }
    return impl_->execute(std::move(prepared).value(), true);
}

auto migration_engine::run_from_checkpoint() -> result<migration_outcome> {
    if (auto valid = impl_->config_.validate(); !valid) {
        return unexpected(valid.error());
    }
    if (impl_->running_.exchange(true)) {
        return unexpected(error(error_code::migration_in_progress,
            "a migration is already running"));
    }
    impl::run_scope scope(*impl_);

    auto prepared = impl_->prepare_resume();
    if (!prepared) {
        return unexpected(prepared.error());
    }
    return impl_->execute(std::move(prepared).value(), false);
}

auto migration_engine::start() -> result<void> {
    if (auto valid = impl_->config_.validate(); !valid) {
        return valid;
    }
    if (impl_->running_.exchange(true)) {
        return unexpected(error(error_code::migration_in_progress,
            "a migration is already running"));
    }

    auto prepared = impl_->prepare_fresh();
    if (!prepared) {
        impl_->running_.store(false);
        return unexpected(prepared.error());
    }
    return impl_->launch(std::move(prepared).value(), true);
}

auto migration_engine::resume() -> result<void> {
    if (auto valid = impl_->config_.validate(); !valid) {
        return valid;
    }
    {
        std::lock_guard<std::mutex> lock(impl_->command_mutex_);
        switch (impl_->stopping_) {
            case impl::stop_kind::pause:
                impl_->queued_ = impl::queued_command{true, cancellation_reason::user_request};
                MS_LOG_INFO(log_category::engine, "Resume queued until the run has paused");
                return {};
            case impl::stop_kind::cancel:
                return unexpected(error(error_code::invalid_state_transition,
                    "the migration is being cancelled"));
            default:
                break;
        }
        if (impl_->running_.load() && impl_->token_.pause_requested()) {
            impl_->token_.clear_pause();
            MS_LOG_INFO(log_category::engine, "Pending pause withdrawn");
            return {};
        }
        if (impl_->running_.exchange(true)) {
            return unexpected(error(error_code::migration_in_progress,
                "a migration is already running"));
        }
    }

    auto prepared = impl_->prepare_resume();
    if (!prepared) {
        impl_->running_.store(false);
        return unexpected(prepared.error());
    }
    return impl_->launch(std::move(prepared).value(), false);
}

auto migration_engine::wait() -> result<migration_outcome> {
    impl_->join();

    std::lock_guard<std::mutex> lock(impl_->state_mutex_);
    if (!impl_->last_outcome_) {
        return unexpected(error(error_code::migration_not_found, "no migration has run"));
    }
    return *impl_->last_outcome_;
}

auto migration_engine::request_pause() -> result<void> {
    std::lock_guard<std::mutex> lock(impl_->command_mutex_);
    switch (impl_->stopping_) {
        case impl::stop_kind::pause:
            if (impl_->queued_ && impl_->queued_->resume) {
                impl_->queued_.reset();
                MS_LOG_INFO(log_category::engine, "Queued resume withdrawn");
            }
            return {};
        case impl::stop_kind::cancel:
            return unexpected(error(error_code::invalid_state_transition,
                "the migration is being cancelled"));
        default:
            break;
    }

    migration_phase current = impl_->current_phase();
    if (current == migration_phase::paused) {
        return {};
    }
    if (!impl_->running_.load() || is_terminal(current)) {
        return unexpected(error(error_code::invalid_state_transition,
            "no migration is running"));
    }
    if (current == migration_phase::switching) {
        return unexpected(error(error_code::invalid_state_transition,
            "cannot pause while switching the active source"));
    }

    impl_->token_.request_pause();
    MS_LOG_INFO(log_category::engine,
        std::string("Pause requested during ") + to_string(current));
    return {};
}

auto migration_engine::request_cancel(cancellation_reason reason) -> result<void> {
    {
        std::unique_lock<std::mutex> lock(impl_->command_mutex_);
        switch (impl_->stopping_) {
            case impl::stop_kind::pause:
                impl_->queued_ = impl::queued_command{false, reason};
                MS_LOG_INFO(log_category::engine, "Cancel queued until the run has paused");
                return {};
            case impl::stop_kind::cancel:
                return {};
            default:
                break;
        }

        migration_phase current = impl_->current_phase();
        if (current == migration_phase::paused && !impl_->running_.exchange(true)) {
            lock.unlock();
            impl::run_scope scope(*impl_);
            impl_->cancel_paused(reason);
            return {};
        }

        if (impl_->running_.load() && !is_terminal(current)) {
            impl_->token_.request_cancel(reason);
            if (current == migration_phase::switching) {
                MS_LOG_INFO(log_category::engine, "Cancel deferred until switching finishes");
            } else {
                MS_LOG_INFO(log_category::engine,
                    std::string("Cancel requested (") + to_string(reason) + ")");
            }
            return {};
        }
    }

    return unexpected(error(error_code::invalid_state_transition,
        "no migration to cancel"));
}

auto migration_engine::phase() const -> migration_phase {
    return impl_->current_phase();
}

auto migration_engine::progress() const -> migration_progress {
    std::lock_guard<std::mutex> lock(impl_->state_mutex_);
    return impl_->snapshot_locked();
}

auto migration_engine::is_running() const -> bool {
    return impl_->running_.load();
}

auto migration_engine::is_pause_pending() const -> bool {
    std::lock_guard<std::mutex> lock(impl_->command_mutex_);
    if (!impl_->running_.load()) {
        return false;
    }
    if (impl_->stopping_ == impl::stop_kind::pause) {
        return !impl_->queued_;
    }
    return impl_->stopping_ == impl::stop_kind::none && impl_->token_.pause_requested();
}

auto migration_engine::is_cancel_pending() const -> bool {
    std::lock_guard<std::mutex> lock(impl_->command_mutex_);
    if (!impl_->running_.load()) {
        return false;
    }
    if (impl_->stopping_ == impl::stop_kind::cancel) {
        return true;
    }
    if (impl_->queued_ && !impl_->queued_->resume) {
        return true;
    }
    return impl_->token_.cancel_requested();
}

auto migration_engine::checkpoint() const -> std::optional<migration_checkpoint> {
    std::lock_guard<std::mutex> lock(impl_->state_mutex_);
    if (impl_->session_->phase == migration_phase::idle) {
        return std::nullopt;
    }
    return impl_->session_->checkpoint;
}

auto migration_engine::last_outcome() const -> std::optional<migration_outcome> {
    std::lock_guard<std::mutex> lock(impl_->state_mutex_);
    return impl_->last_outcome_;
}

auto migration_engine::subscribe(progress_callback callback) -> subscription_id {
    std::lock_guard<std::mutex> lock(impl_->callbacks_mutex_);
    auto id = impl_->next_subscription_++;
    impl_->subscribers_.emplace(id, std::move(callback));
    return id;
}

void migration_engine::unsubscribe(subscription_id id) {
    std::lock_guard<std::mutex> lock(impl_->callbacks_mutex_);
    impl_->subscribers_.erase(id);
}

void migration_engine::set_phase_listener(phase_listener listener) {
    std::lock_guard<std::mutex> lock(impl_->callbacks_mutex_);
    impl_->listener_ = std::move(listener);
}

auto migration_engine::config() const -> const migration_config& {
    return impl_->config_;
}

}  // namespace matchops::sync
