/**
 * @file test_migration_engine.cpp
 * @brief Unit tests for migration_engine
 */

#include <gtest/gtest.h>

#include "../test_fixtures.h"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace matchops::sync::test {

using namespace std::chrono_literals;

class MigrationEngineTest : public MigrationFixture {
protected:
    void SetUp() override {
        MigrationFixture::SetUp();
        local_.populate(100);
    }
};

// =============================================================================
// Complete runs
// =============================================================================

TEST_F(MigrationEngineTest, CompletesAndSwitchesSource) {
    auto engine = make_engine();

    auto outcome = engine->run();

    ASSERT_TRUE(outcome);
    EXPECT_TRUE(outcome.value().succeeded());
    EXPECT_EQ(outcome.value().items_processed, 100u);
    EXPECT_EQ(outcome.value().total_items, std::optional<uint64_t>(100));
    EXPECT_EQ(outcome.value().error_count, 0u);
    EXPECT_FALSE(outcome.value().cause.has_value());

    EXPECT_EQ(cloud_.size(), 100u);
    EXPECT_EQ(pointer_.get(), "cloud");
    EXPECT_FALSE(checkpoints_.has_checkpoint());
    EXPECT_EQ(engine->phase(), migration_phase::completed);
    EXPECT_FALSE(engine->is_running());
}

TEST_F(MigrationEngineTest, CopiesPayloads) {
    auto engine = make_engine();
    ASSERT_TRUE(engine->run());

    auto original = local_.read_item("item-00042");
    auto copy = cloud_.read_item("item-00042");
    ASSERT_TRUE(original);
    ASSERT_TRUE(copy);
    EXPECT_EQ(original.value().content_hash(), copy.value().content_hash());
}

TEST_F(MigrationEngineTest, EmptySourceCompletes) {
    memory_data_accessor empty("empty");
    migration_engine engine(locks_, checkpoints_, empty, cloud_, pointer_, config_);

    auto outcome = engine.run();

    ASSERT_TRUE(outcome);
    EXPECT_TRUE(outcome.value().succeeded());
    EXPECT_EQ(outcome.value().items_processed, 0u);
    EXPECT_EQ(pointer_.get(), "cloud");
}

TEST_F(MigrationEngineTest, FreshRunClearsDestination) {
    cloud_.populate(5, "stale");
    auto engine = make_engine();

    ASSERT_TRUE(engine->run());

    EXPECT_EQ(cloud_.size(), 100u);
    EXPECT_FALSE(cloud_.contains("stale-00001"));
}

TEST_F(MigrationEngineTest, KeepsDestinationWhenConfigured) {
    config_.clear_destination_on_start = false;
    cloud_.populate(5, "existing");
    auto engine = make_engine();

    auto outcome = engine->run();

    ASSERT_TRUE(outcome);
    EXPECT_TRUE(outcome.value().succeeded());
    EXPECT_EQ(cloud_.size(), 105u);
}

TEST_F(MigrationEngineTest, PhaseListenerSeesEveryTransition) {
    auto engine = make_engine();
    std::vector<std::pair<migration_phase, migration_phase>> transitions;
    engine->set_phase_listener([&](migration_phase from, migration_phase to) {
        transitions.emplace_back(from, to);
    });

    ASSERT_TRUE(engine->run());

    std::vector<std::pair<migration_phase, migration_phase>> expected = {
        {migration_phase::idle, migration_phase::scanning},
        {migration_phase::scanning, migration_phase::transferring},
        {migration_phase::transferring, migration_phase::verifying},
        {migration_phase::verifying, migration_phase::switching},
        {migration_phase::switching, migration_phase::completed},
    };
    EXPECT_EQ(transitions, expected);
}

TEST_F(MigrationEngineTest, ProgressIsPublishedPerBatch) {
    auto engine = make_engine();
    std::vector<uint64_t> transferred;
    engine->subscribe([&](const migration_progress& p) {
        if (p.phase == migration_phase::transferring) {
            transferred.push_back(p.items_processed);
        }
    });

    ASSERT_TRUE(engine->run());

    ASSERT_FALSE(transferred.empty());
    EXPECT_EQ(transferred.back(), 100u);
    for (std::size_t i = 1; i < transferred.size(); ++i) {
        EXPECT_GE(transferred[i], transferred[i - 1]);
    }
}

TEST_F(MigrationEngineTest, CheckpointSavedBeforeProgressPublished) {
    auto engine = make_engine();
    std::vector<std::pair<uint64_t, uint64_t>> observed;
    engine->subscribe([&](const migration_progress& p) {
        if (p.phase != migration_phase::transferring) {
            return;
        }
        auto stored = checkpoints_.load();
        if (stored && stored.value()) {
            observed.emplace_back(p.items_processed, stored.value()->items_processed);
        }
    });

    ASSERT_TRUE(engine->run());

    ASSERT_FALSE(observed.empty());
    for (const auto& [published, saved] : observed) {
        EXPECT_EQ(published, saved);
    }
}

TEST_F(MigrationEngineTest, SubscriberExceptionDoesNotAbortRun) {
    auto engine = make_engine();
    engine->subscribe([](const migration_progress&) {
        throw std::runtime_error("subscriber failure");
    });

    auto outcome = engine->run();

    ASSERT_TRUE(outcome);
    EXPECT_TRUE(outcome.value().succeeded());
}

TEST_F(MigrationEngineTest, UnsubscribeStopsDelivery) {
    auto engine = make_engine();
    int calls = 0;
    auto id = engine->subscribe([&](const migration_progress&) { ++calls; });
    engine->unsubscribe(id);

    ASSERT_TRUE(engine->run());

    EXPECT_EQ(calls, 0);
}

TEST_F(MigrationEngineTest, UnknownTotalIsIndeterminate) {
    local_.set_count_supported(false);
    auto engine = make_engine();
    bool saw_indeterminate = false;
    engine->subscribe([&](const migration_progress& p) {
        if (p.phase == migration_phase::transferring && p.is_indeterminate()) {
            saw_indeterminate = true;
        }
    });

    auto outcome = engine->run();

    ASSERT_TRUE(outcome);
    EXPECT_TRUE(outcome.value().succeeded());
    EXPECT_FALSE(outcome.value().total_items.has_value());
    EXPECT_EQ(outcome.value().items_processed, 100u);
    EXPECT_TRUE(saw_indeterminate);
}

// =============================================================================
// Pause and resume
// =============================================================================

TEST_F(MigrationEngineTest, PauseAndResumeWithoutDuplicates) {
    auto engine = make_engine();
    engine->subscribe([&](const migration_progress& p) {
        if (p.phase == migration_phase::transferring && p.items_processed == 40) {
            ASSERT_TRUE(engine->request_pause());
        }
    });

    auto paused = engine->run();

    ASSERT_TRUE(paused);
    EXPECT_EQ(paused.value().phase, migration_phase::paused);
    EXPECT_EQ(paused.value().items_processed, 40u);
    EXPECT_EQ(engine->phase(), migration_phase::paused);
    EXPECT_EQ(cloud_.size(), 40u);
    EXPECT_EQ(pointer_.get(), "local");

    auto stored = checkpoints_.load();
    ASSERT_TRUE(stored);
    ASSERT_TRUE(stored.value().has_value());
    EXPECT_EQ(stored.value()->phase, migration_phase::transferring);
    EXPECT_EQ(stored.value()->items_processed, 40u);
    EXPECT_TRUE(stored.value()->paused_at.has_value());

    auto writes_before = cloud_.write_count();
    auto resumed = engine->run_from_checkpoint();

    ASSERT_TRUE(resumed);
    EXPECT_TRUE(resumed.value().succeeded());
    EXPECT_EQ(resumed.value().items_processed, 100u);
    EXPECT_TRUE(resumed.value().session == paused.value().session);
    EXPECT_EQ(cloud_.size(), 100u);
    EXPECT_EQ(cloud_.write_count() - writes_before, 60u);
    EXPECT_EQ(pointer_.get(), "cloud");
    EXPECT_FALSE(checkpoints_.has_checkpoint());
}

TEST_F(MigrationEngineTest, CriticalItemsTransferFirst) {
    local_.populate(10, "roster", item_priority::critical);
    local_.populate(10, "theme", item_priority::background);

    auto engine = make_engine();
    engine->subscribe([&](const migration_progress& p) {
        if (p.phase == migration_phase::transferring && p.items_processed == 10) {
            ASSERT_TRUE(engine->request_pause());
        }
    });

    auto paused = engine->run();

    ASSERT_TRUE(paused);
    EXPECT_EQ(paused.value().phase, migration_phase::paused);
    ASSERT_EQ(cloud_.size(), 10u);
    for (const auto& record : cloud_.items()) {
        EXPECT_EQ(record.priority, item_priority::critical) << record.id;
    }

    auto resumed = engine->run_from_checkpoint();

    ASSERT_TRUE(resumed);
    EXPECT_TRUE(resumed.value().succeeded());
    EXPECT_EQ(cloud_.size(), 120u);
    auto theme = cloud_.read_item("theme-00010");
    ASSERT_TRUE(theme);
    EXPECT_EQ(theme.value().priority, item_priority::background);
}

TEST_F(MigrationEngineTest, ResumeAfterRestart) {
    {
        auto engine = make_engine();
        engine->subscribe([&](const migration_progress& p) {
            if (p.phase == migration_phase::transferring && p.items_processed == 30) {
                static_cast<void>(engine->request_pause());
            }
        });
        auto paused = engine->run();
        ASSERT_TRUE(paused);
        ASSERT_EQ(paused.value().phase, migration_phase::paused);
    }

    auto restarted = make_engine();
    auto outcome = restarted->run_from_checkpoint();

    ASSERT_TRUE(outcome);
    EXPECT_TRUE(outcome.value().succeeded());
    EXPECT_EQ(cloud_.size(), 100u);
}

TEST_F(MigrationEngineTest, ResumeWithoutCheckpoint) {
    auto engine = make_engine();

    auto outcome = engine->run_from_checkpoint();

    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, error_code::migration_not_found);
}

TEST_F(MigrationEngineTest, ResumeRejectsOtherDirection) {
    auto engine = make_engine();
    engine->subscribe([&](const migration_progress& p) {
        if (p.phase == migration_phase::transferring && p.items_processed == 20) {
            static_cast<void>(engine->request_pause());
        }
    });
    ASSERT_TRUE(engine->run());

    config_.direction = migration_direction::cloud_to_local;
    auto reversed = make_engine();
    auto outcome = reversed->run_from_checkpoint();

    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, error_code::invalid_configuration);
    EXPECT_TRUE(checkpoints_.has_checkpoint());
}

TEST_F(MigrationEngineTest, PauseRequiresRunningMigration) {
    auto engine = make_engine();

    auto paused = engine->request_pause();

    ASSERT_FALSE(paused);
    EXPECT_EQ(paused.error().code, error_code::invalid_state_transition);
}

TEST_F(MigrationEngineTest, PauseWhilePausedIsAccepted) {
    auto engine = make_engine();
    engine->subscribe([&](const migration_progress& p) {
        if (p.phase == migration_phase::transferring && p.items_processed == 10) {
            static_cast<void>(engine->request_pause());
        }
    });
    ASSERT_TRUE(engine->run());

    EXPECT_TRUE(engine->request_pause());
    EXPECT_EQ(engine->phase(), migration_phase::paused);
}

TEST_F(MigrationEngineTest, CheckpointVisibleWhilePaused) {
    auto engine = make_engine();
    EXPECT_FALSE(engine->checkpoint().has_value());

    engine->subscribe([&](const migration_progress& p) {
        if (p.phase == migration_phase::transferring && p.items_processed == 50) {
            static_cast<void>(engine->request_pause());
        }
    });
    ASSERT_TRUE(engine->run());

    auto cp = engine->checkpoint();
    ASSERT_TRUE(cp.has_value());
    EXPECT_EQ(cp->items_processed, 50u);
    EXPECT_EQ(engine->progress().phase, migration_phase::paused);
    EXPECT_DOUBLE_EQ(engine->progress().percentage.value_or(0.0), 50.0);
}

// =============================================================================
// Cancellation
// =============================================================================

TEST_F(MigrationEngineTest, CancelDuringTransfer) {
    auto engine = make_engine();
    engine->subscribe([&](const migration_progress& p) {
        if (p.phase == migration_phase::transferring && p.items_processed == 30) {
            ASSERT_TRUE(engine->request_cancel());
        }
    });

    auto outcome = engine->run();

    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().phase, migration_phase::cancelled);
    EXPECT_EQ(outcome.value().items_processed, 30u);
    EXPECT_EQ(pointer_.get(), "local");
    EXPECT_FALSE(checkpoints_.has_checkpoint());
    EXPECT_EQ(local_.size(), 100u);
}

TEST_F(MigrationEngineTest, CancelBeforeSwitching) {
    auto engine = make_engine();
    engine->subscribe([&](const migration_progress& p) {
        if (p.phase == migration_phase::verifying) {
            static_cast<void>(engine->request_cancel(cancellation_reason::app_shutdown));
        }
    });
    std::vector<migration_phase> entered;
    engine->set_phase_listener([&](migration_phase, migration_phase to) {
        entered.push_back(to);
    });

    auto outcome = engine->run();

    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().phase, migration_phase::cancelled);
    EXPECT_EQ(pointer_.get(), "local");
    EXPECT_FALSE(checkpoints_.has_checkpoint());
    EXPECT_EQ(std::count(entered.begin(), entered.end(), migration_phase::switching), 0);
}

TEST_F(MigrationEngineTest, CancelDuringSwitchingIsDropped) {
    auto engine = make_engine();
    bool requested = false;
    engine->set_phase_listener([&](migration_phase, migration_phase to) {
        if (to == migration_phase::switching) {
            requested = engine->request_cancel().has_value();
            EXPECT_TRUE(engine->is_cancel_pending());
        }
    });

    auto outcome = engine->run();

    ASSERT_TRUE(outcome);
    EXPECT_TRUE(requested);
    EXPECT_EQ(outcome.value().phase, migration_phase::completed);
    EXPECT_EQ(engine->phase(), migration_phase::completed);
    EXPECT_EQ(pointer_.get(), "cloud");
    EXPECT_FALSE(checkpoints_.has_checkpoint());
    EXPECT_FALSE(engine->is_cancel_pending());
}

TEST_F(MigrationEngineTest, CancelWhilePausedDeletesCheckpoint) {
    auto engine = make_engine();
    engine->subscribe([&](const migration_progress& p) {
        if (p.phase == migration_phase::transferring && p.items_processed == 20) {
            static_cast<void>(engine->request_pause());
        }
    });
    ASSERT_TRUE(engine->run());
    ASSERT_TRUE(checkpoints_.has_checkpoint());

    ASSERT_TRUE(engine->request_cancel());

    EXPECT_EQ(engine->phase(), migration_phase::cancelled);
    EXPECT_FALSE(checkpoints_.has_checkpoint());
    EXPECT_EQ(pointer_.get(), "local");
    ASSERT_TRUE(engine->last_outcome().has_value());
    EXPECT_EQ(engine->last_outcome()->phase, migration_phase::cancelled);
}

TEST_F(MigrationEngineTest, CancelAfterCompletionIsRejected) {
    auto engine = make_engine();
    ASSERT_TRUE(engine->run());

    auto cancelled = engine->request_cancel();

    ASSERT_FALSE(cancelled);
    EXPECT_EQ(cancelled.error().code, error_code::invalid_state_transition);
    EXPECT_EQ(pointer_.get(), "cloud");
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(MigrationEngineTest, VerificationMismatchKeepsSource) {
    cloud_.set_reject_after(99);
    auto engine = make_engine();

    auto outcome = engine->run();

    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().phase, migration_phase::failed);
    ASSERT_TRUE(outcome.value().cause.has_value());
    EXPECT_EQ(outcome.value().cause->code, error_code::verification_mismatch);
    EXPECT_EQ(pointer_.get(), "local");

    auto stored = checkpoints_.load();
    ASSERT_TRUE(stored);
    ASSERT_TRUE(stored.value().has_value());
    EXPECT_EQ(stored.value()->phase, migration_phase::verifying);
    EXPECT_TRUE(stored.value()->failure.has_value());
}

TEST_F(MigrationEngineTest, TransientFailuresAreRetried) {
    local_.set_unavailable(2);
    auto engine = make_engine();

    auto outcome = engine->run();

    ASSERT_TRUE(outcome);
    EXPECT_TRUE(outcome.value().succeeded());
    EXPECT_EQ(cloud_.size(), 100u);
}

TEST_F(MigrationEngineTest, RetriesAreBounded) {
    local_.set_unavailable(10);
    auto engine = make_engine();

    auto outcome = engine->run();

    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().phase, migration_phase::failed);
    EXPECT_EQ(outcome.value().cause->code, error_code::fatal_transport_error);
    EXPECT_EQ(pointer_.get(), "local");
}

TEST_F(MigrationEngineTest, UnreachableSourceFailsAndKeepsCheckpoint) {
    local_.set_unreachable(true);
    auto engine = make_engine();

    auto outcome = engine->run();

    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().phase, migration_phase::failed);
    EXPECT_EQ(outcome.value().cause->code, error_code::fatal_transport_error);
    EXPECT_TRUE(checkpoints_.has_checkpoint());
    EXPECT_EQ(pointer_.get(), "local");
}

TEST_F(MigrationEngineTest, FailedRunCanBeResumed) {
    auto engine = make_engine();
    engine->subscribe([&](const migration_progress& p) {
        if (p.phase == migration_phase::transferring && p.items_processed == 60) {
            local_.set_unreachable(true);
        }
    });

    auto failed = engine->run();
    ASSERT_TRUE(failed);
    ASSERT_EQ(failed.value().phase, migration_phase::failed);

    local_.set_unreachable(false);
    auto resumed = make_engine()->run_from_checkpoint();

    ASSERT_TRUE(resumed);
    EXPECT_TRUE(resumed.value().succeeded());
    EXPECT_EQ(cloud_.size(), 100u);
    EXPECT_EQ(pointer_.get(), "cloud");
}

TEST_F(MigrationEngineTest, ItemErrorsAreRecorded) {
    local_.fail_reads_for("item-00003");
    local_.fail_reads_for("item-00007");
    auto engine = make_engine();

    auto outcome = engine->run();

    ASSERT_TRUE(outcome);
    EXPECT_TRUE(outcome.value().succeeded());
    EXPECT_EQ(outcome.value().items_processed, 100u);
    EXPECT_EQ(outcome.value().error_count, 2u);
    ASSERT_EQ(outcome.value().errors.size(), 2u);
    EXPECT_NE(outcome.value().errors[0].find("item-00003"), std::string::npos);
    EXPECT_EQ(cloud_.size(), 98u);
}

TEST_F(MigrationEngineTest, ErrorThresholdAbortsRun) {
    for (int i = 1; i <= 10; ++i) {
        char id[16];
        std::snprintf(id, sizeof(id), "item-%05d", i);
        local_.fail_reads_for(id);
    }
    auto engine = make_engine();

    auto outcome = engine->run();

    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().phase, migration_phase::failed);
    EXPECT_EQ(outcome.value().cause->code, error_code::error_threshold_exceeded);
    EXPECT_EQ(pointer_.get(), "local");
}

TEST_F(MigrationEngineTest, CheckpointWriteFailureAbortsRun) {
    auto engine = make_engine();
    engine->subscribe([&](const migration_progress& p) {
        if (p.phase == migration_phase::transferring && p.items_processed == 20) {
            kv_.fail_writes = true;
        }
    });

    auto outcome = engine->run();

    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().phase, migration_phase::failed);
    EXPECT_EQ(outcome.value().cause->code, error_code::checkpoint_write_error);
    EXPECT_EQ(pointer_.get(), "local");
}

TEST_F(MigrationEngineTest, DestinationLockTimeout) {
    config_.lock_timeout = 20ms;
    config_.retry.max_attempts = 2;
    auto held = locks_.acquire(config_.destination_resource, 100ms);
    ASSERT_TRUE(held);
    auto engine = make_engine();

    auto outcome = engine->run();

    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().phase, migration_phase::failed);
    EXPECT_EQ(outcome.value().cause->code, error_code::lock_timeout);
}

TEST_F(MigrationEngineTest, DestinationLockNotHeldBetweenBatches) {
    auto engine = make_engine();
    std::vector<bool> locked;
    engine->subscribe([&](const migration_progress& p) {
        if (p.phase == migration_phase::transferring) {
            locked.push_back(locks_.is_locked(config_.destination_resource));
        }
    });

    ASSERT_TRUE(engine->run());

    ASSERT_FALSE(locked.empty());
    for (bool held : locked) {
        EXPECT_FALSE(held);
    }
}

// =============================================================================
// Preconditions and background runs
// =============================================================================

TEST_F(MigrationEngineTest, InvalidConfigurationRejected) {
    config_.batch_size = 0;
    auto engine = make_engine();

    auto outcome = engine->run();

    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, error_code::invalid_configuration);
}

TEST_F(MigrationEngineTest, SecondRunRejectedWhileRunning) {
    auto engine = make_engine();
    std::optional<error_code> nested;
    engine->subscribe([&](const migration_progress& p) {
        if (!nested && p.phase == migration_phase::transferring) {
            auto again = engine->run();
            nested = again ? error_code::success : again.error().code;
        }
    });

    ASSERT_TRUE(engine->run());

    EXPECT_EQ(nested, error_code::migration_in_progress);
}

TEST_F(MigrationEngineTest, StartAndWait) {
    auto engine = make_engine();

    ASSERT_TRUE(engine->start());
    auto outcome = engine->wait();

    ASSERT_TRUE(outcome);
    EXPECT_TRUE(outcome.value().succeeded());
    EXPECT_EQ(pointer_.get(), "cloud");
    EXPECT_FALSE(engine->is_running());
}

TEST_F(MigrationEngineTest, WaitWithoutRun) {
    auto engine = make_engine();

    auto outcome = engine->wait();

    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code, error_code::migration_not_found);
}

TEST_F(MigrationEngineTest, BackgroundPauseAndResume) {
    local_.set_latency(200us);
    auto engine = make_engine();

    ASSERT_TRUE(engine->start());
    while (engine->progress().items_processed < 10 && engine->is_running()) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_TRUE(engine->request_pause());
    auto paused = engine->wait();
    ASSERT_TRUE(paused);
    ASSERT_EQ(paused.value().phase, migration_phase::paused);
    EXPECT_LT(paused.value().items_processed, 100u);

    ASSERT_TRUE(engine->resume());
    auto completed = engine->wait();

    ASSERT_TRUE(completed);
    EXPECT_TRUE(completed.value().succeeded());
    EXPECT_EQ(cloud_.size(), 100u);
}

TEST_F(MigrationEngineTest, ResumeWithdrawsPendingPause) {
    auto engine = make_engine();
    std::atomic<bool> withdrawn{false};
    engine->subscribe([&](const migration_progress& p) {
        if (p.phase == migration_phase::transferring && p.items_processed == 20 &&
            !withdrawn.load()) {
            static_cast<void>(engine->request_pause());
            EXPECT_TRUE(engine->is_pause_pending());
            withdrawn.store(engine->resume().has_value());
        }
    });

    auto outcome = engine->run();

    ASSERT_TRUE(outcome);
    EXPECT_TRUE(withdrawn.load());
    EXPECT_TRUE(outcome.value().succeeded());
}

TEST_F(MigrationEngineTest, ResumeWhilePausingRestartsRun) {
    auto engine = make_engine();
    engine->subscribe([&](const migration_progress& p) {
        if (p.phase == migration_phase::transferring && p.items_processed == 30) {
            static_cast<void>(engine->request_pause());
        }
    });
    std::atomic<int> resumes{0};
    engine->set_phase_listener([&](migration_phase, migration_phase to) {
        if (to == migration_phase::paused && resumes.fetch_add(1) == 0) {
            EXPECT_TRUE(engine->is_pause_pending());
            EXPECT_TRUE(engine->resume());
            EXPECT_FALSE(engine->is_pause_pending());
        }
    });

    auto paused = engine->run();
    ASSERT_TRUE(paused);
    EXPECT_EQ(paused.value().phase, migration_phase::paused);

    auto outcome = engine->wait();

    ASSERT_TRUE(outcome);
    EXPECT_TRUE(outcome.value().succeeded());
    EXPECT_TRUE(outcome.value().session == paused.value().session);
    EXPECT_EQ(cloud_.size(), 100u);
    EXPECT_EQ(pointer_.get(), "cloud");
    EXPECT_FALSE(checkpoints_.has_checkpoint());
    EXPECT_FALSE(engine->is_running());
}

TEST_F(MigrationEngineTest, CancelWhilePausingCancelsRun) {
    auto engine = make_engine();
    engine->subscribe([&](const migration_progress& p) {
        if (p.phase == migration_phase::transferring && p.items_processed == 30) {
            static_cast<void>(engine->request_pause());
        }
    });
    engine->set_phase_listener([&](migration_phase, migration_phase to) {
        if (to == migration_phase::paused) {
            EXPECT_TRUE(engine->request_cancel(cancellation_reason::app_shutdown));
            EXPECT_TRUE(engine->is_cancel_pending());
        }
    });

    auto paused = engine->run();
    ASSERT_TRUE(paused);
    EXPECT_EQ(paused.value().phase, migration_phase::paused);

    EXPECT_EQ(engine->phase(), migration_phase::cancelled);
    EXPECT_FALSE(engine->is_running());
    EXPECT_FALSE(checkpoints_.has_checkpoint());
    EXPECT_EQ(pointer_.get(), "local");
    ASSERT_TRUE(engine->last_outcome().has_value());
    EXPECT_EQ(engine->last_outcome()->phase, migration_phase::cancelled);
}

TEST_F(MigrationEngineTest, PauseWithdrawsQueuedResume) {
    auto engine = make_engine();
    engine->subscribe([&](const migration_progress& p) {
        if (p.phase == migration_phase::transferring && p.items_processed == 30) {
            static_cast<void>(engine->request_pause());
        }
    });
    engine->set_phase_listener([&](migration_phase, migration_phase to) {
        if (to == migration_phase::paused) {
            EXPECT_TRUE(engine->resume());
            EXPECT_TRUE(engine->request_pause());
        }
    });

    ASSERT_TRUE(engine->run());
    auto outcome = engine->wait();

    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().phase, migration_phase::paused);
    EXPECT_EQ(outcome.value().items_processed, 30u);
    EXPECT_TRUE(checkpoints_.has_checkpoint());
    EXPECT_EQ(pointer_.get(), "local");
}

TEST_F(MigrationEngineTest, SharedPoolIsUsed) {
    auto pool = adapters::task_pool_factory::create(1, "migration_test");
    migration_engine engine(locks_, checkpoints_, local_, cloud_, pointer_, config_, pool);

    ASSERT_TRUE(engine.start());
    auto outcome = engine.wait();

    ASSERT_TRUE(outcome);
    EXPECT_TRUE(outcome.value().succeeded());
}

// =============================================================================
// Resume from any offset
// =============================================================================

/**
 * @brief Resume a checkpoint left after an arbitrary number of copied items
 */
class ResumeFromOffsetTest : public MigrationFixture,
                             public ::testing::WithParamInterface<uint64_t> {
protected:
    void SetUp() override {
        MigrationFixture::SetUp();
        local_.populate(100);
    }

    /**
     * @brief Copy the first @p items and store the checkpoint a crash would leave
     */
    void leave_checkpoint_at(uint64_t items) {
        if (items > 0) {
            auto ids = local_.list_item_ids(0, items);
            ASSERT_TRUE(ids);
            for (const auto& id : ids.value()) {
                auto record = local_.read_item(id);
                ASSERT_TRUE(record);
                ASSERT_TRUE(cloud_.upsert_item(record.value()));
            }
        }

        auto now = std::chrono::system_clock::now();
        migration_checkpoint cp;
        cp.session = session_id::generate();
        cp.phase = migration_phase::transferring;
        cp.items_processed = items;
        cp.total_items = 100;
        cp.started_at = now - std::chrono::minutes(1);
        cp.last_updated_at = now;
        cp.source_name = "local";
        cp.destination_name = "cloud";
        if (items > 0) {
            char last[16];
            std::snprintf(last, sizeof(last), "item-%05llu",
                          static_cast<unsigned long long>(items - 1));
            cp.last_item_id = last;
        }
        ASSERT_TRUE(checkpoints_.save(cp));
    }
};

TEST_P(ResumeFromOffsetTest, DestinationMatchesSource) {
    const uint64_t offset = GetParam();
    leave_checkpoint_at(offset);
    auto writes_before = cloud_.write_count();

    auto engine = make_engine();
    auto outcome = engine->run_from_checkpoint();

    ASSERT_TRUE(outcome);
    EXPECT_TRUE(outcome.value().succeeded());
    EXPECT_EQ(outcome.value().items_processed, 100u);
    EXPECT_EQ(cloud_.write_count() - writes_before, 100u - offset);
    EXPECT_EQ(cloud_.size(), 100u);
    EXPECT_EQ(pointer_.get(), "cloud");
    EXPECT_FALSE(checkpoints_.has_checkpoint());

    auto ids = local_.list_item_ids(0, 100);
    ASSERT_TRUE(ids);
    for (const auto& id : ids.value()) {
        auto original = local_.read_item(id);
        auto copy = cloud_.read_item(id);
        ASSERT_TRUE(original);
        ASSERT_TRUE(copy) << id;
        EXPECT_EQ(original.value().content_hash(), copy.value().content_hash()) << id;
    }
}

INSTANTIATE_TEST_SUITE_P(Offsets, ResumeFromOffsetTest,
                         ::testing::Values(0u, 9u, 10u, 99u, 100u));

}  // namespace matchops::sync::test
