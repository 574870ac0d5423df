#pragma once

#include "concurrency/AsyncService.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace ad::diag {

struct SweepResult {
    std::size_t scanned = 0;   // non-directory candidates that matched the extension filter
    std::size_t deleted = 0;
    std::size_t skipped = 0;   // stat or delete failed
    bool cancelled = false;
};

// Empty hooks fall back to the "sweeper" logger. Hooks run on the sweeping thread while the
// run holds its lock; a hook that calls sweep() on the same Sweeper gets an empty result.
struct SweepObserver {
    std::function<void(std::string_view)> on_info = nullptr;
    std::function<void(const std::filesystem::path&)> on_deleted = nullptr;
    std::function<void(const SweepResult&)> on_complete = nullptr;
};

/**
 * Periodically deletes files under `path` (recursively) whose extension matches and whose
 * modification time is older than `max_age`. Cleanup is best-effort: a missing root, a file
 * that vanishes mid-scan, or a failed delete never fails the run.
 *
 * Runs never overlap. The service loop waits one interval before each run, and sweep()
 * callers from other threads queue behind the run in progress. stop() interrupts the wait
 * and makes an in-flight run stop before its next candidate.
 */
class Sweeper final : public concurrency::AsyncService {
public:
    struct Options {
        std::filesystem::path path;
        std::string extension = "*";               // "*" matches everything; "log" and ".log" are equivalent
        std::chrono::seconds max_age{std::chrono::hours(24 * 7)};
        std::chrono::seconds interval{std::chrono::hours(1)};
        SweepObserver observer{};

        // Deletes one file; defaults to std::filesystem::remove
        std::function<bool(const std::filesystem::path&, std::error_code&)> remove = nullptr;
    };

    Sweeper(const std::string& name, Options opts);
    ~Sweeper() override;

    SweepResult sweep();

    [[nodiscard]] bool sweepInProgress() const { return inProgress_.load(std::memory_order_acquire); }
    [[nodiscard]] bool matches(const std::filesystem::path& p) const;
    [[nodiscard]] const Options& options() const { return opts_; }

protected:
    void runLoop() override;

private:
    Options opts_;
    std::string suffix_;
    std::mutex runMutex_;
    std::atomic<bool> inProgress_{false};
    std::atomic<std::thread::id> runOwner_{};

    [[nodiscard]] bool cancelRequested() const { return isRunning() && shouldStop(); }

    [[nodiscard]] std::vector<std::filesystem::path> collectCandidates() const;

    void notifyInfo(std::string_view msg) const;
    void notifyDeleted(const std::filesystem::path& p) const;
    void notifyComplete(const SweepResult& r) const;
};

}
