#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <cstddef>
#include <thread>

namespace pocket {

using task_t = std::function<void()>;

// ============================================================================
// scheduler - the execution context queued writes drain on
// ============================================================================
//
// The write queue owns no threads. The host picks where the drain step runs:
// its own event loop (manual_scheduler), a dedicated writer thread
// (std_thread_scheduler) or the caller's stack (immediate_scheduler).

struct scheduler {
    virtual ~scheduler() = default;

    /// Safe to call from any thread.
    virtual void invoke(task_t&& task) = 0;

    /// True when the caller is already running on this context.
    [[nodiscard]] virtual bool is_on_thread() const noexcept = 0;

    /// Runs queued tasks on the calling thread, for schedulers that make
    /// progress only when their owner pumps them. Returns how many ran.
    virtual size_t run_pending() { return 0; }
};

using shared_scheduler = std::shared_ptr<scheduler>;

/// One dedicated worker thread. Tasks still queued at destruction are run
/// before the thread exits, so no pending promise is abandoned.
class std_thread_scheduler : public scheduler {
public:
    std_thread_scheduler();
    ~std_thread_scheduler() override;

    std_thread_scheduler(const std_thread_scheduler&) = delete;
    std_thread_scheduler& operator=(const std_thread_scheduler&) = delete;

    void invoke(task_t&& task) override;
    [[nodiscard]] bool is_on_thread() const noexcept override;

private:
    void work();

    std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<task_t> tasks_;
    bool stopping_ = false;
    std::thread worker_;
};

/// Runs each task on the spot.
class immediate_scheduler : public scheduler {
public:
    void invoke(task_t&& task) override {
        if (task) task();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override { return true; }
};

/// Cooperative: tasks wait until the owning thread pumps them. The owner is
/// the thread that constructed it.
class manual_scheduler : public scheduler {
public:
    manual_scheduler();

    void invoke(task_t&& task) override;
    [[nodiscard]] bool is_on_thread() const noexcept override;

    /// Runs tasks until none are left, including ones queued meanwhile.
    size_t run_pending() override;

    [[nodiscard]] size_t pending() const;

private:
    std::thread::id owner_;
    mutable std::mutex mutex_;
    std::deque<task_t> tasks_;
};

} // namespace pocket
