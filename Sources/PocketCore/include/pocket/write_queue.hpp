#pragma once

#include "metrics.hpp"
#include "scheduler.hpp"
#include <chrono>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace pocket {

// ============================================================================
// Write queue - the single FIFO through which every database mutation passes
// ============================================================================
//
// Operations run one at a time, strictly in enqueue order, on the scheduler
// the queue was constructed with. An operation that throws a lock-contention
// db_error (busy/locked) is retried with exponential backoff; anything else
// fails immediately. A failed operation only fails its own future; the queue
// keeps draining.
//
// Do not block on a returned future from inside the queue's own scheduler
// context: the drain step that would fulfil it runs there too. await_result()
// pumps or refuses instead.

struct write_queue_options {
    int max_retries = 3;
    std::chrono::milliseconds initial_backoff{50};
    size_t depth_warning_threshold = 5;
    std::chrono::milliseconds wait_warning_threshold{1000};
};

/// Per-operation lifecycle. succeeded and failed are terminal.
enum class write_state {
    queued,
    running,
    retrying,
    succeeded,
    failed
};

const char* to_string(write_state state) noexcept;

struct write_queue_stats {
    size_t current_depth = 0;
    size_t max_depth = 0;
};

class write_queue {
public:
    /// Observer for lifecycle transitions. `attempt` is the retry number while
    /// retrying, otherwise the number of retries used so far.
    using transition_observer = std::function<void(const std::string& name, write_state state, int attempt)>;

    explicit write_queue(shared_scheduler sched,
                         write_queue_options options = {},
                         std::shared_ptr<metrics> sink = nullptr);

    write_queue(const write_queue&) = delete;
    write_queue& operator=(const write_queue&) = delete;

    /// Append `op` to the queue. The future resolves with op's own result or
    /// rethrows op's exception. Never throws synchronously.
    template<typename Fn>
    auto enqueue_write(Fn&& op, std::string name = {})
        -> std::future<std::invoke_result_t<std::decay_t<Fn>&>> {
        using result_t = std::invoke_result_t<std::decay_t<Fn>&>;
        static_assert(!std::is_reference_v<result_t>, "write operations must return by value");

        auto fn = std::make_shared<std::decay_t<Fn>>(std::forward<Fn>(op));
        auto promise = std::make_shared<std::promise<result_t>>();
        auto future = promise->get_future();

        pending_write w;
        w.name = name.empty() ? std::string("write") : std::move(name);
        if constexpr (std::is_void_v<result_t>) {
            w.attempt = [fn]() { (*fn)(); };
            w.complete = [promise]() { promise->set_value(); };
        } else {
            auto slot = std::make_shared<std::optional<result_t>>();
            w.attempt = [fn, slot]() { slot->emplace((*fn)()); };
            w.complete = [promise, slot]() { promise->set_value(std::move(**slot)); };
        }
        w.fail = [promise](std::exception_ptr error) {
            promise->set_exception(error);
        };
        push(std::move(w));
        return future;
    }

    /// Wait for a future this queue returned. On a scheduler that only runs
    /// when pumped by the calling thread (manual_scheduler on its owner), the
    /// pending work is pumped here instead of blocking. Throws
    /// std::logic_error when nothing can complete it.
    template<typename T>
    T await_result(std::future<T> future) {
        using namespace std::chrono_literals;
        while (sched_->is_on_thread() && future.wait_for(0ms) != std::future_status::ready) {
            if (in_drain_context() || sched_->run_pending() == 0) {
                throw std::logic_error("queued write cannot complete: its scheduler is waiting on this thread");
            }
        }
        return future.get();
    }

    [[nodiscard]] write_queue_stats stats() const;

    /// Test support: forget the historical maximum depth.
    void reset_stats();

    /// Block until every operation enqueued so far has completed. Must not be
    /// called from the queue's own scheduler context.
    void wait_idle();

    void set_transition_observer(transition_observer observer);

    /// True while the calling thread is executing one of this queue's
    /// operations. Waiting on a queue future from there would deadlock.
    [[nodiscard]] bool in_drain_context() const noexcept;

    [[nodiscard]] const write_queue_options& options() const { return state_->options; }
    [[nodiscard]] scheduler& executor() const { return *sched_; }
    [[nodiscard]] metrics& sink() const { return *state_->sink; }

private:
    using clock = std::chrono::steady_clock;

    struct pending_write {
        std::string name;
        clock::time_point enqueued_at;
        std::function<void()> attempt;   // runs the operation once
        std::function<void()> complete;  // publishes the stored result
        std::function<void(std::exception_ptr)> fail;
    };

    // Shared with in-flight drain callbacks so a scheduler that outlives the
    // queue never touches freed memory.
    struct shared_state {
        write_queue_options options;
        std::shared_ptr<metrics> sink;
        transition_observer observer;

        std::mutex mutex;
        std::condition_variable idle_cv;
        std::deque<pending_write> pending;
        bool draining = false;
        size_t depth = 0;
        size_t max_depth = 0;

        void drain();
        void run_one(pending_write& w);
        void notify(const std::string& name, write_state state, int attempt);
    };

    void push(pending_write&& w);

    shared_scheduler sched_;
    std::shared_ptr<shared_state> state_;
};

} // namespace pocket
