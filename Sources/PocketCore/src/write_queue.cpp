#include "pocket/write_queue.hpp"
#include "pocket/db.hpp"
#include "pocket/log.hpp"
#include <algorithm>
#include <thread>

namespace pocket {

namespace {
// Queue state whose drain loop is running on this thread, if any.
thread_local const void* tls_draining_state = nullptr;
}

const char* to_string(write_state state) noexcept {
    switch (state) {
        case write_state::queued: return "queued";
        case write_state::running: return "running";
        case write_state::retrying: return "retrying";
        case write_state::succeeded: return "succeeded";
        case write_state::failed: return "failed";
    }
    return "unknown";
}

write_queue::write_queue(shared_scheduler sched,
                         write_queue_options options,
                         std::shared_ptr<metrics> sink)
    : sched_(sched ? std::move(sched) : std::make_shared<immediate_scheduler>())
    , state_(std::make_shared<shared_state>()) {
    state_->options = options;
    state_->sink = sink ? std::move(sink) : std::make_shared<metrics>();
}

void write_queue::push(pending_write&& w) {
    w.enqueued_at = clock::now();
    std::string name = w.name;

    bool schedule_drain = false;
    size_t depth = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->pending.push_back(std::move(w));
        depth = ++state_->depth;
        state_->max_depth = std::max(state_->max_depth, depth);
        if (!state_->draining) {
            state_->draining = true;
            schedule_drain = true;
        }
    }

    if (depth > state_->options.depth_warning_threshold) {
        LOG_WARN("write_queue", "Queue depth is %zu, may indicate contention", depth);
        state_->sink->increment("db.write.depth_warning");
    }
    state_->notify(name, write_state::queued, 0);

    if (schedule_drain) {
        sched_->invoke([state = state_] { state->drain(); });
    }
}

void write_queue::shared_state::drain() {
    const void* outer = tls_draining_state;
    tls_draining_state = this;
    while (true) {
        pending_write w;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (pending.empty()) {
                draining = false;
                break;
            }
            w = std::move(pending.front());
            pending.pop_front();
        }
        run_one(w);
    }
    tls_draining_state = outer;
    idle_cv.notify_all();
}

void write_queue::shared_state::run_one(pending_write& w) {
    auto started = clock::now();
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(started - w.enqueued_at);
    if (waited > options.wait_warning_threshold) {
        LOG_WARN("write_queue", "Operation \"%s\" waited %lldms in queue",
                 w.name.c_str(), static_cast<long long>(waited.count()));
        sink->increment("db.write.wait_warning");
    }

    size_t current_depth;
    {
        std::lock_guard<std::mutex> lock(mutex);
        current_depth = depth;
    }
    LOG_DEBUG("write_queue", "Executing \"%s\" (queue depth: %zu)", w.name.c_str(), current_depth);
    sink->increment("db.write.queued");
    notify(w.name, write_state::running, 0);

    std::exception_ptr error;
    auto backoff = options.initial_backoff;
    int attempt = 0;

    for (;; ++attempt) {
        try {
            w.attempt();
            error = nullptr;
            break;
        } catch (const db_error& e) {
            error = std::current_exception();
            if (!e.is_lock_contention()) {
                break;
            }
            if (attempt >= options.max_retries) {
                LOG_ERROR("write_queue", "\"%s\" failed after %d retries: %s",
                          w.name.c_str(), options.max_retries, e.what());
                sink->increment("db.write.retry.exhausted");
                break;
            }
            LOG_WARN("write_queue", "Database %s, retrying \"%s\" (attempt %d/%d) after %lldms",
                     to_string(e.kind()), w.name.c_str(), attempt + 1, options.max_retries,
                     static_cast<long long>(backoff.count()));
            sink->increment("db.write.retry.attempt");
            notify(w.name, write_state::retrying, attempt + 1);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        } catch (...) {
            // Not ours to interpret; it goes back to the caller untouched.
            error = std::current_exception();
            break;
        }
    }

    auto total = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - w.enqueued_at);

    if (!error) {
        if (attempt > 0) {
            LOG_INFO("write_queue", "\"%s\" succeeded after %d retries", w.name.c_str(), attempt);
            sink->increment("db.write.retry.success");
        }
        LOG_DEBUG("write_queue", "Completed \"%s\" in %lldms", w.name.c_str(),
                  static_cast<long long>(total.count()));
        sink->timing("db.write.duration", total.count());
        sink->increment("db.write.success");
    } else {
        LOG_ERROR("write_queue", "Failed \"%s\" after %lldms", w.name.c_str(),
                  static_cast<long long>(total.count()));
        sink->increment("db.write.error");
    }

    // Depth drops before the caller is released so stats() observed from a
    // resolved future never counts the operation that resolved it.
    {
        std::lock_guard<std::mutex> lock(mutex);
        --depth;
    }
    notify(w.name, error ? write_state::failed : write_state::succeeded, attempt);

    if (error) {
        w.fail(error);
    } else {
        w.complete();
    }
}

void write_queue::shared_state::notify(const std::string& name, write_state state, int attempt) {
    transition_observer copy;
    {
        std::lock_guard<std::mutex> lock(mutex);
        copy = observer;
    }
    if (!copy) return;
    // Observer failures must not stop the drain loop.
    try {
        copy(name, state, attempt);
    } catch (const std::exception& e) {
        LOG_ERROR("write_queue", "Transition observer failed on \"%s\" (%s): %s",
                  name.c_str(), to_string(state), e.what());
    }
}

write_queue_stats write_queue::stats() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return {state_->depth, state_->max_depth};
}

void write_queue::reset_stats() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->max_depth = state_->depth;
}

void write_queue::wait_idle() {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->idle_cv.wait(lock, [this] { return !state_->draining && state_->pending.empty(); });
}

bool write_queue::in_drain_context() const noexcept {
    return tls_draining_state == state_.get();
}

void write_queue::set_transition_observer(transition_observer observer) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->observer = std::move(observer);
}

} // namespace pocket
