#include "pocket/scheduler.hpp"

namespace pocket {

std_thread_scheduler::std_thread_scheduler()
    : worker_([this] { work(); }) {}

std_thread_scheduler::~std_thread_scheduler() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wake_.notify_one();
    if (worker_.joinable()) worker_.join();
}

void std_thread_scheduler::invoke(task_t&& task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        tasks_.push_back(std::move(task));
    }
    wake_.notify_one();
}

bool std_thread_scheduler::is_on_thread() const noexcept {
    return std::this_thread::get_id() == worker_.get_id();
}

void std_thread_scheduler::work() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        wake_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
        if (tasks_.empty()) return;  // stopping, drained

        task_t task = std::move(tasks_.front());
        tasks_.pop_front();
        lock.unlock();
        if (task) task();
        lock.lock();
    }
}

manual_scheduler::manual_scheduler() : owner_(std::this_thread::get_id()) {}

void manual_scheduler::invoke(task_t&& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(std::move(task));
}

bool manual_scheduler::is_on_thread() const noexcept {
    return std::this_thread::get_id() == owner_;
}

size_t manual_scheduler::run_pending() {
    size_t ran = 0;
    for (;;) {
        task_t task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (tasks_.empty()) return ran;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        if (task) task();
        ++ran;
    }
}

size_t manual_scheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace pocket
