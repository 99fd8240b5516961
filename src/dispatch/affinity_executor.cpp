#include "dispatch/affinity_executor.hpp"
#include "common/log.hpp"

#include <stdexcept>

namespace rc_mcp {

AffinityExecutor::~AffinityExecutor() {
    stop();
}

void AffinityExecutor::begin_run(bool clear_stop) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        throw std::logic_error("Affinity executor already running");
    }
    running_ = true;
    if (clear_stop) {
        stopping_ = false;
    }
}

void AffinityExecutor::start() {
    begin_run(true);
    thread_ = std::make_unique<std::thread>(&AffinityExecutor::pump, this);
}

// Honors a stop() issued before the loop starts.
void AffinityExecutor::run() {
    begin_run(false);
    pump();
}

void AffinityExecutor::pump() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        owner_ = std::this_thread::get_id();
    }
    log_debug("Affinity context active\n");

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (stopping_) {
            break;
        }

        std::function<void()> job = std::move(queue_.front());
        queue_.pop_front();
        executing_ = true;
        lock.unlock();

        // packaged_task stores the outcome in the caller's future
        job();

        lock.lock();
        executing_ = false;
        ++completed_;
    }

    std::deque<std::function<void()>> abandoned;
    abandoned.swap(queue_);
    running_ = false;
    owner_ = std::thread::id();
    lock.unlock();

    if (!abandoned.empty()) {
        log_warn("Affinity executor stopped with %lu pending calls\n",
                 static_cast<unsigned long>(abandoned.size()));
    }
    // Destroying the tasks breaks their promises and wakes the waiting callers.
    abandoned.clear();
}

void AffinityExecutor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    if (thread_ && thread_->joinable() && thread_->get_id() != std::this_thread::get_id()) {
        thread_->join();
        thread_.reset();
    }
}

bool AffinityExecutor::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_ && !stopping_;
}

bool AffinityExecutor::on_affinity_thread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_ && owner_ == std::this_thread::get_id();
}

AffinityExecutor::State AffinityExecutor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (executing_) return State::Executing;
    if (!queue_.empty()) return State::Dispatched;
    return State::Idle;
}

void AffinityExecutor::enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || stopping_) {
            throw McpError(rpc_error::kInternalError, "Affinity executor is not running");
        }
        queue_.push_back(std::move(job));
    }
    cv_.notify_one();
}

nlohmann::json AffinityExecutor::invoke(const std::function<nlohmann::json()> &call) {
    try {
        return execute_sync([&call]() { return call(); });
    } catch (const std::future_error &) {
        throw McpError(rpc_error::kInternalError, "Affinity executor stopped before the call ran");
    } catch (const std::exception &e) {
        throw McpError(rpc_error::kInternalError, e.what());
    } catch (...) {
        throw McpError(rpc_error::kInternalError, "Unknown error");
    }
}

} // namespace rc_mcp
