#pragma once

#include "protocol/jsonrpc.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>

#include <nlohmann/json.hpp>

namespace rc_mcp {

// Runs every tool body on one designated thread. Callers on any thread hand a
// call over and block until it has run; calls are executed one at a time in
// submission order, which is what serializes access to the host's state.
class AffinityExecutor {
public:
    enum class State {
        Idle,        // nothing queued or running
        Dispatched,  // calls queued, none running yet
        Executing    // a call is running on the affinity thread
    };

    AffinityExecutor() = default;
    ~AffinityExecutor();

    AffinityExecutor(const AffinityExecutor &) = delete;
    AffinityExecutor &operator=(const AffinityExecutor &) = delete;

    // Spawns a dedicated affinity thread.
    void start();

    // Turns the calling thread (e.g. the host's main thread) into the
    // affinity context. Returns once stop() has been called, immediately if
    // that already happened.
    void run();

    // Queued calls that have not started are abandoned; their callers get an
    // internal error. A call already running is allowed to finish.
    void stop();

    bool is_running() const;
    bool on_affinity_thread() const;
    State state() const;
    uint64_t completed_calls() const { return completed_.load(); }

    // Runs func on the affinity thread and returns its result, rethrowing any
    // exception it raised. Runs inline when already on the affinity thread.
    template<typename Func>
    auto execute_sync(Func &&func) -> decltype(func()) {
        using RetType = decltype(func());

        if (on_affinity_thread()) {
            return func();
        }

        auto task = std::make_shared<std::packaged_task<RetType()>>(std::forward<Func>(func));
        std::future<RetType> result = task->get_future();
        enqueue([task]() { (*task)(); });
        return result.get();
    }

    // Tool-call entry point: like execute_sync, but every failure comes back
    // as McpError(kInternalError). A std::exception (McpError included) keeps
    // its what(); anything else thrown becomes "Unknown error".
    nlohmann::json invoke(const std::function<nlohmann::json()> &call);

private:
    void enqueue(std::function<void()> job);
    void begin_run(bool clear_stop);
    void pump();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    bool running_ = false;
    bool stopping_ = false;
    bool executing_ = false;
    std::thread::id owner_;
    std::unique_ptr<std::thread> thread_;
    std::atomic<uint64_t> completed_{0};
};

} // namespace rc_mcp
