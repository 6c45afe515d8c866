#pragma once

#include <string>
#include <map>
#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <future>
#include <optional>
#include <functional>
#include <condition_variable>
#include <core/types.hpp>
#include "resource.hpp"

// Table of in-flight computations keyed by "<collection>/<identifier>",
// plus ownership of the background threads running them. At most one
// computation per key runs at a time; later callers join it.
class ComputeDispatcher {
public:
    using Outcome = std::shared_future<Result<Resource>>;

    struct Claim {
        bool joined = false;   // true: another caller owns the key, wait on `outcome`
        Outcome outcome;       // resolves to the terminal snapshot
    };

    ComputeDispatcher() = default;
    ~ComputeDispatcher();

    ComputeDispatcher(const ComputeDispatcher&) = delete;
    ComputeDispatcher& operator=(const ComputeDispatcher&) = delete;

    static std::string key(const std::string& collection, const std::string& id);

    // Take ownership of `key`, or join the computation that already holds it.
    Claim claim(const std::string& key);

    // Publish the outcome for a key this caller claimed and release it.
    void release(const std::string& key, Result<Resource> outcome);

    // Run `task` for a key this caller claimed and release the key with
    // its outcome. An exception escaping `task` is released as an error.
    Result<Resource> run_claimed(const std::string& key,
                                 const std::function<Result<Resource>()>& task);

    std::optional<Outcome> find(const std::string& key) const;

    // Run `task` on a new thread owned by the dispatcher.
    void spawn(std::function<void()> task);

    // Block until no computation is in flight, then join every thread.
    void wait_all();

    size_t in_flight() const;

private:
    struct Slot {
        std::promise<Result<Resource>> promise;
        Outcome outcome;
    };

    struct Worker {
        std::thread thread;
        std::atomic<bool> finished{false};
    };

    std::map<std::string, std::shared_ptr<Slot>> slots_;
    std::list<std::unique_ptr<Worker>> workers_;
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;

    // Remove finished workers from workers_; caller joins them unlocked.
    std::list<std::unique_ptr<Worker>> take_finished_locked();
};
