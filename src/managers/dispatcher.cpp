#include "dispatcher.hpp"
#include <core/log.hpp>
#include <exception>

ComputeDispatcher::~ComputeDispatcher() {
    wait_all();
}

std::string ComputeDispatcher::key(const std::string& collection, const std::string& id) {
    return collection + "/" + id;
}

ComputeDispatcher::Claim ComputeDispatcher::claim(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    Claim c;
    auto it = slots_.find(key);
    if (it != slots_.end()) {
        c.joined = true;
        c.outcome = it->second->outcome;
        return c;
    }

    auto slot = std::make_shared<Slot>();
    slot->outcome = slot->promise.get_future().share();
    c.outcome = slot->outcome;
    slots_[key] = std::move(slot);
    return c;
}

void ComputeDispatcher::release(const std::string& key, Result<Resource> outcome) {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(key);
        if (it == slots_.end()) {
            memo_logf(LogLevel::Warn, "dispatcher: release of unclaimed key {}", key);
            return;
        }
        slot = std::move(it->second);
        slots_.erase(it);
    }
    slot->promise.set_value(std::move(outcome));
    idle_cv_.notify_all();
}

Result<Resource> ComputeDispatcher::run_claimed(const std::string& key,
                                                const std::function<Result<Resource>()>& task) {
    Result<Resource> outcome;
    try {
        outcome = task();
    } catch (const std::exception& e) {
        memo_logf(LogLevel::Error, "dispatcher: computation of {} threw: {}", key, e.what());
        outcome = Result<Resource>::Err("Computation of " + key + " aborted: " + e.what());
    }
    release(key, outcome);
    return outcome;
}

std::optional<ComputeDispatcher::Outcome> ComputeDispatcher::find(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(key);
    if (it == slots_.end()) return std::nullopt;
    return it->second->outcome;
}

std::list<std::unique_ptr<ComputeDispatcher::Worker>> ComputeDispatcher::take_finished_locked() {
    std::list<std::unique_ptr<Worker>> done;
    for (auto it = workers_.begin(); it != workers_.end();) {
        if ((*it)->finished.load()) {
            done.push_back(std::move(*it));
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
    return done;
}

void ComputeDispatcher::spawn(std::function<void()> task) {
    std::list<std::unique_ptr<Worker>> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished = take_finished_locked();

        auto worker = std::make_unique<Worker>();
        auto* raw = worker.get();
        worker->thread = std::thread([raw, task = std::move(task)]() {
            task();
            raw->finished.store(true);
        });
        workers_.push_back(std::move(worker));
    }

    for (auto& w : finished) {
        if (w->thread.joinable()) w->thread.join();
    }
}

void ComputeDispatcher::wait_all() {
    std::list<std::unique_ptr<Worker>> local;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [this] { return slots_.empty(); });
        local.swap(workers_);
    }
    for (auto& w : local) {
        if (w->thread.joinable()) w->thread.join();
    }
}

size_t ComputeDispatcher::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}
