#pragma once

#include <exception>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace flagrun {

// Raised to a waiter whose registry was shut down
class CompletionCancelled : public std::runtime_error {
public:
    explicit CompletionCancelled(const std::string& message)
        : std::runtime_error(message) {}
};

// Correlates a waiter with a value that arrives on another thread.
//
// insert() hands out a future for a key; resolve() fulfils it exactly once
// and forgets the key; cancel() forgets the key without fulfilling it (the
// waiter gave up). All three are serialized, so a key is never resolved
// twice and a concurrent insert is never lost. cancel_all() fails every
// waiter with CompletionCancelled and refuses further inserts.
template <typename T>
class CompletionRegistry {
public:
    // Throws std::logic_error if the key is already pending and
    // CompletionCancelled after cancel_all()
    std::future<T> insert(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw CompletionCancelled("No longer accepting " + key);
        }
        auto [it, inserted] = pending_.try_emplace(key);
        if (!inserted) {
            throw std::logic_error("Completion already pending for " + key);
        }
        return it->second.get_future();
    }

    // Returns false when nobody is waiting for the key
    bool resolve(const std::string& key, T value) {
        std::promise<T> promise;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(key);
            if (it == pending_.end()) return false;
            promise = std::move(it->second);
            pending_.erase(it);
        }
        promise.set_value(std::move(value));
        return true;
    }

    // Returns false when the key was already resolved or cancelled
    bool cancel(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.erase(key) > 0;
    }

    // Returns the number of waiters woken
    size_t cancel_all(const std::string& reason) {
        std::unordered_map<std::string, std::promise<T>> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            pending.swap(pending_);
        }
        for (auto& entry : pending) {
            entry.second.set_exception(std::make_exception_ptr(CompletionCancelled(reason)));
        }
        return pending.size();
    }

    bool contains(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.count(key) > 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::promise<T>> pending_;
    bool closed_ = false;
};

} // namespace flagrun
