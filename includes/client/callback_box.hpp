#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <utility>

namespace soda {

// Heap home of a user callback whose address is handed to the engine as the
// opaque callback handle. The engine may invoke it from any thread until the
// owner closes it; after close() returns no invocation is running and none
// will reach the callback again.
template <typename... Args>
class CallbackBox {
public:
    using Callback = std::function<void(Args...)>;

    explicit CallbackBox(Callback callback) : callback_(std::move(callback)) {}

    CallbackBox(const CallbackBox&) = delete;
    CallbackBox& operator=(const CallbackBox&) = delete;

    void* userData() { return this; }

    // Never takes ownership.
    static CallbackBox* fromUserData(void* userData) {
        return static_cast<CallbackBox*>(userData);
    }

    // Returns false if the box was closed and the callback was skipped.
    bool invoke(Args... args) {
        inFlight_.fetch_add(1);
        if (!live_.load()) {
            leave();
            return false;
        }
        struct Guard {
            CallbackBox* box;
            ~Guard() { box->leave(); }
        } guard{this};
        if (callback_) callback_(std::forward<Args>(args)...);
        return true;
    }

    // Must not be called from inside the callback itself.
    void close() {
        live_.store(false);
        std::unique_lock<std::mutex> lock(mutex_);
        drained_.wait(lock, [this] { return inFlight_.load() == 0; });
    }

    bool isOpen() const { return live_.load(); }

private:
    void leave() {
        if (inFlight_.fetch_sub(1) == 1) {
            std::lock_guard<std::mutex> lock(mutex_);
            drained_.notify_all();
        }
    }

    Callback callback_;
    std::atomic<bool> live_{true};
    std::atomic<int> inFlight_{0};
    std::mutex mutex_;
    std::condition_variable drained_;
};

} // namespace soda
