#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace stripe_listener {

/**
 * Cooperative cancellation signal shared between threads.
 *
 * Copies refer to the same underlying state, so a token can be handed to
 * listen() while the owner keeps a copy to cancel it from a signal handler
 * thread or another component.
 */
class CancellationToken {
public:
    using Callback = std::function<void()>;

    CancellationToken();

    void cancel();
    bool is_cancelled() const;

    // Blocks until cancelled
    void wait() const;
    // Returns true if cancelled before the timeout elapsed
    bool wait_for(std::chrono::milliseconds timeout) const;

    /**
     * Register a callback run once on cancel(). Runs immediately on the
     * calling thread if the token is already cancelled, in which case 0 is
     * returned.
     */
    size_t subscribe(Callback callback) const;
    void unsubscribe(size_t id) const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::atomic<bool> cancelled{false};
        std::map<size_t, Callback> callbacks;
        size_t next_id{1};
    };

    std::shared_ptr<State> state_;
};

// Unsubscribes on destruction
class CancellationSubscription {
public:
    CancellationSubscription(const CancellationToken& token, CancellationToken::Callback callback);
    ~CancellationSubscription();

    CancellationSubscription(const CancellationSubscription&) = delete;
    CancellationSubscription& operator=(const CancellationSubscription&) = delete;

private:
    CancellationToken token_;
    size_t id_;
};

} // namespace stripe_listener
