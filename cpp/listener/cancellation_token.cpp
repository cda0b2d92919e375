#include "cancellation_token.hpp"
#include <utility>
#include <vector>

namespace stripe_listener {

CancellationToken::CancellationToken()
    : state_(std::make_shared<State>()) {
}

void CancellationToken::cancel() {
    std::vector<Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled.load()) {
            return;
        }
        state_->cancelled.store(true);
        for (auto& entry : state_->callbacks) {
            callbacks.push_back(std::move(entry.second));
        }
        state_->callbacks.clear();
    }
    state_->cv.notify_all();

    for (auto& callback : callbacks) {
        callback();
    }
}

bool CancellationToken::is_cancelled() const {
    return state_->cancelled.load();
}

void CancellationToken::wait() const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait(lock, [this] { return state_->cancelled.load(); });
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled.load(); });
}

size_t CancellationToken::subscribe(Callback callback) const {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled.load()) {
            size_t id = state_->next_id++;
            state_->callbacks[id] = std::move(callback);
            return id;
        }
    }
    callback();
    return 0;
}

void CancellationToken::unsubscribe(size_t id) const {
    if (id == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(id);
}

CancellationSubscription::CancellationSubscription(const CancellationToken& token,
                                                   CancellationToken::Callback callback)
    : token_(token), id_(token.subscribe(std::move(callback))) {
}

CancellationSubscription::~CancellationSubscription() {
    token_.unsubscribe(id_);
}

} // namespace stripe_listener
