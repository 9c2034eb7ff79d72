#include "internal/pipeline/turn_mutex.hpp"

#include <mutex>

namespace voice {

void TurnMutex::lock() {
    std::unique_lock<std::mutex> lock(mutex_);
    const uint64_t ticket = next_ticket_++;
    cv_.wait(lock, [this, ticket] { return !locked_ && now_serving_ == ticket; });
    locked_ = true;
    ++now_serving_;
}

bool TurnMutex::tryLock() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (locked_ || now_serving_ != next_ticket_) {
        return false;
    }
    ++next_ticket_;
    ++now_serving_;
    locked_ = true;
    return true;
}

void TurnMutex::unlock() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        locked_ = false;
    }
    cv_.notify_all();
}

bool TurnMutex::isLocked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locked_;
}

uint64_t TurnMutex::waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_ticket_ - now_serving_;
}

}  // namespace voice
