#ifndef TURN_MUTEX_HPP
#define TURN_MUTEX_HPP

#include <cstdint>

#include <condition_variable>
#include <mutex>
#include <utility>

namespace voice {

// =============================================================================
// TurnMutex - 先到先得的对话轮次锁
// =============================================================================
//
// 票号实现: lock() 按调用顺序获得锁; tryLock() 只在锁空闲且无人排队时成功,
// 用于 "忙则丢弃" 的音频入口。
//

class TurnMutex {
public:
    TurnMutex() = default;
    ~TurnMutex() = default;

    TurnMutex(const TurnMutex&) = delete;
    TurnMutex& operator=(const TurnMutex&) = delete;

    /// @brief 阻塞直到轮到本调用者
    void lock();

    /// @brief 非阻塞获取; 已被持有或有人排队时返回 false
    bool tryLock();

    void unlock();

    bool isLocked() const;

    /// @brief 正在排队等待的调用者数量
    uint64_t waiting() const;

    /// @brief 持锁执行 fn, 结束 (包括抛出异常) 时释放
    template <typename Fn>
    auto runExclusive(Fn&& fn) -> decltype(fn()) {
        lock();
        Releaser releaser{this};
        return std::forward<Fn>(fn)();
    }

private:
    struct Releaser {
        TurnMutex* owner;
        ~Releaser() { owner->unlock(); }
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t next_ticket_ = 0;
    uint64_t now_serving_ = 0;
    bool locked_ = false;
};

}  // namespace voice

#endif  // TURN_MUTEX_HPP
