#ifndef RESOURCE_ARBITER_HPP
#define RESOURCE_ARBITER_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "internal/capabilities/capability.hpp"

namespace voice {

// =============================================================================
// ResourceArbiter - 单驻留能力管理
// =============================================================================
//
// 加速器内存只够放下一个能力。acquire() 保证:
// - 同类型且仍有效: 直接复用, 不释放也不重新加载
// - 否则: 先释放当前驻留能力 (释放失败只记录警告), 再调用 setup 创建新能力
// - setup 的内存分配失败统一映射为 OUT_OF_MEMORY
//
// 任意时刻最多一个能力驻留。并发调用由内部互斥量串行化。
//

/// @brief Builds a capability; runs only inside acquire()
using CapabilitySetup = std::function<ErrorInfo(std::unique_ptr<ICapability>& out)>;

enum class LifecycleEvent {
    INITIALIZING,
    READY,
    RELEASED,
};

inline const char* lifecycleEventToString(LifecycleEvent event) {
    switch (event) {
        case LifecycleEvent::INITIALIZING: return "initializing";
        case LifecycleEvent::READY:        return "ready";
        case LifecycleEvent::RELEASED:     return "released";
        default:                           return "unknown";
    }
}

using LifecycleListener = std::function<void(CapabilityKind kind, LifecycleEvent event)>;

class ResourceArbiter {
public:
    static constexpr const char* OUT_OF_MEMORY_MESSAGE =
        "Out of memory: failed to allocate model buffers. "
        "Close other applications using the accelerator and retry.";

    ResourceArbiter() = default;
    ~ResourceArbiter();

    ResourceArbiter(const ResourceArbiter&) = delete;
    ResourceArbiter& operator=(const ResourceArbiter&) = delete;

    /**
     * @brief 获取指定类型的能力
     * @param kind 需要的能力类型
     * @param setup 当前未驻留时用于创建能力
     * @param out [out] 驻留能力 (所有权归仲裁器, 下次切换前有效)
     * @return OUT_OF_MEMORY / setup 返回的错误 / INTERNAL_ERROR
     */
    ErrorInfo acquire(CapabilityKind kind, const CapabilitySetup& setup, ICapability*& out);

    /// @brief 释放当前驻留能力 (如有)
    void release();

    bool hasResident() const;

    /// @brief 当前驻留类型; 无驻留时返回 false
    bool residentKind(CapabilityKind& kind) const;

    /// @brief 观察生命周期事件 (仅通知, 不影响结果; 在释放内部锁之后调用)
    void setLifecycleListener(LifecycleListener listener);

    int getDisposeCount() const;
    int getSetupCount() const;

private:
    using PendingEvents = std::vector<std::pair<CapabilityKind, LifecycleEvent>>;

    ErrorInfo acquireLocked(CapabilityKind kind, const CapabilitySetup& setup,
                            ICapability*& out, PendingEvents& events);
    void disposeResidentLocked(PendingEvents& events);
    static void fire(const LifecycleListener& listener, const PendingEvents& events);

    std::unique_ptr<ICapability> resident_;
    LifecycleListener listener_;
    int dispose_count_ = 0;
    int setup_count_ = 0;

    mutable std::mutex mutex_;
};

}  // namespace voice

#endif  // RESOURCE_ARBITER_HPP
