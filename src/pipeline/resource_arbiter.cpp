#include "internal/pipeline/resource_arbiter.hpp"

#include <exception>
#include <iostream>
#include <new>
#include <string>
#include <utility>
#include <vector>

namespace voice {

ResourceArbiter::~ResourceArbiter() {
    release();
}

ErrorInfo ResourceArbiter::acquire(CapabilityKind kind,
                                   const CapabilitySetup& setup,
                                   ICapability*& out) {
    PendingEvents events;
    LifecycleListener listener;
    ErrorInfo err = ErrorInfo::ok();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        err = acquireLocked(kind, setup, out, events);
        listener = listener_;
    }
    // Listener runs unlocked so it may query the arbiter
    fire(listener, events);
    return err;
}

ErrorInfo ResourceArbiter::acquireLocked(CapabilityKind kind,
                                         const CapabilitySetup& setup,
                                         ICapability*& out,
                                         PendingEvents& events) {
    if (resident_ && resident_->kind() == kind && resident_->isValid()) {
        out = resident_.get();
        return ErrorInfo::ok();
    }

    disposeResidentLocked(events);

    if (!setup) {
        return ErrorInfo::error(ErrorCode::NOT_INITIALIZED,
            std::string("No setup for capability: ") + capabilityKindToString(kind));
    }

    std::cout << "[Arbiter] Loading " << capabilityKindToString(kind) << std::endl;
    events.emplace_back(kind, LifecycleEvent::INITIALIZING);
    ++setup_count_;

    std::unique_ptr<ICapability> created;
    ErrorInfo err = ErrorInfo::ok();
    try {
        err = setup(created);
    } catch (const std::bad_alloc& e) {
        err = ErrorInfo::error(ErrorCode::OUT_OF_MEMORY, OUT_OF_MEMORY_MESSAGE, e.what());
    } catch (const std::exception& e) {
        err = ErrorInfo::error(ErrorCode::INTERNAL_ERROR, e.what());
    }

    if (!err.isOk()) {
        if (err.code == ErrorCode::OUT_OF_MEMORY || isAllocationFailure(err.message)) {
            std::string original = err.message == OUT_OF_MEMORY_MESSAGE ? err.detail : err.message;
            err = ErrorInfo::error(ErrorCode::OUT_OF_MEMORY, OUT_OF_MEMORY_MESSAGE, original);
        }
        std::cerr << "[Arbiter] Failed to load " << capabilityKindToString(kind) << ": "
                  << err.message;
        if (!err.detail.empty()) {
            std::cerr << " (" << err.detail << ")";
        }
        std::cerr << std::endl;
        return err;
    }
    if (!created) {
        return ErrorInfo::error(ErrorCode::INTERNAL_ERROR,
            std::string("Setup produced no capability: ") + capabilityKindToString(kind));
    }
    if (created->kind() != kind) {
        auto dispose_err = created->dispose();
        if (!dispose_err.isOk()) {
            std::cerr << "[Arbiter] Warning: " << dispose_err.message << std::endl;
        }
        return ErrorInfo::error(ErrorCode::INTERNAL_ERROR,
            std::string("Setup for ") + capabilityKindToString(kind) + " produced " +
            capabilityKindToString(created->kind()));
    }

    resident_ = std::move(created);
    out = resident_.get();
    events.emplace_back(kind, LifecycleEvent::READY);
    std::cout << "[Arbiter] " << capabilityKindToString(kind) << " resident" << std::endl;
    return ErrorInfo::ok();
}

void ResourceArbiter::release() {
    PendingEvents events;
    LifecycleListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        disposeResidentLocked(events);
        listener = listener_;
    }
    fire(listener, events);
}

void ResourceArbiter::disposeResidentLocked(PendingEvents& events) {
    if (!resident_) {
        return;
    }

    CapabilityKind kind = resident_->kind();
    try {
        auto err = resident_->dispose();
        if (!err.isOk()) {
            std::cerr << "[Arbiter] Warning: dispose of " << capabilityKindToString(kind)
                      << " reported: " << err.message << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Arbiter] Warning: dispose of " << capabilityKindToString(kind)
                  << " threw: " << e.what() << std::endl;
    }

    // Residency is cleared whether or not dispose succeeded
    resident_.reset();
    ++dispose_count_;
    events.emplace_back(kind, LifecycleEvent::RELEASED);
    std::cout << "[Arbiter] Released " << capabilityKindToString(kind) << std::endl;
}

bool ResourceArbiter::hasResident() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resident_ != nullptr;
}

bool ResourceArbiter::residentKind(CapabilityKind& kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!resident_) {
        return false;
    }
    kind = resident_->kind();
    return true;
}

void ResourceArbiter::setLifecycleListener(LifecycleListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

int ResourceArbiter::getDisposeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dispose_count_;
}

int ResourceArbiter::getSetupCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return setup_count_;
}

void ResourceArbiter::fire(const LifecycleListener& listener, const PendingEvents& events) {
    if (!listener) {
        return;
    }
    for (const auto& event : events) {
        listener(event.first, event.second);
    }
}

}  // namespace voice
