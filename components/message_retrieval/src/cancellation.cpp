#include "message_retrieval/cancellation.hpp"
#include <spdlog/spdlog.h>

namespace message_retrieval {

// CancellationSource::Registration

CancellationSource::Registration::Registration(Registration&& other) noexcept
    : source_(other.source_), id_(other.id_) {
    other.source_ = nullptr;
    other.id_ = 0;
}

CancellationSource::Registration& CancellationSource::Registration::operator=(Registration&& other) noexcept {
    if (this != &other) {
        reset();
        source_ = other.source_;
        id_ = other.id_;
        other.source_ = nullptr;
        other.id_ = 0;
    }
    return *this;
}

CancellationSource::Registration::~Registration() {
    reset();
}

void CancellationSource::Registration::reset() {
    if (source_ != nullptr) {
        source_->unregister(id_);
        source_ = nullptr;
        id_ = 0;
    }
}

// CancellationSource

void CancellationSource::cancel() {
    // Callbacks run under the lock so unregister() waits for a running callback
    std::lock_guard<std::mutex> lock(mutex_);

    if (cancelled_.exchange(true)) {
        return;
    }

    spdlog::debug("Cancellation requested, notifying {} listener(s)", callbacks_.size());

    auto callbacks = std::move(callbacks_);
    callbacks_.clear();
    for (auto& [id, callback] : callbacks) {
        try {
            callback();
        } catch (const std::exception& e) {
            spdlog::error("Cancellation callback {} failed: {}", id, e.what());
        }
    }
}

bool CancellationSource::isCancelled() const noexcept {
    return cancelled_.load();
}

CancellationSource::Registration CancellationSource::onCancel(Callback callback) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (cancelled_) {
        lock.unlock();
        callback();
        return Registration();
    }

    uint64_t id = nextId_++;
    callbacks_.emplace(id, std::move(callback));
    return Registration(this, id);
}

void CancellationSource::unregister(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(id);
}

// CancellationCoordinator

CancellationCoordinator::CancellationCoordinator(ShutdownAction action)
    : action_(std::move(action)) {
}

void CancellationCoordinator::setShutdownAction(ShutdownAction action) {
    action_ = std::move(action);
}

bool CancellationCoordinator::trigger(ShutdownReason reason) {
    ShutdownReason expected = ShutdownReason::None;
    if (reason == ShutdownReason::None ||
        !reason_.compare_exchange_strong(expected, reason, std::memory_order_acq_rel)) {
        spdlog::trace("Shutdown already in progress ({}), ignoring {}",
                      shutdownReasonToString(expected), shutdownReasonToString(reason));
        return false;
    }

    state_ = CoordinatorState::ShuttingDown;
    spdlog::debug("Shutting down message retrieval: {}", shutdownReasonToString(reason));

    if (action_) {
        try {
            action_(reason);
        } catch (const std::exception& e) {
            spdlog::error("Shutdown action failed: {}", e.what());
        }
    }

    state_ = CoordinatorState::Closed;
    return true;
}

bool CancellationCoordinator::isSignaled() const noexcept {
    return reason_.load(std::memory_order_acquire) != ShutdownReason::None;
}

ShutdownReason CancellationCoordinator::reason() const noexcept {
    return reason_.load(std::memory_order_acquire);
}

CoordinatorState CancellationCoordinator::state() const noexcept {
    return state_.load();
}

bool CancellationCoordinator::cancelledByUser() const noexcept {
    return reason() == ShutdownReason::UserCancelled;
}

std::string coordinatorStateToString(CoordinatorState state) {
    switch (state) {
        case CoordinatorState::Running: return "Running";
        case CoordinatorState::ShuttingDown: return "ShuttingDown";
        case CoordinatorState::Closed: return "Closed";
        default: return "Unknown";
    }
}

} // namespace message_retrieval
