#pragma once

#include "message_retrieval/types.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace message_retrieval {

/**
 * @brief Externally owned cancellation signal (Ctrl+C, timeouts, tests)
 *
 * Callbacks run on the thread that calls cancel(), exactly once each.
 */
class CancellationSource {
public:
    using Callback = std::function<void()>;

    /**
     * @brief Keeps a callback registered; unregisters on destruction
     *
     * Destruction waits for a callback that is currently running, so the
     * callback's captures may be released right after.
     */
    class Registration {
    public:
        Registration() = default;
        Registration(CancellationSource* source, uint64_t id) : source_(source), id_(id) {}
        Registration(Registration&& other) noexcept;
        Registration& operator=(Registration&& other) noexcept;
        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;
        ~Registration();

        void reset();

    private:
        CancellationSource* source_ = nullptr;
        uint64_t id_ = 0;
    };

    CancellationSource() = default;
    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    // Idempotent
    void cancel();
    bool isCancelled() const noexcept;

    // Runs callback immediately if already cancelled
    Registration onCancel(Callback callback);

private:
    mutable std::mutex mutex_;
    std::atomic<bool> cancelled_{false};
    std::map<uint64_t, Callback> callbacks_;
    uint64_t nextId_ = 1;

    void unregister(uint64_t id);
};

enum class CoordinatorState {
    Running,
    ShuttingDown,
    Closed
};

/**
 * @brief One-shot shutdown latch shared by the count limit and user cancellation
 *
 * Whichever trigger arrives first runs the shutdown action; later triggers are
 * no-ops. State moves Running -> ShuttingDown -> Closed.
 */
class CancellationCoordinator {
public:
    using ShutdownAction = std::function<void(ShutdownReason)>;

    CancellationCoordinator() = default;
    explicit CancellationCoordinator(ShutdownAction action);

    CancellationCoordinator(const CancellationCoordinator&) = delete;
    CancellationCoordinator& operator=(const CancellationCoordinator&) = delete;

    // Must be set before the first trigger
    void setShutdownAction(ShutdownAction action);

    /**
     * @brief Request shutdown
     * @return true if this call performed the transition
     */
    bool trigger(ShutdownReason reason);

    bool isSignaled() const noexcept;
    ShutdownReason reason() const noexcept;
    CoordinatorState state() const noexcept;
    bool cancelledByUser() const noexcept;

private:
    ShutdownAction action_;
    std::atomic<ShutdownReason> reason_{ShutdownReason::None};
    std::atomic<CoordinatorState> state_{CoordinatorState::Running};
};

std::string coordinatorStateToString(CoordinatorState state);

} // namespace message_retrieval
