#pragma once

#include <atomic>
#include <cstdint>

namespace message_retrieval {

// Counts messages accepted into the pipeline. Monotonic; never reset.
class ReceivedMessageCounter {
public:
    ReceivedMessageCounter() = default;
    ReceivedMessageCounter(const ReceivedMessageCounter&) = delete;
    ReceivedMessageCounter& operator=(const ReceivedMessageCounter&) = delete;

    // Returns the post-increment value
    uint64_t increment() noexcept;

    // Increments only while the count is below limit (0 = no limit).
    // Returns the post-increment value, or 0 if the limit was already reached.
    uint64_t incrementIfBelow(uint64_t limit) noexcept;

    uint64_t value() const noexcept;

private:
    std::atomic<uint64_t> count_{0};
};

} // namespace message_retrieval
