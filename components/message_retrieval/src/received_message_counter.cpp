#include "message_retrieval/received_message_counter.hpp"

namespace message_retrieval {

uint64_t ReceivedMessageCounter::increment() noexcept {
    return count_.fetch_add(1, std::memory_order_acq_rel) + 1;
}

uint64_t ReceivedMessageCounter::incrementIfBelow(uint64_t limit) noexcept {
    if (limit == 0) {
        return increment();
    }

    uint64_t current = count_.load(std::memory_order_acquire);
    while (current < limit) {
        if (count_.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel)) {
            return current + 1;
        }
    }
    return 0;
}

uint64_t ReceivedMessageCounter::value() const noexcept {
    return count_.load(std::memory_order_acquire);
}

} // namespace message_retrieval
