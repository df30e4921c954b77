#pragma once

#include "message_retrieval/closable_queue.hpp"
#include "message_retrieval/types.hpp"
#include "broker_client/channel.hpp"
#include <deque>

namespace message_retrieval {

// Sole writer of acknowledgments. Issues decisions one at a time in queue
// order; a failed acknowledgment is logged and the rest still go out.
//
// Requeue decisions (and anything queued behind one) are held until the ack
// queue is closed. The queue only closes once the consumer has been cancelled
// and the message queue drained, so a requeued message cannot come back to
// this same subscription and be retrieved twice.
class AckDispatcher {
public:
    explicit AckDispatcher(broker_client::IBrokerChannel& channel);

    AckStats run(ClosableQueue<AckDecision>& acks);

private:
    broker_client::IBrokerChannel& channel_;

    broker_client::Result<void> dispatch(const AckDecision& decision);
    void send(const AckDecision& decision, AckStats& stats);
};

} // namespace message_retrieval
