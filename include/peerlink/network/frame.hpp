#pragma once

#include "peerlink/network/protocol.hpp"
#include "peerlink/core/result.hpp"

namespace peerlink::network {

// Anything that can put a frame on the wire toward one peer.
class FrameSink {
public:
    virtual ~FrameSink() = default;

    // Queues the frame. Fails with NOT_CONNECTED when there is no live socket.
    virtual core::Result send_frame(Frame frame) = 0;
};

// Receives the frames of one job, demultiplexed by job id.
class FrameHandler {
public:
    virtual ~FrameHandler() = default;

    virtual void on_frame(const Frame& frame) = 0;

    // The socket carrying this job went away.
    virtual void on_connection_lost() = 0;
};

}
