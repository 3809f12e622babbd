#pragma once

#include <gsp/protocol/StreamMessage.hpp>

namespace GSP::Interpreter {

/**
 * ClientRequestSink receives user-interaction events raised by the rendered
 * UI. The interpreter holds only a weak_ptr to it and locks it per request;
 * if the sink is gone the request is reported back as unsupported instead
 * of being dropped silently.
 */
struct ClientRequestSink {
    virtual ~ClientRequestSink() = default;

    virtual void deliver(Protocol::ClientRequest const& request) = 0;
};

} // namespace GSP::Interpreter
