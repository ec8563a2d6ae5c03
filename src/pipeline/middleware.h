#pragma once
#include "semantic/ports.h"

// Hook around the translator. Requests pass the middlewares in registration
// order after decoding; responses and client-bound stream frames pass them
// in reverse order before encoding. Returning a failure rejects the request,
// or ends the stream with an error chunk.
class IPipelineMiddleware {
public:
    virtual ~IPipelineMiddleware() = default;
    virtual QString name() const = 0;

    // Runs before the backend request is built; target.resolved is
    // empty until model routing has run.
    virtual Result<SemanticRequest> onRequest(SemanticRequest request) {
        return request;
    }
    virtual Result<SemanticResponse> onResponse(SemanticResponse response) {
        return response;
    }
    // Sees frames already shaped by the stream state machine.
    virtual Result<StreamFrame> onFrame(StreamFrame frame) {
        return frame;
    }
};
