#pragma once

#include <stdexcept>
#include <string>

#include "bus/events.hpp"

namespace tfbot::collaborators {

class CollaboratorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Produces the response for one accepted event. Called once per lifecycle,
// never retried. Failures are reported as CollaboratorError.
class Collaborator {
public:
    virtual ~Collaborator() = default;
    virtual bus::ResponsePayload Process(const bus::InboundEvent& event, const std::string& query) = 0;
};

}  // namespace tfbot::collaborators
