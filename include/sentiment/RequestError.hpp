#pragma once

#include <stdexcept>
#include <string>

namespace sentiment {

// Validation failure for a client request. Always reported as HTTP 400.
class RequestError : public std::runtime_error {
public:
    enum class Kind {
        MalformedRequest, // body missing, unparseable, or without the required field
        InvalidField      // field present but of the wrong type or empty
    };

    RequestError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }
    int httpStatus() const { return 400; }

private:
    Kind kind_;
};

} // namespace sentiment
