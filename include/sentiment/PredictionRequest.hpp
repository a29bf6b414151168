#pragma once

#include <string>

namespace sentiment {

struct PredictionRequest {
    static constexpr const char* kMissingTextMessage = "missing text field";
    static constexpr const char* kInvalidTextMessage = "text must be a non-empty string";

    std::string text;

    // Parse and validate a /predict body. Checks run in order and the first
    // failure is thrown as RequestError:
    //   no body, non-JSON content type, unparseable, not an object, no "text"
    //     -> MalformedRequest
    //   "text" not a string, or blank after trimming -> InvalidField
    // The returned text is the raw, untrimmed value.
    static PredictionRequest fromBody(const std::string& body, const std::string& contentType);
};

// Content-Type check matching application/json and its +json variants.
bool isJsonContentType(const std::string& contentType);

} // namespace sentiment
