#include "sentiment/PredictionRequest.hpp"

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include "sentiment/Analyzer.hpp"
#include "sentiment/RequestError.hpp"

using json = nlohmann::json;

namespace sentiment {

bool isJsonContentType(const std::string& contentType) {
    std::string ct(contentType);
    std::transform(ct.begin(), ct.end(), ct.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto semi = ct.find(';');
    if (semi != std::string::npos) ct.resize(semi);
    while (!ct.empty() && std::isspace(static_cast<unsigned char>(ct.back()))) ct.pop_back();

    if (ct == "application/json") return true;
    return ct.size() > 5 && ct.compare(ct.size() - 5, 5, "+json") == 0;
}

PredictionRequest PredictionRequest::fromBody(const std::string& body, const std::string& contentType) {
    if (body.empty() || !isJsonContentType(contentType)) {
        throw RequestError(RequestError::Kind::MalformedRequest, kMissingTextMessage);
    }

    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error&) {
        throw RequestError(RequestError::Kind::MalformedRequest, kMissingTextMessage);
    }

    if (!j.is_object() || !j.contains("text")) {
        throw RequestError(RequestError::Kind::MalformedRequest, kMissingTextMessage);
    }

    const auto& text = j["text"];
    if (!text.is_string()) {
        throw RequestError(RequestError::Kind::InvalidField, kInvalidTextMessage);
    }

    PredictionRequest req;
    req.text = text.get<std::string>();
    if (Analyzer::isBlank(req.text)) {
        throw RequestError(RequestError::Kind::InvalidField, kInvalidTextMessage);
    }
    return req;
}

} // namespace sentiment
