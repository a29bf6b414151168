#include "sentiment/Config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace sentiment {

int parsePort(const std::string& value) {
    std::size_t pos = 0;
    long port = 0;
    try {
        port = std::stol(value, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error("PORT must be an integer, got '" + value + "'");
    }
    if (pos != value.size()) {
        throw std::runtime_error("PORT must be an integer, got '" + value + "'");
    }
    if (port < 1 || port > 65535) {
        throw std::runtime_error("PORT out of range: " + value);
    }
    return static_cast<int>(port);
}

ServerConfig ServerConfig::fromEnvironment() {
    ServerConfig cfg;

    // Empty values keep the defaults
    if (const char* envHost = std::getenv("HOST")) {
        if (*envHost) cfg.host = envHost;
    }
    if (const char* envPort = std::getenv("PORT")) {
        if (*envPort) cfg.port = parsePort(envPort);
    }
    if (const char* envLevel = std::getenv("LOG_LEVEL")) {
        std::string v(envLevel);
        if (!v.empty() && !log::parseLevel(v, cfg.logLevel)) {
            throw std::runtime_error("LOG_LEVEL must be one of debug, info, warning, error; got '" + v + "'");
        }
    }

    return cfg;
}

} // namespace sentiment
