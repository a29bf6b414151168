#pragma once

#include <string>
#include "sentiment/Log.hpp"

namespace sentiment {

struct ServerConfig {
    static constexpr int kDefaultPort = 5000;

    std::string host = "0.0.0.0";
    int port = kDefaultPort;
    log::Level logLevel = log::Level::Info;

    // Reads PORT, HOST and LOG_LEVEL. Unset or empty variables keep their
    // defaults; invalid values throw std::runtime_error naming the variable.
    static ServerConfig fromEnvironment();
};

// Strict decimal port parse, 1..65535. Throws std::runtime_error otherwise.
int parsePort(const std::string& value);

} // namespace sentiment
