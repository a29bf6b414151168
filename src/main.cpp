#include "SentimentHttpServer.hpp"
#include "sentiment/Config.hpp"
#include "sentiment/Lexicon.hpp"
#include "sentiment/Log.hpp"
#include <iostream>

int main() {
    try {
        auto config = sentiment::ServerConfig::fromEnvironment();
        sentiment::log::setLevel(config.logLevel);

        SentimentHttpServer app(config.host, config.port, sentiment::Lexicon::defaults());
        sentiment::log::info("Starting server...");
        app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "Fatal unknown error\n";
        return 1;
    }
    return 0;
}
