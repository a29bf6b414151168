#pragma once

#include <string>
#include "httplib.h"
#include "sentiment/Classifier.hpp"
#include "sentiment/Lexicon.hpp"
#include <nlohmann/json.hpp>

class SentimentHttpServer {
public:
    static constexpr const char* kServiceName = "ML Sentiment Inference API";
    static constexpr const char* kVersion = "1.0.0";

    SentimentHttpServer(std::string host, int port,
                        sentiment::Lexicon lexicon = sentiment::Lexicon::defaults());

    // Blocks until stop() is called. Throws std::runtime_error if the
    // address cannot be bound or the accept loop fails.
    void run();

    // Binds an ephemeral port on host and returns it; serve with listenAfterBind().
    int bindToAnyPort();
    bool listenAfterBind();
    bool isRunning() const;
    void stop();

    static nlohmann::json serviceInfo();

private:
    void setupRoutes();

    std::string host_;
    int port_;
    httplib::Server server_;
    sentiment::Classifier classifier_;
};
