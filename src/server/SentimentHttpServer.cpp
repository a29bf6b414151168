#include "SentimentHttpServer.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>
#include "sentiment/Log.hpp"
#include "sentiment/PredictionRequest.hpp"
#include "sentiment/RequestError.hpp"

using json = nlohmann::json;

SentimentHttpServer::SentimentHttpServer(std::string host, int port, sentiment::Lexicon lexicon)
    : host_(std::move(host)), port_(port), classifier_(std::move(lexicon)) {
    setupRoutes();
}

void SentimentHttpServer::run() {
    if (!server_.bind_to_port(host_.c_str(), port_)) {
        throw std::runtime_error("cannot bind " + host_ + ":" + std::to_string(port_));
    }
    std::ostringstream msg;
    msg << "Sentiment HTTP server listening on " << host_ << ":" << port_;
    sentiment::log::info(msg.str());
    if (!server_.listen_after_bind()) {
        throw std::runtime_error("server on " + host_ + ":" + std::to_string(port_) + " stopped accepting connections");
    }
}

int SentimentHttpServer::bindToAnyPort() {
    port_ = server_.bind_to_any_port(host_.c_str());
    if (port_ < 0) {
        throw std::runtime_error("cannot bind any port on " + host_);
    }
    return port_;
}

bool SentimentHttpServer::listenAfterBind() {
    return server_.listen_after_bind();
}

bool SentimentHttpServer::isRunning() const {
    return server_.is_running();
}

void SentimentHttpServer::stop() {
    server_.stop();
}

json SentimentHttpServer::serviceInfo() {
    return json{
        {"service", kServiceName},
        {"version", kVersion},
        {"endpoints", {
            {"/health", "GET  - Health check"},
            {"/predict", "POST - Sentiment prediction"}
        }}
    };
}

void SentimentHttpServer::setupRoutes() {

    auto err = [](const std::string& message) {
        return json{{"error", message}};
    };

    // Access log
    server_.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        if (!sentiment::log::enabled(sentiment::log::Level::Debug)) return;
        std::ostringstream line;
        line << req.method << " " << req.path << " -> " << res.status;
        sentiment::log::debug(line.str());
    });

    // Unmatched routes and transport-level failures still answer with JSON.
    server_.set_error_handler([err](const httplib::Request&, httplib::Response& res) {
        if (!res.body.empty()) return;
        std::string message = res.status == 404 ? "not found" : httplib::status_message(res.status);
        res.set_content(err(message).dump(), "application/json");
    });

    // --- HEALTH ---
    server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(json{{"status", "healthy"}}.dump(), "application/json");
    });

    // --- PREDICT ---
    server_.Post("/predict", [this, err](const httplib::Request& req, httplib::Response& res) {
        sentiment::PredictionRequest request;
        try {
            request = sentiment::PredictionRequest::fromBody(req.body, req.get_header_value("Content-Type"));
        }
        catch (const sentiment::RequestError& e) {
            sentiment::log::warning(std::string("Bad request: ") + e.what());
            res.status = e.httpStatus();
            res.set_content(err(e.what()).dump(), "application/json");
            return;
        }

        auto prediction = classifier_.classify(request.text);

        std::ostringstream line;
        line << "Prediction: " << sentiment::labelName(prediction.label)
             << " (confidence=" << std::fixed << std::setprecision(2) << prediction.confidence << ")";
        sentiment::log::info(line.str());

        json data = {
            {"label", sentiment::labelName(prediction.label)},
            {"confidence", prediction.confidence}
        };
        res.set_content(data.dump(), "application/json");
    });

    // --- ROOT ---
    server_.Get("/", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(serviceInfo().dump(), "application/json");
    });
}
