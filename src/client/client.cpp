#include "chatbridge/client/client.hpp"

namespace chatbridge::client {

auto make_http_config(const ClientConfig& config) -> infra::HttpClientConfig {
    infra::HttpClientConfig http{
        .base_url = config.base_url,
        .timeout_seconds = config.timeout_seconds,
        .max_retries = config.max_retries,
        .default_headers = config.default_headers,
    };
    if (!config.api_key.empty()) {
        http.default_headers["Authorization"] = "Bearer " + config.api_key;
    }
    return http;
}

Client::Client(ClientConfig config)
    : Client(config, Logger::create("chatbridge", config.log_level)) {}

Client::Client(ClientConfig config, LoggerPtr logger)
    : config_(std::move(config)),
      logger_(std::move(logger)),
      messages_(std::make_shared<infra::HttpClient>(make_http_config(config_), logger_), logger_) {
    if (config_.api_key.empty()) {
        logger_->warn("No API key configured; requests are sent without authorization");
    }
    logger_->info("Client ready for {}", config_.base_url);
}

} // namespace chatbridge::client
