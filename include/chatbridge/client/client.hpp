#pragma once

#include <memory>

#include "chatbridge/client/messages.hpp"
#include "chatbridge/core/config.hpp"
#include "chatbridge/core/logger.hpp"

namespace chatbridge::client {

/// Maps client settings onto transport settings, adding the bearer
/// authorization header.
auto make_http_config(const ClientConfig& config) -> infra::HttpClientConfig;

/// Entry point: owns the configuration and the transport.
///
///     chatbridge::client::Client client(chatbridge::load_config_from_env());
///     auto message = client.messages().create(params);
class Client {
public:
    explicit Client(ClientConfig config);
    Client(ClientConfig config, LoggerPtr logger);

    [[nodiscard]] auto config() const noexcept -> const ClientConfig& { return config_; }
    auto messages() -> Messages& { return messages_; }

private:
    ClientConfig config_;
    LoggerPtr logger_;
    Messages messages_;
};

} // namespace chatbridge::client
