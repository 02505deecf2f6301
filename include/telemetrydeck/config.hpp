// include/telemetrydeck/config.hpp
// Client configuration with builder pattern.

#pragma once

#include "error.hpp"
#include "executor.hpp"
#include "http.hpp"
#include "params.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace telemetrydeck {

class TelemetryDeckConfigBuilder;

// Configuration for a TelemetryDeck client.
class TelemetryDeckConfig {
public:
    static TelemetryDeckConfigBuilder builder(const std::string& app_id);

    // All defaults: no namespace, no salt, no default parameters.
    static TelemetryDeckConfig create(const std::string& app_id);

    const std::string& app_id() const noexcept { return app_id_; }
    const std::optional<std::string>& namespace_name() const noexcept { return namespace_name_; }
    const std::optional<std::string>& salt() const noexcept { return salt_; }
    const Params& params() const noexcept { return params_; }
    std::chrono::milliseconds network_timeout() const noexcept { return network_timeout_; }

    // Null when the client should use its built-in default.
    const std::shared_ptr<HttpClient>& http_client() const noexcept { return http_client_; }
    const std::shared_ptr<Executor>& executor() const noexcept { return executor_; }

private:
    friend class TelemetryDeckConfigBuilder;

    std::string app_id_;
    std::optional<std::string> namespace_name_;
    std::optional<std::string> salt_;
    Params params_;
    std::chrono::milliseconds network_timeout_{30000};
    std::shared_ptr<HttpClient> http_client_;
    std::shared_ptr<Executor> executor_;
};

// Fluent builder for TelemetryDeckConfig.
class TelemetryDeckConfigBuilder {
public:
    explicit TelemetryDeckConfigBuilder(const std::string& app_id);

    // Route signals to {base}/v2/namespace/{name}/. Not escaped.
    TelemetryDeckConfigBuilder& namespace_name(std::string name);
    // Appended to every user identifier before hashing.
    TelemetryDeckConfigBuilder& salt(std::string salt);
    TelemetryDeckConfigBuilder& params(Params params);
    TelemetryDeckConfigBuilder& param(const std::string& key, const std::string& value);
    TelemetryDeckConfigBuilder& network_timeout(std::chrono::milliseconds timeout);
    TelemetryDeckConfigBuilder& http_client(std::shared_ptr<HttpClient> client);
    TelemetryDeckConfigBuilder& executor(std::shared_ptr<Executor> executor);

    // Build the config. Throws TelemetryDeckError on invalid settings.
    TelemetryDeckConfig build() const;

private:
    TelemetryDeckConfig config_;
};

} // namespace telemetrydeck
