// src/config.cpp
// Configuration builder and preset.

#include "telemetrydeck/config.hpp"

namespace telemetrydeck {

// --- TelemetryDeckConfig ---

TelemetryDeckConfigBuilder TelemetryDeckConfig::builder(const std::string& app_id) {
    return TelemetryDeckConfigBuilder(app_id);
}

TelemetryDeckConfig TelemetryDeckConfig::create(const std::string& app_id) {
    return TelemetryDeckConfig::builder(app_id).build();
}

// --- TelemetryDeckConfigBuilder ---

TelemetryDeckConfigBuilder::TelemetryDeckConfigBuilder(const std::string& app_id) {
    config_.app_id_ = app_id;
}

TelemetryDeckConfigBuilder& TelemetryDeckConfigBuilder::namespace_name(std::string name) {
    config_.namespace_name_ = std::move(name);
    return *this;
}

TelemetryDeckConfigBuilder& TelemetryDeckConfigBuilder::salt(std::string salt) {
    config_.salt_ = std::move(salt);
    return *this;
}

TelemetryDeckConfigBuilder& TelemetryDeckConfigBuilder::params(Params params) {
    config_.params_ = std::move(params);
    return *this;
}

TelemetryDeckConfigBuilder& TelemetryDeckConfigBuilder::param(const std::string& key,
                                                              const std::string& value) {
    config_.params_.add(key, value);
    return *this;
}

TelemetryDeckConfigBuilder& TelemetryDeckConfigBuilder::network_timeout(std::chrono::milliseconds timeout) {
    config_.network_timeout_ = timeout;
    return *this;
}

TelemetryDeckConfigBuilder& TelemetryDeckConfigBuilder::http_client(std::shared_ptr<HttpClient> client) {
    config_.http_client_ = std::move(client);
    return *this;
}

TelemetryDeckConfigBuilder& TelemetryDeckConfigBuilder::executor(std::shared_ptr<Executor> executor) {
    config_.executor_ = std::move(executor);
    return *this;
}

TelemetryDeckConfig TelemetryDeckConfigBuilder::build() const {
    if (config_.network_timeout_.count() <= 0) {
        throw TelemetryDeckError::configuration(
            "network_timeout must be positive, got " +
            std::to_string(config_.network_timeout_.count()) + "ms");
    }
    return config_;
}

} // namespace telemetrydeck
