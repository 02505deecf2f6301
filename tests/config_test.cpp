// tests/config_test.cpp
// Configuration builder, client construction and session tests.

#include <gtest/gtest.h>
#include "telemetrydeck/client.hpp"
#include "telemetrydeck/config.hpp"
#include "telemetrydeck/parameters.hpp"
#include "telemetrydeck/version.hpp"
#include "mock_http.hpp"

#include <cctype>
#include <chrono>
#include <memory>
#include <string>

using namespace telemetrydeck;

namespace {

const char* APP_ID = "A1B2C3D4-E5F6-7890-ABCD-EF1234567890";

// Offline client: mock transport, loop that nobody runs.
std::unique_ptr<TelemetryDeck> make_client(TelemetryDeckConfigBuilder builder) {
    auto config = builder
        .http_client(std::make_shared<MockHttpClient>())
        .executor(std::make_shared<EventLoop>())
        .build();
    return TelemetryDeck::create(std::move(config));
}

bool is_uuid_v4(const std::string& s) {
    if (s.size() != 36) return false;
    for (size_t i = 0; i < s.size(); i++) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(s[i])) ||
                   std::isupper(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    if (s[14] != '4') return false;
    char variant = s[19];
    return variant == '8' || variant == '9' || variant == 'a' || variant == 'b';
}

} // namespace

// ==================== Builder ====================

TEST(ConfigTest, Defaults) {
    auto config = TelemetryDeckConfig::create(APP_ID);
    EXPECT_EQ(config.app_id(), APP_ID);
    EXPECT_FALSE(config.namespace_name().has_value());
    EXPECT_FALSE(config.salt().has_value());
    EXPECT_TRUE(config.params().empty());
    EXPECT_EQ(config.network_timeout(), std::chrono::milliseconds(30000));
    EXPECT_EQ(config.http_client(), nullptr);
    EXPECT_EQ(config.executor(), nullptr);
}

TEST(ConfigTest, BuilderSetsValues) {
    auto http = std::make_shared<MockHttpClient>();
    auto loop = std::make_shared<EventLoop>();
    auto config = TelemetryDeckConfig::builder(APP_ID)
        .namespace_name("acme")
        .salt("pepper")
        .params(Params{{"platform", "linux"}})
        .param("build", "42")
        .network_timeout(std::chrono::milliseconds(1500))
        .http_client(http)
        .executor(loop)
        .build();

    EXPECT_EQ(config.namespace_name(), std::optional<std::string>("acme"));
    EXPECT_EQ(config.salt(), std::optional<std::string>("pepper"));
    EXPECT_EQ(config.params().get("platform"), "linux");
    EXPECT_EQ(config.params().get("build"), "42");
    EXPECT_EQ(config.network_timeout(), std::chrono::milliseconds(1500));
    EXPECT_EQ(config.http_client(), http);
    EXPECT_EQ(config.executor(), loop);
}

TEST(ConfigTest, ParamsReplacesEarlierParams) {
    auto config = TelemetryDeckConfig::builder(APP_ID)
        .param("old", "1")
        .params(Params{{"new", "2"}})
        .build();
    EXPECT_FALSE(config.params().contains("old"));
    EXPECT_EQ(config.params().get("new"), "2");
}

TEST(ConfigTest, NonPositiveTimeoutRejected) {
    for (auto ms : {0, -1}) {
        try {
            TelemetryDeckConfig::builder(APP_ID)
                .network_timeout(std::chrono::milliseconds(ms))
                .build();
            FAIL() << "expected configuration error for " << ms << "ms";
        } catch (const TelemetryDeckError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::Configuration);
        }
    }
}

// ==================== Client construction ====================

TEST(ClientConfigTest, CreateWithAppIdOnly) {
    auto client = TelemetryDeck::create(APP_ID);
    EXPECT_EQ(client->app_id(), APP_ID);
    EXPECT_EQ(client->url(), "https://nom.telemetrydeck.com/v2/");
}

TEST(ClientConfigTest, ExposesConfiguration) {
    auto client = make_client(TelemetryDeckConfig::builder(APP_ID).salt("pepper"));
    EXPECT_EQ(client->app_id(), APP_ID);
    EXPECT_FALSE(client->namespace_name().has_value());
    EXPECT_EQ(client->salt(), std::optional<std::string>("pepper"));
}

TEST(ClientConfigTest, DefaultUrl) {
    auto client = make_client(TelemetryDeckConfig::builder(APP_ID));
    EXPECT_EQ(client->url(), std::string(BASE_URL) + "/v2/");
}

TEST(ClientConfigTest, NamespacedUrl) {
    auto client = make_client(TelemetryDeckConfig::builder(APP_ID).namespace_name("acme"));
    EXPECT_EQ(client->namespace_name(), std::optional<std::string>("acme"));
    EXPECT_EQ(client->url(), "https://nom.telemetrydeck.com/v2/namespace/acme/");
}

TEST(ClientConfigTest, VersionMarkerInjected) {
    auto client = make_client(TelemetryDeckConfig::builder(APP_ID));
    EXPECT_EQ(client->default_params().size(), 1u);
    EXPECT_EQ(client->default_params().get(CLIENT_VERSION_KEY), VERSION);
}

TEST(ClientConfigTest, CallerParamsKeptBesideMarker) {
    auto client = make_client(TelemetryDeckConfig::builder(APP_ID).param("platform", "linux"));
    EXPECT_EQ(client->default_params().size(), 2u);
    EXPECT_EQ(client->default_params().get("platform"), "linux");
    EXPECT_EQ(client->default_params().get(CLIENT_VERSION_KEY), VERSION);
}

TEST(ClientConfigTest, CallerCannotMaskVersionMarker) {
    auto client = make_client(
        TelemetryDeckConfig::builder(APP_ID).param(CLIENT_VERSION_KEY, "0.0.0-fake"));
    EXPECT_EQ(client->default_params().get(CLIENT_VERSION_KEY), VERSION);
}

TEST(ClientConfigTest, MovedClientKeepsState) {
    auto client = make_client(TelemetryDeckConfig::builder(APP_ID).namespace_name("acme"));
    std::string session = client->session_id();

    TelemetryDeck moved(std::move(*client));
    EXPECT_EQ(moved.session_id(), session);
    EXPECT_EQ(moved.url(), "https://nom.telemetrydeck.com/v2/namespace/acme/");
}

// ==================== Session ====================

TEST(SessionTest, InitialSessionIsUuidV4) {
    auto client = make_client(TelemetryDeckConfig::builder(APP_ID));
    EXPECT_TRUE(is_uuid_v4(client->session_id())) << client->session_id();
}

TEST(SessionTest, ClientsGetDistinctSessions) {
    auto a = make_client(TelemetryDeckConfig::builder(APP_ID));
    auto b = make_client(TelemetryDeckConfig::builder(APP_ID));
    EXPECT_NE(a->session_id(), b->session_id());
}

TEST(SessionTest, ResetGeneratesFreshId) {
    auto client = make_client(TelemetryDeckConfig::builder(APP_ID));
    std::string before = client->session_id();
    client->reset_session();
    EXPECT_NE(client->session_id(), before);
    EXPECT_TRUE(is_uuid_v4(client->session_id()));
}

TEST(SessionTest, ResetToExplicitId) {
    auto client = make_client(TelemetryDeckConfig::builder(APP_ID));
    client->reset_session(std::string("my-session"));
    EXPECT_EQ(client->session_id(), "my-session");
}

TEST(SessionTest, ResetToEmptyIdIsAccepted) {
    auto client = make_client(TelemetryDeckConfig::builder(APP_ID));
    client->reset_session(std::string());
    EXPECT_EQ(client->session_id(), "");
}
