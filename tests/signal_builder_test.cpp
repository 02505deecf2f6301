// tests/signal_builder_test.cpp
// Unit tests for Signal construction.

#include <gtest/gtest.h>
#include "hasher.hpp"
#include "signal_builder.hpp"
#include "telemetrydeck/client.hpp"
#include "telemetrydeck/signals.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>
#include <vector>

using namespace telemetrydeck;

namespace {

struct Fixture {
    std::string app_id = "APP-1234";
    std::optional<std::string> salt;
    Params defaults{{"telemetryClientVersion", "9.9.9"}, {"platform", "linux"}};
    std::string session = "11111111-2222-4333-8444-555555555555";
    std::chrono::system_clock::time_point now =
        std::chrono::system_clock::time_point(std::chrono::milliseconds(1760000000123));

    SignalContext ctx() const { return SignalContext{app_id, salt, defaults, session}; }

    Signal build(const std::string& type,
                 const std::optional<std::string>& user = std::nullopt,
                 const Params& payload = Params(),
                 std::optional<bool> test_mode = std::nullopt,
                 std::optional<double> float_value = std::nullopt) const {
        return build_signal(ctx(), type, user, payload, test_mode, float_value, now);
    }
};

std::vector<std::string> sorted(std::vector<std::string> v) {
    std::sort(v.begin(), v.end());
    return v;
}

} // namespace

TEST(SignalBuilderTest, CopiesClientState) {
    Fixture f;
    auto s = f.build("appLaunched");
    EXPECT_EQ(s.app_id, "APP-1234");
    EXPECT_EQ(s.session_id, f.session);
    EXPECT_EQ(s.signal_type, "appLaunched");
    EXPECT_EQ(s.received_at, f.now);
}

TEST(SignalBuilderTest, AnonymousUsesPlaceholder) {
    Fixture f;
    auto s = f.build("appLaunched");
    EXPECT_EQ(s.client_user, DEFAULT_CLIENT_USER);
    EXPECT_EQ(s.client_user, "cpp");
}

TEST(SignalBuilderTest, UserIsHashed) {
    Fixture f;
    auto s = f.build("appLaunched", std::string("user@example.com"));
    EXPECT_EQ(s.client_user, hasher::hash_user("user@example.com"));
    EXPECT_EQ(s.client_user.size(), 64u);
    EXPECT_EQ(s.client_user.find("user@example.com"), std::string::npos);
}

TEST(SignalBuilderTest, UserIsHashedWithSalt) {
    Fixture f;
    f.salt = "pepper";
    auto s = f.build("appLaunched", std::string("alice"));
    EXPECT_EQ(s.client_user, hasher::hash_user("alicepepper"));
    EXPECT_NE(s.client_user, hasher::hash_user("alice"));
}

TEST(SignalBuilderTest, EmptyUserIsStillHashed) {
    Fixture f;
    auto s = f.build("appLaunched", std::string());
    EXPECT_EQ(s.client_user, hasher::hash_user(""));
}

TEST(SignalBuilderTest, PayloadMergesDefaults) {
    Fixture f;
    auto s = f.build("appLaunched", std::nullopt, Params{{"screen", "home"}});
    EXPECT_EQ(sorted(s.payload),
              (std::vector<std::string>{"platform:linux", "screen:home",
                                        "telemetryClientVersion:9.9.9"}));
}

TEST(SignalBuilderTest, CallPayloadOverridesDefaults) {
    Fixture f;
    auto s = f.build("appLaunched", std::nullopt, Params{{"platform", "wasm"}});
    EXPECT_EQ(sorted(s.payload),
              (std::vector<std::string>{"platform:wasm", "telemetryClientVersion:9.9.9"}));
}

TEST(SignalBuilderTest, PayloadKeysSanitized) {
    Fixture f;
    f.defaults = Params();
    auto s = f.build("appLaunched", std::nullopt, Params{{"a:b", "c:d"}});
    EXPECT_EQ(s.payload, (std::vector<std::string>{"a_b:c:d"}));
}

TEST(SignalBuilderTest, DefaultsNotMutated) {
    Fixture f;
    Params before = f.defaults;
    f.build("appLaunched", std::nullopt, Params{{"platform", "wasm"}, {"extra", "1"}});
    EXPECT_EQ(f.defaults, before);
}

TEST(SignalBuilderTest, TestModeDefaultsToFalse) {
    Fixture f;
    EXPECT_EQ(f.build("t").is_test_mode, "false");
    EXPECT_EQ(f.build("t", std::nullopt, Params(), false).is_test_mode, "false");
    EXPECT_EQ(f.build("t", std::nullopt, Params(), true).is_test_mode, "true");
}

TEST(SignalBuilderTest, FloatValueCarried) {
    Fixture f;
    EXPECT_FALSE(f.build("t").float_value.has_value());

    auto s = f.build("t", std::nullopt, Params(), std::nullopt, 42.5);
    ASSERT_TRUE(s.float_value.has_value());
    EXPECT_DOUBLE_EQ(*s.float_value, 42.5);
}

TEST(SignalBuilderTest, NonFiniteFloatValueCarried) {
    Fixture f;
    auto s = f.build("t", std::nullopt, Params(), std::nullopt, NAN);
    ASSERT_TRUE(s.float_value.has_value());
    EXPECT_TRUE(std::isnan(*s.float_value));
}

TEST(SignalBuilderTest, ReservedSignalTypeAccepted) {
    Fixture f;
    auto s = f.build(Signals::Session::STARTED);
    EXPECT_EQ(s.signal_type, "TelemetryDeck.Session.started");
}
