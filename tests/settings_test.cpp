#include "leastrecent/lru_cache.hpp"
#include "leastrecent/settings.hpp"
#include "leastrecent/types.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>

namespace leastrecent {
namespace {

class SettingsTest : public testing::Test {
protected:
    void SetUp() override { unsetenv(defaults::kHandlerPolicyEnv); }
    void TearDown() override { unsetenv(defaults::kHandlerPolicyEnv); }
};

TEST_F(SettingsTest, DefaultsToPropagate) {
    Options opts;
    ApplyOptionDefaults(opts);
    ASSERT_TRUE(opts.handler_failure_policy.has_value());
    EXPECT_EQ(*opts.handler_failure_policy, HandlerFailurePolicy::kPropagate);
}

TEST_F(SettingsTest, ReadsPolicyFromEnvironment) {
    setenv(defaults::kHandlerPolicyEnv, "log", 1);
    Options opts;
    ApplyOptionDefaults(opts);
    EXPECT_EQ(*opts.handler_failure_policy, HandlerFailurePolicy::kLogAndContinue);
}

TEST_F(SettingsTest, ExplicitOptionBeatsEnvironment) {
    setenv(defaults::kHandlerPolicyEnv, "log", 1);
    Options opts;
    opts.handler_failure_policy = HandlerFailurePolicy::kPropagate;
    ApplyOptionDefaults(opts);
    EXPECT_EQ(*opts.handler_failure_policy, HandlerFailurePolicy::kPropagate);
}

TEST_F(SettingsTest, UnknownPolicyInEnvironmentFallsBackToDefault) {
    setenv(defaults::kHandlerPolicyEnv, "ignore", 1);
    Options opts;
    EXPECT_NO_THROW(ApplyOptionDefaults(opts));
    ASSERT_TRUE(opts.handler_failure_policy.has_value());
    EXPECT_EQ(*opts.handler_failure_policy, defaults::kHandlerPolicy);
}

TEST_F(SettingsTest, UnknownPolicyInEnvironmentDoesNotBreakConstruction) {
    setenv(defaults::kHandlerPolicyEnv, "ignore", 1);
    EXPECT_NO_THROW((LRUCache<int, int>(3)));
    Options explicit_policy;
    explicit_policy.handler_failure_policy = HandlerFailurePolicy::kLogAndContinue;
    EXPECT_NO_THROW((LRUCache<int, int>(3, explicit_policy)));
}

TEST_F(SettingsTest, PolicyNamesRoundTrip) {
    EXPECT_EQ(ParseHandlerFailurePolicy("PROPAGATE"), HandlerFailurePolicy::kPropagate);
    EXPECT_EQ(ParseHandlerFailurePolicy("log-and-continue"), HandlerFailurePolicy::kLogAndContinue);
    EXPECT_EQ(ParseHandlerFailurePolicy(ToString(HandlerFailurePolicy::kLogAndContinue)),
              HandlerFailurePolicy::kLogAndContinue);
}

TEST_F(SettingsTest, GetEnvHelpers) {
    setenv("LEAST_RECENT_TEST_FLAG", "true", 1);
    EXPECT_TRUE(GetEnvBool("LEAST_RECENT_TEST_FLAG", false));
    EXPECT_EQ(GetEnv("LEAST_RECENT_TEST_FLAG", "x"), "true");
    unsetenv("LEAST_RECENT_TEST_FLAG");
    EXPECT_FALSE(GetEnvBool("LEAST_RECENT_TEST_FLAG", false));
    EXPECT_EQ(GetEnv("LEAST_RECENT_TEST_FLAG", "x"), "x");
}

} // namespace
} // namespace leastrecent
