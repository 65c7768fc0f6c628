#pragma once

#include "types.hpp"

#include <string>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace leastrecent {

namespace defaults {
    constexpr char kHandlerPolicyEnv[] = "LEAST_RECENT_HANDLER_POLICY";
    constexpr HandlerFailurePolicy kHandlerPolicy = HandlerFailurePolicy::kPropagate;
}

inline std::string GetEnv(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

inline bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) return defaultValue;
    return std::string(value) == "1" || std::string(value) == "true" || std::string(value) == "TRUE";
}

// Fills every option the caller left unset. Explicit values always win over
// the environment; an unknown policy name falls back to the default.
inline void ApplyOptionDefaults(Options& opts) {
    if (opts.handler_failure_policy) {
        return;
    }
    opts.handler_failure_policy = defaults::kHandlerPolicy;
    const char* policy_env = std::getenv(defaults::kHandlerPolicyEnv);
    if (policy_env && *policy_env) {
        try {
            opts.handler_failure_policy = ParseHandlerFailurePolicy(policy_env);
        } catch (const std::invalid_argument& e) {
            std::cerr << "[least_recent] " << e.what() << "; using "
                      << ToString(defaults::kHandlerPolicy) << std::endl;
        }
    }
}

} // namespace leastrecent
