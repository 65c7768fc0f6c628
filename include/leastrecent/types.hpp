#pragma once

#include <optional>
#include <string>

namespace leastrecent {

// What happens when an eviction handler throws.
enum class HandlerFailurePolicy {
    kPropagate,      // rethrow to the caller of Set() once the entry is committed
    kLogAndContinue, // log the std::exception and keep delivering
};

struct Options {
    // Left empty, the default comes from LEAST_RECENT_HANDLER_POLICY and
    // then kPropagate. See settings.hpp.
    std::optional<HandlerFailurePolicy> handler_failure_policy;
};

enum class OutcomeKind {
    kOverwritten,
    kEvicted,
};

// Result of SetWithOutcome() when a value was displaced.
template <typename K, typename V>
struct SetOutcome {
    OutcomeKind kind;
    K key;
    V value;

    bool evicted() const { return kind == OutcomeKind::kEvicted; }
};

HandlerFailurePolicy ParseHandlerFailurePolicy(const std::string& name);
std::string ToString(HandlerFailurePolicy policy);

} // namespace leastrecent
