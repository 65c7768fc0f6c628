#include "leastrecent/types.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace leastrecent {

HandlerFailurePolicy ParseHandlerFailurePolicy(const std::string& name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "propagate") {
        return HandlerFailurePolicy::kPropagate;
    }
    if (lowered == "log" || lowered == "log-and-continue") {
        return HandlerFailurePolicy::kLogAndContinue;
    }
    throw std::invalid_argument("Unknown handler failure policy: " + name);
}

std::string ToString(HandlerFailurePolicy policy) {
    switch (policy) {
    case HandlerFailurePolicy::kPropagate:
        return "propagate";
    case HandlerFailurePolicy::kLogAndContinue:
        return "log-and-continue";
    }
    return "unknown";
}

} // namespace leastrecent
