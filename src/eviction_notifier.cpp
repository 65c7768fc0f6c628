#include "leastrecent/eviction_notifier.hpp"

#include <iostream>

namespace leastrecent {

namespace detail {

void ReportHandlerFailure(const std::exception& error) {
    std::cerr << "[least_recent] eviction handler failed: " << error.what() << std::endl;
}

} // namespace detail

Subscription::Subscription(std::weak_ptr<detail::HandlerRegistry> registry, std::uint64_t id)
    : registry_(std::move(registry)), id_(id) {}

void Subscription::Unsubscribe() {
    if (auto registry = registry_.lock()) {
        registry->Remove(id_);
    }
    registry_.reset();
    id_ = 0;
}

bool Subscription::Active() const {
    return id_ != 0 && !registry_.expired();
}

} // namespace leastrecent
