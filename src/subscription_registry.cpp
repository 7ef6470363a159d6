#include "subscription_registry.hpp"
#include <utility>

namespace stomp {
namespace internal {

const Subscription* SubscriptionRegistry::FindByDestination(const std::string& destination) const {
    auto it = by_destination_.find(destination);
    return it != by_destination_.end() ? &it->second : nullptr;
}

const Subscription* SubscriptionRegistry::FindById(const std::string& id) const {
    for (const auto& [destination, subscription] : by_destination_) {
        if (subscription.id == id) {
            return &subscription;
        }
    }
    return nullptr;
}

bool SubscriptionRegistry::Add(Subscription subscription) {
    std::string destination = subscription.destination;
    return by_destination_.emplace(std::move(destination), std::move(subscription)).second;
}

std::optional<Subscription> SubscriptionRegistry::RemoveById(const std::string& id) {
    for (auto it = by_destination_.begin(); it != by_destination_.end(); ++it) {
        if (it->second.id == id) {
            Subscription removed = std::move(it->second);
            by_destination_.erase(it);
            return removed;
        }
    }
    return std::nullopt;
}

} // namespace internal
} // namespace stomp
