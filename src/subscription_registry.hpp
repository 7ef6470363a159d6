#ifndef STOMP_SUBSCRIPTION_REGISTRY_HPP
#define STOMP_SUBSCRIPTION_REGISTRY_HPP

#include "stomp/types.hpp"
#include <map>
#include <optional>
#include <string>

namespace stomp {
namespace internal {

/// Subscription tracked by the client
struct Subscription {
    std::string destination;
    std::string id;
    AckMode ack_mode;
};

/// Destination to subscription mapping; at most one subscription per destination
class SubscriptionRegistry {
public:
    /// Find the subscription of a destination
    const Subscription* FindByDestination(const std::string& destination) const;

    /// Find the subscription with an id
    const Subscription* FindById(const std::string& id) const;

    /// Track a subscription
    /// @return false if the destination is already subscribed (registry unchanged)
    bool Add(Subscription subscription);

    /// Stop tracking the subscription with an id
    /// @return The removed subscription, if the id was tracked
    std::optional<Subscription> RemoveById(const std::string& id);

    bool ContainsId(const std::string& id) const { return FindById(id) != nullptr; }
    size_t Size() const { return by_destination_.size(); }
    void Clear() { by_destination_.clear(); }

private:
    std::map<std::string, Subscription> by_destination_;
};

} // namespace internal
} // namespace stomp

#endif // STOMP_SUBSCRIPTION_REGISTRY_HPP
