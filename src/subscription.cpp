#include "mcpkit/subscription.hpp"
#include <mutex>

namespace mcpkit {

bool SubscriptionSet::add(const std::string& uri) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return uris_.insert(uri).second;
}

bool SubscriptionSet::remove(const std::string& uri) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return uris_.erase(uri) > 0;
}

bool SubscriptionSet::contains(const std::string& uri) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return uris_.count(uri) > 0;
}

size_t SubscriptionSet::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return uris_.size();
}

} // namespace mcpkit
