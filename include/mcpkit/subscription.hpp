#pragma once
#include <set>
#include <shared_mutex>
#include <string>

namespace mcpkit {

/// URIs the peer has subscribed to.
class SubscriptionSet {
public:
    /// Returns false if `uri` was already present.
    bool add(const std::string& uri);

    /// Returns false if `uri` was not present.
    bool remove(const std::string& uri);

    bool contains(const std::string& uri) const;
    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::set<std::string> uris_;
};

} // namespace mcpkit
