#pragma once
#include "notification.hpp"
#include <optional>
#include <string>

namespace mcpkit {

/// Handed to a cancellable call so capability code can report progress.
/// Without a token every send() is a no-op, so callers may report
/// unconditionally.
class ProgressSender {
public:
    ProgressSender() = default;
    ProgressSender(std::optional<ProgressToken> token, NotificationSender sender);

    /// Enqueue a progress notification; `progress` is clamped to [0, 1].
    /// Returns true only if something was enqueued.
    bool send(double progress,
              std::optional<std::string> message = std::nullopt,
              std::optional<uint64_t> total = std::nullopt) const;

    bool has_token() const { return token_.has_value(); }
    const std::optional<ProgressToken>& token() const { return token_; }

private:
    std::optional<ProgressToken> token_;
    NotificationSender sender_;
};

} // namespace mcpkit
