#include "mcpkit/progress.hpp"
#include <algorithm>

namespace mcpkit {

ProgressSender::ProgressSender(std::optional<ProgressToken> token, NotificationSender sender)
    : token_(std::move(token)), sender_(std::move(sender)) {}

bool ProgressSender::send(double progress,
                          std::optional<std::string> message,
                          std::optional<uint64_t> total) const {
    if (!token_) return false;
    ProgressNotification n;
    n.progress_token = *token_;
    n.progress = std::clamp(progress, 0.0, 1.0);
    n.message = std::move(message);
    n.total = total;
    return sender_.send(std::move(n));
}

} // namespace mcpkit
