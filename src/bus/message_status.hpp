#pragma once

#include <optional>
#include <string>

namespace courier::bus {

// Declaration order is the rank order used for forward-only progression.
enum class MessageStatus {
    kPending,
    kReceived,
    kSent,
    kDelivered,
    kRead,
    kFailed
};

const char* ToString(MessageStatus status);
std::optional<MessageStatus> ParseMessageStatus(const std::string& value);

int Rank(MessageStatus status);
bool IsTerminal(MessageStatus status);
bool CanTransition(MessageStatus from, MessageStatus to);

}  // namespace courier::bus
