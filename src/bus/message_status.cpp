#include "bus/message_status.hpp"

#include "utils/common.hpp"

namespace courier::bus {

const char* ToString(MessageStatus status) {
    switch (status) {
        case MessageStatus::kPending: return "PENDING";
        case MessageStatus::kReceived: return "RECEIVED";
        case MessageStatus::kSent: return "SENT";
        case MessageStatus::kDelivered: return "DELIVERED";
        case MessageStatus::kRead: return "READ";
        case MessageStatus::kFailed: return "FAILED";
    }
    return "PENDING";
}

std::optional<MessageStatus> ParseMessageStatus(const std::string& value) {
    const auto upper = courier::utils::ToUpper(value);
    if (upper == "PENDING") {
        return MessageStatus::kPending;
    }
    if (upper == "RECEIVED") {
        return MessageStatus::kReceived;
    }
    if (upper == "SENT") {
        return MessageStatus::kSent;
    }
    if (upper == "DELIVERED") {
        return MessageStatus::kDelivered;
    }
    if (upper == "READ") {
        return MessageStatus::kRead;
    }
    if (upper == "FAILED") {
        return MessageStatus::kFailed;
    }
    return std::nullopt;
}

int Rank(MessageStatus status) {
    return static_cast<int>(status);
}

bool IsTerminal(MessageStatus status) {
    return status == MessageStatus::kRead
        || status == MessageStatus::kReceived
        || status == MessageStatus::kFailed;
}

bool CanTransition(MessageStatus from, MessageStatus to) {
    if (IsTerminal(from)) {
        return false;
    }
    if (to == MessageStatus::kFailed) {
        return true;
    }
    return Rank(to) > Rank(from);
}

}  // namespace courier::bus
