#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "bus/events.hpp"

namespace courier::channels {

struct DeliveryOutcome {
    std::string message_id;
    std::string external_message_id;
    courier::bus::MessageStatus status = courier::bus::MessageStatus::kSent;
    long long timestamp_ms = 0;
};

struct ValidationResult {
    bool valid = false;
    std::string message;
    std::vector<std::string> errors;
    std::unordered_map<std::string, std::string> platform_info;
};

// One connector per external platform. Send() throws TransientError for
// failures worth retrying and PermanentError for everything else.
class ChannelAdapter {
public:
    virtual ~ChannelAdapter() = default;

    virtual courier::bus::Channel ChannelName() const = 0;
    virtual DeliveryOutcome Send(const courier::bus::MessageEvent& message,
                                 const courier::bus::ExternalIdentity& target) = 0;
    virtual ValidationResult ValidateCredentials() = 0;
};

}  // namespace courier::channels
