#include "bus/events.hpp"

#include "utils/common.hpp"

namespace courier::bus {

const char* ToString(Channel channel) {
    switch (channel) {
        case Channel::kWhatsApp: return "WHATSAPP";
        case Channel::kTelegram: return "TELEGRAM";
        case Channel::kInstagram: return "INSTAGRAM";
        case Channel::kInternal: return "INTERNAL";
    }
    return "INTERNAL";
}

std::optional<Channel> ParseChannel(const std::string& value) {
    const auto upper = courier::utils::ToUpper(value);
    if (upper == "WHATSAPP") {
        return Channel::kWhatsApp;
    }
    if (upper == "TELEGRAM") {
        return Channel::kTelegram;
    }
    if (upper == "INSTAGRAM") {
        return Channel::kInstagram;
    }
    if (upper == "INTERNAL") {
        return Channel::kInternal;
    }
    return std::nullopt;
}

}  // namespace courier::bus
