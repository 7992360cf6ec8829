#pragma once

#include <string>

#include "bus/events.hpp"
#include "nlohmann/json.hpp"

namespace courier::bus {

// Decoders throw ValidationError on missing or malformed fields.
nlohmann::json ToJson(const MessageEvent& event);
MessageEvent MessageEventFromJson(const nlohmann::json& json);
std::string EncodeMessageEvent(const MessageEvent& event);
MessageEvent DecodeMessageEvent(const std::string& payload);

nlohmann::json ToJson(const StatusUpdate& update);
StatusUpdate StatusUpdateFromJson(const nlohmann::json& json);
std::string EncodeStatusUpdate(const StatusUpdate& update);
StatusUpdate DecodeStatusUpdate(const std::string& payload);

nlohmann::json ToJson(const DeadLetterEvent& dead_letter);
std::string EncodeDeadLetter(const DeadLetterEvent& dead_letter);

nlohmann::json ToJson(const ExternalIdentity& identity);
ExternalIdentity ExternalIdentityFromJson(const nlohmann::json& json);

}  // namespace courier::bus
