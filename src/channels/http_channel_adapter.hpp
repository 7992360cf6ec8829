#pragma once

#include "channels/channel_adapter.hpp"
#include "config/config_schema.hpp"
#include "utils/http_client.hpp"

namespace courier::channels {

// Talks to a connector service: POST /v1/messages and GET /v1/credentials.
class HttpChannelAdapter : public ChannelAdapter {
public:
    HttpChannelAdapter(courier::bus::Channel channel, const courier::config::ConnectorConfig& config);

    courier::bus::Channel ChannelName() const override { return channel_; }
    DeliveryOutcome Send(const courier::bus::MessageEvent& message,
                         const courier::bus::ExternalIdentity& target) override;
    ValidationResult ValidateCredentials() override;

private:
    courier::bus::Channel channel_;
    courier::config::ConnectorConfig config_;
    courier::utils::ParsedUrl url_;
};

}  // namespace courier::channels
