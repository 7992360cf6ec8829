#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "channels/channel_adapter.hpp"
#include "channels/simulated_channel_adapter.hpp"
#include "config/config_schema.hpp"

namespace courier::channels {

// Maps each external channel to the adapter that delivers on it.
class ChannelRegistry {
public:
    ChannelRegistry() = default;
    ChannelRegistry(const courier::config::ChannelsConfig& config,
                    courier::scheduler::DelayedScheduler* scheduler,
                    SimulatedChannelAdapter::ReceiptSink on_receipt);

    void Register(std::unique_ptr<ChannelAdapter> adapter);
    ChannelAdapter* GetAdapter(courier::bus::Channel channel) const;
    bool Has(courier::bus::Channel channel) const;
    std::vector<courier::bus::Channel> Channels() const;

    std::map<courier::bus::Channel, ValidationResult> ValidateAll();

private:
    void RegisterConnector(courier::bus::Channel channel,
                           const courier::config::ConnectorConfig& config,
                           courier::scheduler::DelayedScheduler* scheduler,
                           const SimulatedChannelAdapter::ReceiptSink& on_receipt);

    std::map<courier::bus::Channel, std::unique_ptr<ChannelAdapter>> adapters_;
};

}  // namespace courier::channels
