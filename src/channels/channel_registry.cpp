#include "channels/channel_registry.hpp"

#include "channels/http_channel_adapter.hpp"
#include "utils/logging.hpp"

namespace courier::channels {

ChannelRegistry::ChannelRegistry(const courier::config::ChannelsConfig& config,
                                 courier::scheduler::DelayedScheduler* scheduler,
                                 SimulatedChannelAdapter::ReceiptSink on_receipt) {
    RegisterConnector(courier::bus::Channel::kWhatsApp, config.whatsapp, scheduler, on_receipt);
    RegisterConnector(courier::bus::Channel::kTelegram, config.telegram, scheduler, on_receipt);
    RegisterConnector(courier::bus::Channel::kInstagram, config.instagram, scheduler, on_receipt);
}

void ChannelRegistry::Register(std::unique_ptr<ChannelAdapter> adapter) {
    const auto channel = adapter->ChannelName();
    adapters_.insert_or_assign(channel, std::move(adapter));
}

ChannelAdapter* ChannelRegistry::GetAdapter(courier::bus::Channel channel) const {
    auto it = adapters_.find(channel);
    if (it == adapters_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool ChannelRegistry::Has(courier::bus::Channel channel) const {
    return adapters_.count(channel) > 0;
}

std::vector<courier::bus::Channel> ChannelRegistry::Channels() const {
    std::vector<courier::bus::Channel> channels;
    for (const auto& [channel, _] : adapters_) {
        channels.push_back(channel);
    }
    return channels;
}

std::map<courier::bus::Channel, ValidationResult> ChannelRegistry::ValidateAll() {
    std::map<courier::bus::Channel, ValidationResult> results;
    for (auto& [channel, adapter] : adapters_) {
        results[channel] = adapter->ValidateCredentials();
    }
    return results;
}

void ChannelRegistry::RegisterConnector(courier::bus::Channel channel,
                                        const courier::config::ConnectorConfig& config,
                                        courier::scheduler::DelayedScheduler* scheduler,
                                        const SimulatedChannelAdapter::ReceiptSink& on_receipt) {
    if (!config.enabled) {
        return;
    }
    if (config.mode == "simulated") {
        Register(std::make_unique<SimulatedChannelAdapter>(channel, config, scheduler, on_receipt));
        return;
    }
    if (config.mode != "http") {
        courier::utils::LogWarn("channels", "unknown connector mode, using http", {
            {"channel", courier::bus::ToString(channel)},
            {"mode", config.mode}
        });
    }
    Register(std::make_unique<HttpChannelAdapter>(channel, config));
}

}  // namespace courier::channels
