#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "channels/channel_adapter.hpp"
#include "config/config_schema.hpp"
#include "scheduler/delayed_scheduler.hpp"

namespace courier::channels {

// Local stand-in for a connector service. Every send is acknowledged as SENT
// and a receipt status is emitted later through the scheduler.
class SimulatedChannelAdapter : public ChannelAdapter {
public:
    using ReceiptSink = std::function<void(const courier::bus::StatusUpdate&)>;

    SimulatedChannelAdapter(courier::bus::Channel channel,
                            const courier::config::ConnectorConfig& config,
                            courier::scheduler::DelayedScheduler* scheduler,
                            ReceiptSink on_receipt);

    courier::bus::Channel ChannelName() const override { return channel_; }
    DeliveryOutcome Send(const courier::bus::MessageEvent& message,
                         const courier::bus::ExternalIdentity& target) override;
    ValidationResult ValidateCredentials() override;

    std::size_t SentCount() const { return sent_; }

private:
    courier::bus::Channel channel_;
    courier::config::ConnectorConfig config_;
    courier::scheduler::DelayedScheduler* scheduler_ = nullptr;
    ReceiptSink on_receipt_;
    std::atomic<std::size_t> sent_{0};
};

}  // namespace courier::channels
