#include "channels/simulated_channel_adapter.hpp"

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace courier::channels {

SimulatedChannelAdapter::SimulatedChannelAdapter(courier::bus::Channel channel,
                                                 const courier::config::ConnectorConfig& config,
                                                 courier::scheduler::DelayedScheduler* scheduler,
                                                 ReceiptSink on_receipt)
    : channel_(channel)
    , config_(config)
    , scheduler_(scheduler)
    , on_receipt_(std::move(on_receipt)) {}

DeliveryOutcome SimulatedChannelAdapter::Send(const courier::bus::MessageEvent& message,
                                              const courier::bus::ExternalIdentity& target) {
    const auto platform = courier::utils::ToLower(courier::bus::ToString(channel_));
    DeliveryOutcome outcome{};
    outcome.message_id = message.message_id;
    outcome.external_message_id = platform + "_" + courier::utils::GenerateUuid();
    outcome.status = courier::bus::MessageStatus::kSent;
    outcome.timestamp_ms = courier::utils::NowMs();
    sent_++;

    courier::utils::LogInfo("connector:" + platform, "simulated send", {
        {"messageId", message.message_id},
        {"recipient", target.platform_user_id},
        {"externalMessageId", outcome.external_message_id}
    });

    const auto receipt_status = courier::bus::ParseMessageStatus(config_.receipt_status);
    if (scheduler_ && on_receipt_ && receipt_status.has_value()) {
        courier::bus::StatusUpdate receipt{};
        receipt.message_id = message.message_id;
        receipt.status = *receipt_status;
        receipt.source = platform;
        auto sink = on_receipt_;
        scheduler_->Schedule(std::chrono::milliseconds(config_.receipt_delay_ms), [sink, receipt]() mutable {
            receipt.timestamp_ms = courier::utils::NowMs();
            sink(receipt);
        });
    }
    return outcome;
}

ValidationResult SimulatedChannelAdapter::ValidateCredentials() {
    ValidationResult result{};
    result.valid = true;
    result.message = "simulated connector";
    result.platform_info["mode"] = "simulated";
    result.platform_info["platform"] = courier::bus::ToString(channel_);
    return result;
}

}  // namespace courier::channels
