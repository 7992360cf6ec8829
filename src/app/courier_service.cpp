#include "app/courier_service.hpp"

#include "bus/event_codec.hpp"
#include "store/memory_kv_store.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace courier::app {

CourierService::CourierService(const courier::config::Config& config, ServiceOverrides overrides)
    : config_(config)
    , store_(overrides.store ? std::move(overrides.store)
                             : std::make_unique<courier::store::MemoryKeyValueStore>())
    , events_("message-events", config.pipeline.event_partitions)
    , statuses_("status-updates", config.pipeline.status_partitions)
    , dead_letters_log_("message-events-dlq", config.dead_letter.partitions)
    , repository_(std::make_unique<courier::storage::StatusRepository>(config.storage.database_path))
    , publisher_(statuses_, &metrics_)
    , dead_letters_(dead_letters_log_, courier::utils::ExpandHome(config.dead_letter.fallback_path), &metrics_)
    , dedup_(*store_, config.dedup) {
    channels_ = std::make_unique<courier::channels::ChannelRegistry>(
        config_.channels,
        &scheduler_,
        [this](const courier::bus::StatusUpdate& update) { publisher_.Publish(update); });
    directory_ = overrides.directory
        ? std::move(overrides.directory)
        : std::make_unique<courier::identity::HttpUserDirectory>(config_.resolver);
    resolver_ = std::make_unique<courier::identity::IdentityResolver>(*directory_, config_.resolver, overrides.sleeper);
    retry_ = std::make_unique<courier::pipeline::RetryExecutor>(
        courier::pipeline::RetryPolicy::FromConfig(config_.retry), overrides.sleeper, &metrics_);
    router_ = std::make_unique<courier::pipeline::Router>(
        *channels_, *resolver_, *retry_, &notifier_, config_.pipeline.fanout_parallelism, &metrics_);
    const auto backoff = std::chrono::milliseconds(config_.pipeline.redelivery_backoff_ms);
    dispatcher_ = std::make_unique<courier::pipeline::EventDispatcher>(
        events_, dedup_, *router_, dead_letters_, publisher_, &metrics_, backoff);
    status_consumer_ = std::make_unique<courier::pipeline::StatusConsumer>(
        statuses_, *repository_, &notifier_, &metrics_, backoff);
    rate_limiter_ = std::make_unique<courier::ratelimit::RateLimiter>(*store_, config_.rate_limit, &metrics_);
}

CourierService::~CourierService() {
    Stop();
    scheduler_.Stop();
}

void CourierService::Start() {
    if (running_) {
        return;
    }
    running_ = true;
    scheduler_.Start();
    status_consumer_->Start();
    dispatcher_->Start();
    courier::utils::LogInfo("courier", "pipeline started", {
        {"eventPartitions", std::to_string(events_.PartitionCount())},
        {"statusPartitions", std::to_string(statuses_.PartitionCount())},
        {"adapters", std::to_string(channels_->Channels().size())}
    });
}

void CourierService::Stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    dispatcher_->Stop();
    scheduler_.Stop();
    status_consumer_->Stop();
    notifier_.CloseAll();
    courier::utils::LogInfo("courier", "pipeline stopped");
}

courier::bus::MessageEvent CourierService::Accept(courier::bus::MessageEvent event) {
    if (event.conversation_id.empty()) {
        throw courier::ValidationError("missing field 'conversationId'");
    }
    if (event.sender_id.empty()) {
        throw courier::ValidationError("missing field 'senderId'");
    }
    if (event.message_id.empty()) {
        event.message_id = courier::utils::GenerateUuid();
    }
    if (event.timestamp_ms == 0) {
        event.timestamp_ms = courier::utils::NowMs();
    }
    event.status = courier::bus::MessageStatus::kPending;

    if (!repository_->Insert(courier::storage::RecordFromEvent(event))) {
        courier::utils::LogInfo("courier", "message already accepted", {{"messageId", event.message_id}});
        return event;
    }
    events_.Append(event.PartitionKey(), courier::bus::EncodeMessageEvent(event));
    courier::utils::LogInfo("courier", "message accepted", {
        {"messageId", event.message_id},
        {"conversationId", event.conversation_id},
        {"channel", courier::bus::ToString(event.channel)},
        {"recipients", std::to_string(event.recipient_ids.size())}
    });
    return event;
}

bool CourierService::IngestStatus(courier::bus::Channel channel, courier::bus::StatusUpdate update) {
    if (update.source.empty()) {
        update.source = courier::utils::ToLower(courier::bus::ToString(channel));
    }
    return publisher_.Publish(std::move(update));
}

bool CourierService::ForgetProcessed(const std::string& message_id) {
    const bool removed = dedup_.Forget(message_id);
    courier::utils::LogInfo("courier", "processed marker cleared", {
        {"messageId", message_id},
        {"removed", removed ? "true" : "false"}
    });
    return removed;
}

}  // namespace courier::app
