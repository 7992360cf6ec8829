#pragma once

#include <memory>
#include <string>

#include "bus/event_log.hpp"
#include "bus/events.hpp"
#include "channels/channel_registry.hpp"
#include "config/config_schema.hpp"
#include "identity/identity_resolver.hpp"
#include "identity/user_directory.hpp"
#include "live/live_notifier.hpp"
#include "pipeline/dead_letter_handler.hpp"
#include "pipeline/dedup_store.hpp"
#include "pipeline/event_dispatcher.hpp"
#include "pipeline/pipeline_metrics.hpp"
#include "pipeline/retry_executor.hpp"
#include "pipeline/router.hpp"
#include "pipeline/status_consumer.hpp"
#include "pipeline/status_publisher.hpp"
#include "ratelimit/rate_limiter.hpp"
#include "scheduler/delayed_scheduler.hpp"
#include "storage/status_repository.hpp"
#include "store/kv_store.hpp"

namespace courier::app {

struct ServiceOverrides {
    std::unique_ptr<courier::store::KeyValueStore> store;
    std::unique_ptr<courier::identity::UserDirectory> directory;
    courier::pipeline::RetryExecutor::Sleeper sleeper;
};

// Owns the whole pipeline: logs, stores, consumers and the live registry.
class CourierService {
public:
    explicit CourierService(const courier::config::Config& config, ServiceOverrides overrides = {});
    ~CourierService();

    CourierService(const CourierService&) = delete;
    CourierService& operator=(const CourierService&) = delete;

    void Start();
    void Stop();

    // Persists the message as PENDING and appends it to the event log.
    // Throws ValidationError for incomplete submissions.
    courier::bus::MessageEvent Accept(courier::bus::MessageEvent event);
    // Connector status callback; false when it could not be published.
    bool IngestStatus(courier::bus::Channel channel, courier::bus::StatusUpdate update);
    // Drops the processed marker so a redelivered event is routed again.
    bool ForgetProcessed(const std::string& message_id);

    const courier::config::Config& Config() const { return config_; }
    courier::pipeline::PipelineMetrics& Metrics() { return metrics_; }
    courier::storage::StatusRepository& Repository() { return *repository_; }
    courier::live::LiveNotifier& Notifier() { return notifier_; }
    courier::ratelimit::RateLimiter& Limiter() { return *rate_limiter_; }
    courier::channels::ChannelRegistry& Channels() { return *channels_; }
    courier::pipeline::EventDispatcher& Dispatcher() { return *dispatcher_; }
    courier::pipeline::StatusConsumer& Statuses() { return *status_consumer_; }
    courier::bus::EventLog& EventsLog() { return events_; }
    courier::bus::EventLog& StatusLog() { return statuses_; }
    courier::bus::EventLog& DeadLetterLog() { return dead_letters_log_; }
    courier::scheduler::DelayedScheduler& Scheduler() { return scheduler_; }

private:
    courier::config::Config config_;
    courier::pipeline::PipelineMetrics metrics_;
    std::unique_ptr<courier::store::KeyValueStore> store_;
    courier::bus::InMemoryEventLog events_;
    courier::bus::InMemoryEventLog statuses_;
    courier::bus::InMemoryEventLog dead_letters_log_;
    std::unique_ptr<courier::storage::StatusRepository> repository_;
    courier::scheduler::DelayedScheduler scheduler_;
    courier::live::LiveNotifier notifier_;
    courier::pipeline::StatusPublisher publisher_;
    courier::pipeline::DeadLetterHandler dead_letters_;
    courier::pipeline::DedupStore dedup_;
    std::unique_ptr<courier::channels::ChannelRegistry> channels_;
    std::unique_ptr<courier::identity::UserDirectory> directory_;
    std::unique_ptr<courier::identity::IdentityResolver> resolver_;
    std::unique_ptr<courier::pipeline::RetryExecutor> retry_;
    std::unique_ptr<courier::pipeline::Router> router_;
    std::unique_ptr<courier::pipeline::EventDispatcher> dispatcher_;
    std::unique_ptr<courier::pipeline::StatusConsumer> status_consumer_;
    std::unique_ptr<courier::ratelimit::RateLimiter> rate_limiter_;
    bool running_ = false;
};

}  // namespace courier::app
