#pragma once

#include <memory>
#include <string>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "bus/events.hpp"
#include "channels/channel_registry.hpp"
#include "identity/identity_resolver.hpp"
#include "live/live_notifier.hpp"
#include "pipeline/pipeline_metrics.hpp"
#include "pipeline/retry_executor.hpp"

namespace courier::pipeline {

struct RoutingResult {
    // At least one target accepted the message, or it stayed internal.
    bool delivered = false;
    courier::bus::MessageStatus final_status = courier::bus::MessageStatus::kFailed;
    int targets = 0;
    int succeeded = 0;
    int failed = 0;
    // Adapter calls made across every target.
    int attempts_made = 0;
    // Dead-letter reason when nothing was delivered.
    std::string failure_reason;
    // Status error text; also set for partial fan-out.
    std::string error_message;
    std::vector<courier::bus::DeliveryAttempt> attempts;
};

// Resolves the real targets of one message and delivers to all of them,
// one retry-wrapped task per target on a bounded pool.
class Router {
public:
    Router(courier::channels::ChannelRegistry& channels,
           courier::identity::IdentityResolver& resolver,
           const RetryExecutor& retry,
           courier::live::LiveNotifier* notifier,
           int fanout_parallelism,
           PipelineMetrics* metrics = nullptr);
    ~Router();

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    RoutingResult Route(const courier::bus::MessageEvent& message);

private:
    struct TargetOutcome {
        courier::bus::ExternalIdentity target;
        RetryResult retry;
        courier::channels::DeliveryOutcome delivery;
    };

    RoutingResult RouteInternal(const courier::bus::MessageEvent& message);
    TargetOutcome DeliverToTarget(const courier::bus::MessageEvent& message,
                                  const courier::bus::ExternalIdentity& target);

    courier::channels::ChannelRegistry& channels_;
    courier::identity::IdentityResolver& resolver_;
    const RetryExecutor& retry_;
    courier::live::LiveNotifier* notifier_ = nullptr;
    PipelineMetrics* metrics_ = nullptr;
    std::unique_ptr<boost::asio::thread_pool> pool_;
};

}  // namespace courier::pipeline
