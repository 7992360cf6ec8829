#include "pipeline/router.hpp"

#include <algorithm>
#include <future>

#include <boost/asio/post.hpp>

#include "bus/event_codec.hpp"
#include "bus/message_status.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace courier::pipeline {
namespace {

std::string TargetLabel(const courier::bus::ExternalIdentity& target) {
    return std::string(courier::bus::ToString(target.platform)) + ":" + target.platform_user_id;
}

}  // namespace

Router::Router(courier::channels::ChannelRegistry& channels,
               courier::identity::IdentityResolver& resolver,
               const RetryExecutor& retry,
               courier::live::LiveNotifier* notifier,
               int fanout_parallelism,
               PipelineMetrics* metrics)
    : channels_(channels)
    , resolver_(resolver)
    , retry_(retry)
    , notifier_(notifier)
    , metrics_(metrics)
    , pool_(std::make_unique<boost::asio::thread_pool>(
          static_cast<std::size_t>(std::max(1, fanout_parallelism)))) {}

Router::~Router() {
    pool_->join();
}

RoutingResult Router::Route(const courier::bus::MessageEvent& message) {
    if (message.channel == courier::bus::Channel::kInternal) {
        return RouteInternal(message);
    }

    RoutingResult result{};
    std::vector<courier::bus::ExternalIdentity> targets;
    std::string resolution_error;
    for (const auto& recipient : message.recipient_ids) {
        try {
            auto resolved = resolver_.Resolve(recipient, message.channel);
            for (auto& identity : resolved) {
                if (!channels_.Has(identity.platform)) {
                    courier::utils::LogWarn("router", "no adapter for platform, skipping identity", {
                        {"messageId", message.message_id},
                        {"recipient", recipient},
                        {"platform", courier::bus::ToString(identity.platform)}
                    });
                    continue;
                }
                targets.push_back(std::move(identity));
            }
        } catch (const courier::ResolutionNotFoundError& ex) {
            courier::utils::LogWarn("router", "recipient has no linked identity", {
                {"messageId", message.message_id},
                {"recipient", recipient},
                {"error", ex.what()}
            });
        } catch (const courier::DeliveryError& ex) {
            resolution_error = ex.what();
            courier::utils::LogError("router", "identity resolution failed", {
                {"messageId", message.message_id},
                {"recipient", recipient},
                {"retryable", ex.Retryable() ? "true" : "false"},
                {"error", ex.what()}
            });
        }
    }

    result.targets = static_cast<int>(targets.size());
    if (targets.empty()) {
        result.failure_reason = resolution_error.empty()
            ? std::string("no linked identity")
            : "identity resolution failed: " + resolution_error;
        result.error_message = result.failure_reason;
        return result;
    }

    std::vector<TargetOutcome> outcomes;
    if (targets.size() == 1) {
        outcomes.push_back(DeliverToTarget(message, targets.front()));
    } else {
        std::vector<std::future<TargetOutcome>> pending;
        pending.reserve(targets.size());
        for (const auto& target : targets) {
            auto task = std::make_shared<std::packaged_task<TargetOutcome()>>([this, &message, target]() {
                return DeliverToTarget(message, target);
            });
            pending.push_back(task->get_future());
            boost::asio::post(*pool_, [task]() { (*task)(); });
        }
        for (auto& future : pending) {
            outcomes.push_back(future.get());
        }
    }

    std::string last_error;
    bool any_exhausted = false;
    for (const auto& outcome : outcomes) {
        result.attempts_made += outcome.retry.attempts;
        result.attempts.push_back(courier::bus::DeliveryAttempt{
            outcome.target.platform,
            outcome.target.platform_user_id,
            outcome.retry.attempts,
            outcome.retry.succeeded ? "delivered" : outcome.retry.last_error
        });
        if (outcome.retry.succeeded) {
            result.succeeded++;
            continue;
        }
        result.failed++;
        last_error = outcome.retry.last_error;
        any_exhausted = any_exhausted || outcome.retry.exhausted;
        courier::utils::LogWarn("router", "target delivery failed", {
            {"messageId", message.message_id},
            {"target", TargetLabel(outcome.target)},
            {"attempts", std::to_string(outcome.retry.attempts)},
            {"error", outcome.retry.last_error}
        });
    }
    if (metrics_) {
        metrics_->deliveries_succeeded += static_cast<std::uint64_t>(result.succeeded);
        metrics_->deliveries_failed += static_cast<std::uint64_t>(result.failed);
    }

    if (result.succeeded == 0) {
        result.failure_reason = any_exhausted
            ? "retries exhausted: " + last_error
            : "delivery failed: " + last_error;
        result.error_message = result.failure_reason;
        return result;
    }

    result.delivered = true;
    if (outcomes.size() == 1) {
        const auto reported = outcomes.front().delivery.status;
        // An accepted send is at least SENT whatever the connector echoes back.
        result.final_status = (reported == courier::bus::MessageStatus::kFailed
                               || courier::bus::Rank(reported) < courier::bus::Rank(courier::bus::MessageStatus::kSent))
            ? courier::bus::MessageStatus::kSent
            : reported;
    } else {
        result.final_status = courier::bus::MessageStatus::kDelivered;
    }
    if (result.failed > 0) {
        result.error_message = "partial delivery: " + std::to_string(result.failed) + " of "
            + std::to_string(result.targets) + " targets failed";
        if (metrics_) {
            metrics_->partial_deliveries++;
        }
    }
    return result;
}

RoutingResult Router::RouteInternal(const courier::bus::MessageEvent& message) {
    RoutingResult result{};
    result.delivered = true;
    result.final_status = courier::bus::MessageStatus::kDelivered;
    result.targets = static_cast<int>(message.recipient_ids.size());
    if (notifier_) {
        nlohmann::json payload = {
            {"type", "message"},
            {"message", courier::bus::ToJson(message)}
        };
        const auto text = payload.dump();
        for (const auto& recipient : message.recipient_ids) {
            const auto sessions = notifier_->DeliverToUser(recipient, text);
            if (sessions > 0 && metrics_) {
                metrics_->live_pushes++;
            }
        }
    }
    result.succeeded = result.targets;
    return result;
}

Router::TargetOutcome Router::DeliverToTarget(const courier::bus::MessageEvent& message,
                                              const courier::bus::ExternalIdentity& target) {
    TargetOutcome outcome{};
    outcome.target = target;
    auto* adapter = channels_.GetAdapter(target.platform);
    const auto label = message.message_id + "->" + TargetLabel(target);
    outcome.retry = retry_.Execute(label, [&](int) {
        outcome.delivery = adapter->Send(message, target);
    });
    return outcome;
}

}  // namespace courier::pipeline
