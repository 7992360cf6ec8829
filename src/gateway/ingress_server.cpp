#include "gateway/ingress_server.hpp"

#include <chrono>

#include "bus/event_codec.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace courier::gateway {
namespace {

void WriteJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void WriteError(httplib::Response& res, int status, const std::string& message) {
    WriteJson(res, status, {{"error", message}});
}

long long Backlog(const courier::bus::EventLog& log) {
    long long total = 0;
    for (int partition = 0; partition < log.PartitionCount(); ++partition) {
        total += log.EndOffset(partition) - log.CommittedOffset(partition);
    }
    return total;
}

}  // namespace

IngressServer::IngressServer(courier::app::CourierService& service)
    : service_(service) {
    RegisterRoutes();
}

bool IngressServer::Listen(const std::string& host, int port) {
    courier::utils::LogInfo("gateway", "listening", {
        {"host", host},
        {"port", std::to_string(port)}
    });
    return server_.listen(host, port);
}

void IngressServer::Stop() {
    server_.stop();
}

void IngressServer::RegisterRoutes() {
    server_.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        return ApplyRateLimit(req, res);
    });

    server_.Post("/v1/messages", [this](const httplib::Request& req, httplib::Response& res) {
        HandleSubmit(req, res);
    });
    server_.Post("/v1/webhooks/:channel", [this](const httplib::Request& req, httplib::Response& res) {
        HandleWebhook(req, res);
    });
    server_.Get("/v1/messages/:id", [this](const httplib::Request& req, httplib::Response& res) {
        HandleGetMessage(req, res);
    });
    server_.Delete("/v1/messages/:id/processed", [this](const httplib::Request& req, httplib::Response& res) {
        const auto& message_id = req.path_params.at("id");
        const bool removed = service_.ForgetProcessed(message_id);
        WriteJson(res, removed ? 200 : 404, {{"messageId", message_id}, {"forgotten", removed}});
    });
    server_.Get("/v1/stream", [this](const httplib::Request& req, httplib::Response& res) {
        HandleStream(req, res);
    });
    server_.Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(service_.Metrics().Render(), "text/plain; version=0.0.4");
    });
    server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        WriteJson(res, 200, {
            {"status", "UP"},
            {"liveUsers", service_.Notifier().ActiveUsers()},
            {"liveSessions", service_.Notifier().ActiveSessions()},
            {"eventBacklog", Backlog(service_.EventsLog())},
            {"statusBacklog", Backlog(service_.StatusLog())}
        });
    });

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string error = "unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& ex) {
            error = ex.what();
        }
        courier::utils::LogError("gateway", "request failed", {
            {"path", req.path},
            {"error", error}
        });
        WriteError(res, 500, "internal error");
    });
}

httplib::Server::HandlerResponse IngressServer::ApplyRateLimit(const httplib::Request& req, httplib::Response& res) {
    if (req.path == "/health") {
        return httplib::Server::HandlerResponse::Unhandled;
    }
    const auto subject = courier::ratelimit::SubjectKeyFor(req.get_header_value("Authorization"), req.remote_addr);
    const auto decision = service_.Limiter().Check(subject);
    if (decision.allowed) {
        res.set_header("X-RateLimit-Remaining", std::to_string(decision.remaining));
        return httplib::Server::HandlerResponse::Unhandled;
    }
    res.set_header("X-RateLimit-Retry-After", std::to_string(decision.retry_after_s));
    WriteError(res, 429, "rate limit exceeded");
    return httplib::Server::HandlerResponse::Handled;
}

void IngressServer::HandleSubmit(const httplib::Request& req, httplib::Response& res) {
    auto body = nlohmann::json::parse(req.body, nullptr, false);
    if (!body.is_object()) {
        WriteError(res, 400, "request body must be a JSON object");
        return;
    }
    if (!body.contains("messageId")) {
        body["messageId"] = courier::utils::GenerateUuid();
    }
    try {
        auto event = service_.Accept(courier::bus::MessageEventFromJson(body));
        WriteJson(res, 202, {
            {"messageId", event.message_id},
            {"conversationId", event.conversation_id},
            {"status", courier::bus::ToString(event.status)},
            {"timestamp", event.timestamp_ms}
        });
    } catch (const courier::ValidationError& ex) {
        WriteError(res, 400, ex.what());
    } catch (const courier::EventLogError& ex) {
        courier::utils::LogError("gateway", "failed to publish accepted message", {{"error", ex.what()}});
        WriteError(res, 503, "message log unavailable");
    }
}

void IngressServer::HandleWebhook(const httplib::Request& req, httplib::Response& res) {
    const auto channel = courier::bus::ParseChannel(req.path_params.at("channel"));
    if (!channel || *channel == courier::bus::Channel::kInternal) {
        WriteError(res, 404, "unknown channel");
        return;
    }
    auto body = nlohmann::json::parse(req.body, nullptr, false);
    courier::bus::StatusUpdate update;
    try {
        update = courier::bus::StatusUpdateFromJson(body);
    } catch (const courier::ValidationError& ex) {
        WriteError(res, 400, ex.what());
        return;
    }
    if (!body.contains("source")) {
        update.source.clear();
    }
    if (!service_.IngestStatus(*channel, update)) {
        WriteError(res, 503, "status log unavailable");
        return;
    }
    WriteJson(res, 202, {{"messageId", update.message_id}, {"status", courier::bus::ToString(update.status)}});
}

void IngressServer::HandleGetMessage(const httplib::Request& req, httplib::Response& res) {
    const auto& message_id = req.path_params.at("id");
    auto record = service_.Repository().Get(message_id);
    if (!record) {
        WriteError(res, 404, "message not found");
        return;
    }
    nlohmann::json history = nlohmann::json::array();
    for (const auto& entry : service_.Repository().History(message_id)) {
        nlohmann::json item = {
            {"from", courier::bus::ToString(entry.from)},
            {"to", courier::bus::ToString(entry.to)},
            {"changedAt", entry.changed_at_ms},
            {"changedBy", entry.changed_by}
        };
        if (!entry.error_message.empty()) {
            item["errorMessage"] = entry.error_message;
        }
        history.push_back(std::move(item));
    }
    nlohmann::json body = {
        {"messageId", record->message_id},
        {"conversationId", record->conversation_id},
        {"senderId", record->sender_id},
        {"recipientIds", record->recipient_ids},
        {"channel", courier::bus::ToString(record->channel)},
        {"status", courier::bus::ToString(record->status)},
        {"createdAt", record->created_at_ms},
        {"updatedAt", record->updated_at_ms},
        {"updatedBy", record->updated_by},
        {"history", std::move(history)}
    };
    if (!record->error_message.empty()) {
        body["errorMessage"] = record->error_message;
    }
    WriteJson(res, 200, body);
}

void IngressServer::HandleStream(const httplib::Request& req, httplib::Response& res) {
    const auto user_id = req.get_param_value("userId");
    if (user_id.empty()) {
        WriteError(res, 400, "userId is required");
        return;
    }
    auto& notifier = service_.Notifier();
    auto session = notifier.Register(user_id);
    res.set_header("Cache-Control", "no-cache");
    res.set_chunked_content_provider(
        "text/event-stream",
        [session](std::size_t, httplib::DataSink& sink) {
            auto next = session->Next(std::chrono::milliseconds(15000));
            if (next) {
                const auto chunk = "data: " + *next + "\n\n";
                return sink.write(chunk.data(), chunk.size());
            }
            if (session->IsClosed()) {
                sink.done();
                return true;
            }
            const std::string keepalive = ": keepalive\n\n";
            return sink.write(keepalive.data(), keepalive.size());
        },
        [&notifier, session](bool) {
            notifier.Deregister(session);
        });
}

}  // namespace courier::gateway
