#pragma once

#include <string>

#include "app/courier_service.hpp"
#include "httplib.h"

namespace courier::gateway {

// HTTP front door: message submission, connector webhooks, status lookup,
// live event streams and metrics. Every route except /health passes the
// rate limiter first.
class IngressServer {
public:
    explicit IngressServer(courier::app::CourierService& service);

    bool Listen(const std::string& host, int port);
    void Stop();


private:
    void RegisterRoutes();
    httplib::Server::HandlerResponse ApplyRateLimit(const httplib::Request& req, httplib::Response& res);

    void HandleSubmit(const httplib::Request& req, httplib::Response& res);
    void HandleWebhook(const httplib::Request& req, httplib::Response& res);
    void HandleGetMessage(const httplib::Request& req, httplib::Response& res);
    void HandleStream(const httplib::Request& req, httplib::Response& res);

    courier::app::CourierService& service_;
    httplib::Server server_;
};

}  // namespace courier::gateway
