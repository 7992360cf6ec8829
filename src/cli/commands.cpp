#include <atomic>
#include <chrono>
#include <csignal>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>

#include "app/courier_service.hpp"
#include "config/config_loader.hpp"
#include "gateway/ingress_server.hpp"
#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/http_client.hpp"
#include "utils/logging.hpp"

namespace {

std::atomic<bool> g_running{true};
volatile std::sig_atomic_t g_signal = 0;
const char* g_argv0 = nullptr;

std::filesystem::path GetPidFilePath() {
    return courier::utils::GetHomePath() / ".courier" / "courier.pid";
}

bool IsProcessRunning(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

std::optional<pid_t> ReadPidFile() {
    const auto path = GetPidFilePath();
    std::ifstream input(path);
    if (!input.is_open()) {
        return std::nullopt;
    }
    pid_t pid = 0;
    input >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

bool WritePidFile(pid_t pid) {
    const auto path = GetPidFilePath();
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        return false;
    }
    output << pid;
    return true;
}

void RemovePidFile() {
    const auto path = GetPidFilePath();
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

void HandleSignal(int signal) {
    g_signal = signal;
}

void ConfigureLoggingFrom(const courier::config::Config& config) {
    courier::utils::LogConfig log_config{};
    const auto level = courier::utils::ParseLogLevel(config.logging.level);
    if (level) {
        log_config.min_level = *level;
    }
    courier::utils::ConfigureLogging(log_config);
}

int RunServe() {
    auto config = courier::config::LoadConfig();
    ConfigureLoggingFrom(config);

    const auto existing_pid = ReadPidFile();
    if (existing_pid && IsProcessRunning(*existing_pid)) {
        std::cout << "courier already running (pid=" << *existing_pid << ")" << std::endl;
        return 1;
    }
    RemovePidFile();

    if (!WritePidFile(::getpid())) {
        std::cout << "Failed to write courier pid file." << std::endl;
        return 1;
    }

    courier::app::CourierService service(config);
    courier::gateway::IngressServer ingress(service);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGHUP, &action, nullptr);

    service.Start();
    const std::string host = config.gateway.host;
    const int port = config.gateway.port;
    std::thread http_thread([&ingress, host, port]() {
        const bool ok = ingress.Listen(host, port);
        if (!ok) {
            courier::utils::LogError("gateway", "http server failed to listen", {
                {"host", host},
                {"port", std::to_string(port)}
            });
            g_running.store(false);
        }
    });

    std::cout << "courier started. Press Ctrl+C to stop." << std::endl;
    bool shutdown_guard_started = false;
    bool restart_requested = false;
    while (g_running.load()) {
        if (g_signal != 0) {
            if (g_signal == SIGHUP) {
                restart_requested = true;
            }
            g_running.store(false);
            if (!shutdown_guard_started) {
                shutdown_guard_started = true;
                std::thread([] {
                    std::this_thread::sleep_for(std::chrono::seconds(10));
                    std::_Exit(130);
                }).detach();
            }
        }
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    ingress.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    service.Stop();
    RemovePidFile();
    if (restart_requested && g_argv0) {
        const char* args[] = {g_argv0, "serve", nullptr};
        ::execv(g_argv0, const_cast<char* const*>(args));
        std::cout << "Failed to restart courier." << std::endl;
        return 1;
    }
    return 0;
}

int HupServe() {
    const auto pid = ReadPidFile();
    if (!pid || !IsProcessRunning(*pid)) {
        std::cout << "courier not running." << std::endl;
        return 1;
    }
    ::kill(*pid, SIGHUP);
    return 0;
}

int ValidateAdapters() {
    auto config = courier::config::LoadConfig();
    ConfigureLoggingFrom(config);
    courier::channels::ChannelRegistry registry(config.channels, nullptr, {});
    int failures = 0;
    for (const auto& [channel, result] : registry.ValidateAll()) {
        std::cout << courier::bus::ToString(channel) << ": " << (result.valid ? "valid" : "INVALID");
        if (!result.message.empty()) {
            std::cout << " (" << result.message << ")";
        }
        std::cout << std::endl;
        for (const auto& error : result.errors) {
            std::cout << "  error: " << error << std::endl;
        }
        for (const auto& [key, value] : result.platform_info) {
            std::cout << "  " << key << ": " << value << std::endl;
        }
        if (!result.valid) {
            failures++;
        }
    }
    return failures == 0 ? 0 : 1;
}

int PrintStatus(const std::string& message_id) {
    auto config = courier::config::LoadConfig();
    ConfigureLoggingFrom(config);
    courier::storage::StatusRepository repository(config.storage.database_path);
    auto record = repository.Get(message_id);
    if (!record) {
        std::cout << "message " << message_id << " not found" << std::endl;
        return 1;
    }
    std::cout << record->message_id << " " << courier::bus::ToString(record->status)
              << " channel=" << courier::bus::ToString(record->channel)
              << " updated=" << courier::utils::FormatIso(record->updated_at_ms)
              << " by=" << record->updated_by << std::endl;
    if (!record->error_message.empty()) {
        std::cout << "  error: " << record->error_message << std::endl;
    }
    for (const auto& entry : repository.History(message_id)) {
        std::cout << "  " << courier::utils::FormatIso(entry.changed_at_ms) << " "
                  << courier::bus::ToString(entry.from) << " -> " << courier::bus::ToString(entry.to)
                  << " (" << entry.changed_by << ")" << std::endl;
    }
    return 0;
}

int ForgetProcessed(const std::string& message_id) {
    auto config = courier::config::LoadConfig();
    ConfigureLoggingFrom(config);
    courier::utils::ParsedUrl url;
    url.https = false;
    url.host = config.gateway.host == "0.0.0.0" ? "127.0.0.1" : config.gateway.host;
    url.port = config.gateway.port;
    auto client = courier::utils::MakeHttpClient(url, 5);
    auto res = client->Delete("/v1/messages/" + message_id + "/processed");
    if (!res) {
        std::cout << "courier not reachable: " << courier::utils::HttpErrorToString(res.error()) << std::endl;
        return 1;
    }
    if (res->status == 404) {
        std::cout << "message " << message_id << " has no processed marker" << std::endl;
        return 1;
    }
    if (res->status != 200) {
        std::cout << "forget failed with HTTP " << res->status << ": " << res->body << std::endl;
        return 1;
    }
    std::cout << "message " << message_id << " will be routed again on redelivery" << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    g_argv0 = (argc > 0 ? argv[0] : nullptr);
    const std::string command = argc >= 2 ? argv[1] : "";

    try {
        if (command == "serve") {
            return RunServe();
        }
        if (command == "hup") {
            return HupServe();
        }
        if (command == "validate") {
            return ValidateAdapters();
        }
        if (command == "status" && argc >= 3) {
            return PrintStatus(argv[2]);
        }
        if (command == "forget" && argc >= 3) {
            return ForgetProcessed(argv[2]);
        }
    } catch (const std::exception& ex) {
        std::cerr << "[courier] fatal: " << ex.what() << std::endl;
        RemovePidFile();
        return 1;
    }

    std::cout << "Usage: courier serve | courier hup | courier validate | courier status <messageId> | courier forget <messageId>" << std::endl;
    return 1;
}
