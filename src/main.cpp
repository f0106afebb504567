#include <atomic>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "clockify.hpp"
#include "config.hpp"
#include "secrets.hpp"
#include "server.hpp"
#include "tracker.hpp"

namespace {
// ─────────────────────────────────────
void SetLogLevel(LogLevel log_level) {
    if (log_level == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }
}

// ─────────────────────────────────────
int StoreSecret(Secrets &secrets, const std::string &key) {
    std::string value;
    std::getline(std::cin, value);
    if (value.empty()) {
        spdlog::error("No value for {} on stdin", key);
        return 1;
    }
    if (!secrets.Store(key, value)) {
        return 1;
    }
    spdlog::info("Stored {} in secret storage", key);
    return 0;
}
} // namespace

int main(int argc, char *argv[]) {
    // Every thread inherits this mask; only the signal thread below receives them
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    spdlog::set_default_logger(spdlog::stdout_color_mt("workclock"));
    spdlog::info("Server is starting...");

    Secrets secrets;
    Config config;
    try {
        config = LoadConfig(argc, argv, GetEnv,
                            [&secrets](const std::string &setting) { return secrets.Lookup(setting); });
    } catch (const ConfigError &e) {
        spdlog::error("{}", e.what());
        std::cerr << Usage();
        return 2;
    }

    if (config.show_help) {
        std::cout << Usage();
        return 0;
    }
    SetLogLevel(config.log_level);
    if (!config.store_secret.empty()) {
        return StoreSecret(secrets, config.store_secret);
    }

    ClockifyClient clockify(config.clockify_host, config.clockify_key, config.clockify_workspace,
                            config.clockify_project);
    WorkTracker tracker(clockify);
    try {
        tracker.LoadTags();
    } catch (const ClockifyError &e) {
        spdlog::critical("Could not load tags: {}", e.what());
        return 1;
    }

    std::atomic<int> exitCode{0};
    std::atomic<bool> stopRequested{false};

    WebhookServer server(tracker, config.auth_key);
    server.SetFatalHandler([&exitCode](const std::string &) {
        exitCode.store(1);
        kill(getpid(), SIGTERM);
    });

    if (!server.Bind(config.listen_host, config.listen_port)) {
        spdlog::critical("Could not listen on {}", config.ListenAddr());
        return 1;
    }

    std::thread signalThread([&server, &stopRequested, signals]() {
        int sig = 0;
        if (sigwait(&signals, &sig) != 0) {
            spdlog::error("sigwait failed");
        }
        stopRequested.store(true);
        spdlog::info("Server is shutting down... ({})", strsignal(sig));
        server.Stop();
    });

    server.SetHealthy(true);
    spdlog::info("Server is ready to handle requests at {}", config.ListenAddr());
    if (!server.Listen()) {
        spdlog::error("Server loop on {} ended with an error", config.ListenAddr());
        exitCode.store(1);
    }

    // listen ended on its own, wake the signal thread
    if (!stopRequested.load()) {
        kill(getpid(), SIGTERM);
    }
    signalThread.join();

    spdlog::info("Server stopped");
    return exitCode.load();
}
