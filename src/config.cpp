#include "config.hpp"

#include <cstdlib>
#include <cstring>
#include <vector>

#include <spdlog/spdlog.h>

namespace {
const char *kAuthKeySecret = "auth_key";
const char *kClockifyKeySecret = "clockify_key";

// ─────────────────────────────────────
std::string FlagValue(int argc, char **argv, int &i) {
    if (i + 1 >= argc) {
        throw ConfigError(std::string("missing value for ") + argv[i]);
    }
    return argv[++i];
}

// ─────────────────────────────────────
std::string FromSecretStore(const SecretLookup &secrets, const char *key) {
    if (!secrets) {
        return "";
    }
    auto value = secrets(key);
    if (!value || value->empty()) {
        return "";
    }
    spdlog::info("Loaded {} from secret storage", key);
    return *value;
}
} // namespace

// ─────────────────────────────────────
std::string Config::ListenAddr() const {
    return listen_host + ":" + std::to_string(listen_port);
}

// ─────────────────────────────────────
std::string GetEnv(const std::string &name) {
    const char *value = std::getenv(name.c_str());
    return value ? value : "";
}

// ─────────────────────────────────────
void ParseListenAddr(const std::string &addr, std::string &host, int &port) {
    auto colon = addr.rfind(':');
    if (colon == std::string::npos) {
        throw ConfigError("listen address '" + addr + "' is not host:port");
    }

    std::string portText = addr.substr(colon + 1);
    if (portText.empty() || portText.size() > 5 ||
        portText.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError("invalid port in listen address '" + addr + "'");
    }
    int value = std::stoi(portText);
    if (value > 65535) {
        throw ConfigError("port out of range in listen address '" + addr + "'");
    }

    std::string hostText = addr.substr(0, colon);
    if (!hostText.empty() && hostText.front() == '[') {
        // [::1]:8080; the resolver wants the bare literal
        if (hostText.size() < 3 || hostText.back() != ']') {
            throw ConfigError("malformed IPv6 host in listen address '" + addr + "'");
        }
        hostText = hostText.substr(1, hostText.size() - 2);
    } else if (hostText.find(':') != std::string::npos) {
        throw ConfigError("IPv6 host in listen address '" + addr + "' needs brackets");
    }

    host = hostText.empty() ? "0.0.0.0" : hostText;
    port = value;
}

// ─────────────────────────────────────
LogLevel ParseLogLevel(const std::string &level) {
    if (level == "debug") {
        return LOG_DEBUG;
    }
    if (level == "info") {
        return LOG_INFO;
    }
    if (level == "off") {
        return LOG_OFF;
    }
    throw ConfigError("unknown log level '" + level + "' (expected debug, info or off)");
}

// ─────────────────────────────────────
Config LoadConfig(int argc, char **argv, const EnvLookup &env, const SecretLookup &secrets) {
    Config config;

    std::string port = env("PORT");
    std::string listenAddr = ":" + (port.empty() ? std::string("8080") : port);
    std::string logLevel = env("LOG_LEVEL");

    config.auth_key = env("AUTH_KEY");
    config.clockify_key = env("CLOCKIFY_KEY");
    config.clockify_workspace = env("CLOCKIFY_WORKSPACE");
    config.clockify_project = env("CLOCKIFY_PROJECT");
    config.clockify_host = env("CLOCKIFY_API_HOST");

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--listen-addr") == 0) {
            listenAddr = FlagValue(argc, argv, i);
        } else if (std::strcmp(argv[i], "--log-level") == 0) {
            logLevel = FlagValue(argc, argv, i);
        } else if (std::strcmp(argv[i], "--store-secret") == 0) {
            config.store_secret = FlagValue(argc, argv, i);
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            config.show_help = true;
        } else {
            throw ConfigError(std::string("unknown argument ") + argv[i]);
        }
    }

    if (!logLevel.empty()) {
        config.log_level = ParseLogLevel(logLevel);
    }
    ParseListenAddr(listenAddr, config.listen_host, config.listen_port);

    if (config.show_help) {
        return config;
    }
    if (!config.store_secret.empty()) {
        if (config.store_secret != kAuthKeySecret && config.store_secret != kClockifyKeySecret) {
            throw ConfigError("--store-secret expects auth_key or clockify_key, got '" +
                              config.store_secret + "'");
        }
        return config;
    }

    if (config.auth_key.empty()) {
        config.auth_key = FromSecretStore(secrets, kAuthKeySecret);
    }
    if (config.clockify_key.empty()) {
        config.clockify_key = FromSecretStore(secrets, kClockifyKeySecret);
    }

    std::vector<std::string> missing;
    if (config.auth_key.empty()) {
        missing.push_back("AUTH_KEY");
    }
    if (config.clockify_key.empty()) {
        missing.push_back("CLOCKIFY_KEY");
    }
    if (config.clockify_workspace.empty()) {
        missing.push_back("CLOCKIFY_WORKSPACE");
    }
    if (config.clockify_project.empty()) {
        missing.push_back("CLOCKIFY_PROJECT");
    }
    if (!missing.empty()) {
        std::string names;
        for (const auto &name : missing) {
            names += names.empty() ? name : ", " + name;
        }
        throw ConfigError("missing required settings: " + names);
    }

    return config;
}

// ─────────────────────────────────────
const char *Usage() {
    return "usage: workclock [--listen-addr HOST:PORT] [--log-level debug|info|off]\n"
           "                 [--store-secret auth_key|clockify_key]\n"
           "\n"
           "environment:\n"
           "  PORT                listen port when --listen-addr is not given (8080)\n"
           "  AUTH_KEY            value expected in the auth query parameter\n"
           "  CLOCKIFY_KEY        Clockify API key\n"
           "  CLOCKIFY_WORKSPACE  Clockify workspace id\n"
           "  CLOCKIFY_PROJECT    project id for new time entries\n"
           "  CLOCKIFY_API_HOST   API scheme and host (https://api.clockify.me)\n"
           "  LOG_LEVEL           debug, info or off\n"
           "\n"
           "AUTH_KEY and CLOCKIFY_KEY are read from the secret store when unset.\n"
           "--store-secret reads the value from stdin.\n";
}
