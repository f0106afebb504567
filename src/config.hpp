#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

#include "common.hpp"

class ConfigError : public std::runtime_error {
  public:
    explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
};

struct Config {
    std::string listen_host = "0.0.0.0";
    int listen_port = 8080;

    std::string auth_key;
    std::string clockify_key;
    std::string clockify_workspace;
    std::string clockify_project;
    std::string clockify_host; // empty: the public Clockify API

    LogLevel log_level = LOG_INFO;

    // One-shot modes; no server is started
    bool show_help = false;
    std::string store_secret;

    std::string ListenAddr() const;
};

using EnvLookup = std::function<std::string(const std::string &)>;
// Secret store read by setting name ("auth_key", "clockify_key")
using SecretLookup = std::function<std::optional<std::string>(const std::string &)>;

// Reads the process environment; unset variables are empty.
std::string GetEnv(const std::string &name);

//! Builds the configuration from the environment, then applies the command-line flags.
//! AUTH_KEY and CLOCKIFY_KEY fall back to `secrets` when it is set.
//! Throws ConfigError on unknown flags, bad values or missing required settings.
Config LoadConfig(int argc, char **argv, const EnvLookup &env, const SecretLookup &secrets);

void ParseListenAddr(const std::string &addr, std::string &host, int &port);
LogLevel ParseLogLevel(const std::string &level);

const char *Usage();
