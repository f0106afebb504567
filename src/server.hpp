#pragma once

#include <atomic>
#include <functional>
#include <string>

#include <httplib.h>

#include "tracker.hpp"

class WebhookServer {
  public:
    using FatalHandler = std::function<void(const std::string &)>;

    WebhookServer(WorkTracker &tracker, std::string authKey);

    // Port 0 binds any free port
    bool Bind(const std::string &host, int port);
    int Port() const { return m_Port; }

    // Blocks until Stop(); returns at once when Stop() came first
    bool Listen();
    // Safe from any thread, before or while Listen() starts
    void Stop();
    bool Running() const { return m_Server.is_running(); }

    // A stop that already happened keeps the server unhealthy
    void SetHealthy(bool healthy);
    bool Healthy() const { return m_Healthy.load(); }

    // Called after an upstream failure inside a request; the default only logs
    void SetFatalHandler(FatalHandler handler) { m_OnFatal = std::move(handler); }

  private:
    void InitServer();
    void HandleToggle(Signal signal, const httplib::Request &req, httplib::Response &res);

    static std::string NextRequestId();

    WorkTracker &m_Tracker;
    const std::string m_AuthKey;
    int m_Port = -1;

    std::atomic<bool> m_Healthy{false};
    std::atomic<bool> m_StopRequested{false};
    std::atomic<bool> m_Listening{false};
    FatalHandler m_OnFatal;

    httplib::Server m_Server;
};
