#include "server.hpp"

#include <chrono>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "clockify.hpp"

#define REQUEST_ID_HEADER "X-Request-Id"

// ─────────────────────────────────────
WebhookServer::WebhookServer(WorkTracker &tracker, std::string authKey)
    : m_Tracker(tracker), m_AuthKey(std::move(authKey)) {
    InitServer();
}

// ─────────────────────────────────────
bool WebhookServer::Bind(const std::string &host, int port) {
    if (port == 0) {
        m_Port = m_Server.bind_to_any_port(host.c_str());
    } else {
        m_Port = m_Server.bind_to_port(host.c_str(), port) ? port : -1;
    }
    if (m_Port < 0) {
        spdlog::error("Could not bind to {}:{}", host, port);
        return false;
    }
    return true;
}

// ─────────────────────────────────────
bool WebhookServer::Listen() {
    m_Listening.store(true);
    if (m_StopRequested.load()) {
        m_Listening.store(false);
        spdlog::debug("Stop requested before the server started listening");
        return true;
    }
    bool ok = m_Server.listen_after_bind();
    m_Listening.store(false);
    return ok;
}

// ─────────────────────────────────────
void WebhookServer::Stop() {
    m_StopRequested.store(true);
    m_Healthy.store(false);

    // httplib ignores stop() until its accept loop is running
    while (m_Listening.load() && !m_Server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    m_Server.stop();
}

// ─────────────────────────────────────
void WebhookServer::SetHealthy(bool healthy) {
    m_Healthy.store(healthy);
    if (m_StopRequested.load()) {
        m_Healthy.store(false);
    }
}

// ─────────────────────────────────────
void WebhookServer::InitServer() {
    m_Server.set_read_timeout(5, 0);
    m_Server.set_write_timeout(10, 0);
    m_Server.set_keep_alive_timeout(15);
    m_Server.set_payload_max_length(64 * 1024);

    // tracing, then auth; runs for every path including unknown ones
    m_Server.set_pre_routing_handler([this](const httplib::Request &req, httplib::Response &res) {
        std::string requestId = req.get_header_value(REQUEST_ID_HEADER);
        if (requestId.empty()) {
            requestId = NextRequestId();
        }
        res.set_header(REQUEST_ID_HEADER, requestId);

        if (!req.has_param("auth") || req.get_param_value("auth") != m_AuthKey) {
            res.status = 401;
            res.set_content("Unauthorized.\n", "text/plain; charset=utf-8");
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    m_Server.set_logger([](const httplib::Request &req, const httplib::Response &res) {
        std::string requestId = res.get_header_value(REQUEST_ID_HEADER);
        spdlog::info("{} {} {} {} {} {}", requestId.empty() ? "unknown" : requestId, req.method,
                     req.path, res.status, req.remote_addr, req.get_header_value("User-Agent"));
    });

    m_Server.Get("/", [](const httplib::Request &, httplib::Response &res) {
        res.status = 200;
        res.set_header("X-Content-Type-Options", "nosniff");
        res.set_content("Hello, World!\n", "text/plain; charset=utf-8");
    });

    m_Server.Get("/health", [this](const httplib::Request &, httplib::Response &res) {
        res.status = m_Healthy.load() ? 204 : 503;
    });

    // state toggles accept both verbs
    {
        const std::pair<const char *, Signal> toggles[] = {
            {"/on_phone", Signal::OnPhone},
            {"/on_laptop", Signal::OnLaptop},
            {"/at_work", Signal::AtWork},
        };
        for (const auto &toggle : toggles) {
            const Signal signal = toggle.second;
            auto handler = [this, signal](const httplib::Request &req, httplib::Response &res) {
                HandleToggle(signal, req, res);
            };
            m_Server.Get(toggle.first, handler);
            m_Server.Post(toggle.first, handler);
        }
    }

    // only fills in bodies for 404s; 400/401/500 bodies are set by the handlers
    m_Server.set_error_handler([](const httplib::Request &, httplib::Response &res) {
        if (res.status == 404 && res.body.empty()) {
            res.set_content("404 page not found\n", "text/plain; charset=utf-8");
        }
    });
}

// ─────────────────────────────────────
void WebhookServer::HandleToggle(Signal signal, const httplib::Request &req,
                                 httplib::Response &res) {
    if (!req.has_param("state")) {
        spdlog::debug("{}: missing state parameter", SignalName(signal));
        res.status = 400;
        return;
    }
    const bool value = req.get_param_value("state") == "true";

    try {
        m_Tracker.Update(signal, value);
    } catch (const ClockifyError &e) {
        spdlog::critical("Upstream request failed: {}", e.what());
        res.status = 500;
        res.set_content("Upstream request failed\n", "text/plain; charset=utf-8");
        if (m_OnFatal) {
            m_OnFatal(e.what());
        }
        return;
    }

    res.status = 200;
    res.set_content("Succeeded\n", "text/plain; charset=utf-8");
}

// ─────────────────────────────────────
std::string WebhookServer::NextRequestId() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::to_string(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}
