#include "clockify.hpp"

#include <cstdio>
#include <ctime>
#include <utility>

#include <spdlog/spdlog.h>

#include "json.hpp"

ClockifyClient::ClockifyClient(std::string host, std::string apiKey, std::string workspaceId,
                               std::string projectId)
    : m_Host(std::move(host)), m_ApiKey(std::move(apiKey)), m_WorkspaceId(std::move(workspaceId)),
      m_ProjectId(std::move(projectId)) {
    if (m_Host.empty()) {
        m_Host = CLOCKIFY_DEFAULT_HOST;
    }
}

// ─────────────────────────────────────
std::vector<Tag> ClockifyClient::GetTags() {
    httplib::Client client(m_Host);
    Configure(client);

    std::vector<Tag> tags;
    for (int page = 1; page <= CLOCKIFY_MAX_PAGES; ++page) {
        std::string path = WorkspacePath() + "/tags?page=" + std::to_string(page) +
                           "&page-size=" + std::to_string(CLOCKIFY_PAGE_SIZE);
        auto res = client.Get(path.c_str());
        nlohmann::json payload = CheckedBody(res, "GET tags");
        if (!payload.is_array()) {
            throw ClockifyError("GET tags: expected an array, got " +
                                std::string(payload.type_name()));
        }

        for (const auto &item : JsonParse::GetObjects(payload)) {
            auto id = JsonParse::FindString(item, "id");
            auto name = JsonParse::FindString(item, "name");
            if (!id || !name) {
                spdlog::warn("Skipping tag without id or name: {}", item.dump());
                continue;
            }
            tags.push_back(Tag{*id, *name});
        }

        if (payload.size() < static_cast<size_t>(CLOCKIFY_PAGE_SIZE)) {
            break;
        }
    }

    spdlog::debug("Fetched {} tags from workspace {}", tags.size(), m_WorkspaceId);
    return tags;
}

// ─────────────────────────────────────
TimeEntryRef ClockifyClient::StartTimeEntry(const std::string &description,
                                            const std::string &tagId) {
    nlohmann::json body = nlohmann::json::object();
    body["start"] = FormatTimestamp(std::chrono::system_clock::now());
    body["billable"] = true;
    body["description"] = description;
    body["projectId"] = m_ProjectId;
    body["tagIds"] = nlohmann::json::array();
    if (!tagId.empty()) {
        body["tagIds"].push_back(tagId);
    }

    httplib::Client client(m_Host);
    Configure(client);

    std::string path = WorkspacePath() + "/time-entries";
    spdlog::debug("POST {} {}", path, body.dump());
    auto res = client.Post(path.c_str(), body.dump(), "application/json");
    nlohmann::json payload = CheckedBody(res, "POST time-entries");

    auto id = JsonParse::FindString(payload, "id");
    auto userId = JsonParse::FindString(payload, "userId");
    if (!id || !userId) {
        throw ClockifyError("POST time-entries: response has no id or userId");
    }
    TimeEntryRef ref{*id, *userId};
    spdlog::info("Clocked in: entry {} for user {} ({})", ref.id, ref.user_id, description);
    return ref;
}

// ─────────────────────────────────────
void ClockifyClient::StopRunningTimeEntry(const TimeEntryRef &ref) {
    nlohmann::json body = nlohmann::json::object();
    body["end"] = FormatTimestamp(std::chrono::system_clock::now());

    httplib::Client client(m_Host);
    Configure(client);

    std::string path = WorkspacePath() + "/user/" + ref.user_id + "/time-entries";
    spdlog::debug("PATCH {} {}", path, body.dump());
    auto res = client.Patch(path.c_str(), body.dump(), "application/json");
    if (res && res->status == 404) {
        spdlog::warn("No running time entry for user {}", ref.user_id);
        return;
    }
    nlohmann::json payload = CheckedBody(res, "PATCH time-entries");
    spdlog::info("Clocked out: entry {} for user {}",
                 JsonParse::FindString(payload, "id").value_or(ref.id), ref.user_id);
}

// ─────────────────────────────────────
std::string ClockifyClient::FormatTimestamp(std::chrono::system_clock::time_point tp) {
    const auto since_epoch = tp.time_since_epoch();
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - secs).count();
    std::time_t t = static_cast<std::time_t>(secs.count());
    if (millis < 0) {
        // pre-epoch instants round the seconds down
        millis += 1000;
        t -= 1;
    }

    std::tm utc{};
    gmtime_r(&t, &utc);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);

    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", date, static_cast<int>(millis));
    return out;
}

// ─────────────────────────────────────
void ClockifyClient::Configure(httplib::Client &client) const {
    client.set_default_headers({
        {"X-Api-Key", m_ApiKey},
        {"Accept", "application/json"},
        {"User-Agent", "auto-timetracker"},
    });
    client.set_connection_timeout(2, 0);
    client.set_read_timeout(2, 0);
    client.set_write_timeout(2, 0);
}

// ─────────────────────────────────────
std::string ClockifyClient::WorkspacePath() const {
    return std::string(CLOCKIFY_API_PREFIX) + "/workspaces/" + m_WorkspaceId;
}

// ─────────────────────────────────────
nlohmann::json ClockifyClient::CheckedBody(const httplib::Result &res,
                                           const std::string &what) const {
    if (!res) {
        throw ClockifyError(what + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        spdlog::debug("{} response data: '{}'", what, res->body);
        throw ClockifyError(what + " failed with HTTP " + std::to_string(res->status));
    }
    try {
        return JsonParse::ParseOrThrow(res->body);
    } catch (const std::runtime_error &e) {
        throw ClockifyError(what + ": invalid JSON: " + e.what());
    }
}
