#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "timeservice.hpp"

#define CLOCKIFY_DEFAULT_HOST "https://api.clockify.me"
#define CLOCKIFY_API_PREFIX "/api/v1"
#define CLOCKIFY_PAGE_SIZE 50
#define CLOCKIFY_MAX_PAGES 100

class ClockifyError : public std::runtime_error {
  public:
    explicit ClockifyError(const std::string &what) : std::runtime_error(what) {}
};

class ClockifyClient : public TimeService {
  public:
    ClockifyClient(std::string host, std::string apiKey, std::string workspaceId,
                   std::string projectId);

    std::vector<Tag> GetTags() override;
    TimeEntryRef StartTimeEntry(const std::string &description, const std::string &tagId) override;
    void StopRunningTimeEntry(const TimeEntryRef &ref) override;

    // 2006-01-02T15:04:05.000Z
    static std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

  private:
    void Configure(httplib::Client &client) const;
    std::string WorkspacePath() const;
    nlohmann::json CheckedBody(const httplib::Result &res, const std::string &what) const;

    std::string m_Host;
    std::string m_ApiKey;
    std::string m_WorkspaceId;
    std::string m_ProjectId;
};
