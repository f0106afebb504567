#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "clockify.hpp"

namespace {
std::string HeaderValue(const httplib::Headers &headers, const std::string &key) {
    auto it = headers.find(key);
    return it == headers.end() ? "" : it->second;
}

struct Seen {
    std::string method;
    std::string path;
    httplib::Headers headers;
    httplib::Params params;
    std::string body;
};

// Local stand-in for the Clockify API
class ClockifyClientTest : public ::testing::Test {
  protected:
    void SetUp() override {
        m_Port = m_Server.bind_to_any_port("127.0.0.1");
        ASSERT_GT(m_Port, 0);
        m_Thread = std::thread([this] { m_Server.listen_after_bind(); });
        while (!m_Server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    void TearDown() override {
        m_Server.stop();
        if (m_Thread.joinable()) {
            m_Thread.join();
        }
    }

    ClockifyClient MakeClient() {
        return ClockifyClient("http://127.0.0.1:" + std::to_string(m_Port), "secret-key", "ws1",
                              "proj1");
    }

    void Record(const httplib::Request &req) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Seen.push_back({req.method, req.path, req.headers, req.params, req.body});
    }

    std::vector<Seen> SeenRequests() {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_Seen;
    }

    static nlohmann::json Tags(int first, int count) {
        nlohmann::json arr = nlohmann::json::array();
        for (int i = first; i < first + count; ++i) {
            arr.push_back({{"id", "id" + std::to_string(i)}, {"name", "tag" + std::to_string(i)}});
        }
        return arr;
    }

    httplib::Server m_Server;
    int m_Port = -1;
    std::thread m_Thread;
    std::mutex m_Mutex;
    std::vector<Seen> m_Seen;
};
} // namespace

TEST(ClockifyTimestampTest, FormatsUtcWithMilliseconds) {
    using namespace std::chrono;
    EXPECT_EQ(ClockifyClient::FormatTimestamp(system_clock::time_point{}),
              "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(ClockifyClient::FormatTimestamp(system_clock::time_point{milliseconds(1136214245123)}),
              "2006-01-02T15:04:05.123Z");
}

TEST_F(ClockifyClientTest, GetTagsFollowsPages) {
    m_Server.Get("/api/v1/workspaces/ws1/tags", [this](const httplib::Request &req,
                                                       httplib::Response &res) {
        Record(req);
        int page = std::stoi(req.get_param_value("page"));
        nlohmann::json body = page == 1 ? Tags(0, CLOCKIFY_PAGE_SIZE) : Tags(100, 3);
        res.set_content(body.dump(), "application/json");
    });

    auto tags = MakeClient().GetTags();

    ASSERT_EQ(tags.size(), static_cast<size_t>(CLOCKIFY_PAGE_SIZE + 3));
    EXPECT_EQ(tags.front().id, "id0");
    EXPECT_EQ(tags.front().name, "tag0");
    EXPECT_EQ(tags.back().id, "id102");

    auto seen = SeenRequests();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].method, "GET");
    EXPECT_EQ(seen[1].params.find("page")->second, "2");
    EXPECT_EQ(seen[0].params.find("page-size")->second, std::to_string(CLOCKIFY_PAGE_SIZE));
    EXPECT_EQ(HeaderValue(seen[0].headers, "X-Api-Key"), "secret-key");
    EXPECT_EQ(HeaderValue(seen[0].headers, "User-Agent"), "auto-timetracker");
}

TEST_F(ClockifyClientTest, GetTagsSkipsIncompleteItems) {
    m_Server.Get("/api/v1/workspaces/ws1/tags", [](const httplib::Request &,
                                                   httplib::Response &res) {
        nlohmann::json body = nlohmann::json::array(
            {{{"id", "a"}, {"name", "@Work"}}, {{"id", "b"}}, "junk", {{"id", "c"}, {"name", "@PC"}}});
        res.set_content(body.dump(), "application/json");
    });

    auto tags = MakeClient().GetTags();

    ASSERT_EQ(tags.size(), 2u);
    EXPECT_EQ(tags[0].name, "@Work");
    EXPECT_EQ(tags[1].name, "@PC");
}

TEST_F(ClockifyClientTest, GetTagsRejectsNonArray) {
    m_Server.Get("/api/v1/workspaces/ws1/tags", [](const httplib::Request &,
                                                   httplib::Response &res) {
        res.set_content(R"({"message":"nope"})", "application/json");
    });

    EXPECT_THROW(MakeClient().GetTags(), ClockifyError);
}

TEST_F(ClockifyClientTest, StartTimeEntryPostsEntryAndReturnsRef) {
    m_Server.Post("/api/v1/workspaces/ws1/time-entries", [this](const httplib::Request &req,
                                                                httplib::Response &res) {
        Record(req);
        res.status = 201;
        res.set_content(R"({"id":"e42","userId":"u7","description":"Normal Work"})",
                        "application/json");
    });

    TimeEntryRef ref = MakeClient().StartTimeEntry("Normal Work", "t-pc");

    EXPECT_EQ(ref.id, "e42");
    EXPECT_EQ(ref.user_id, "u7");

    auto seen = SeenRequests();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(HeaderValue(seen[0].headers, "Content-Type"), "application/json");
    auto body = nlohmann::json::parse(seen[0].body);
    EXPECT_EQ(body["description"], "Normal Work");
    EXPECT_EQ(body["projectId"], "proj1");
    EXPECT_EQ(body["billable"], true);
    EXPECT_EQ(body["tagIds"], nlohmann::json::array({"t-pc"}));
    std::string start = body["start"].get<std::string>();
    ASSERT_EQ(start.size(), 24u);
    EXPECT_EQ(start.back(), 'Z');
    EXPECT_EQ(start[19], '.');
}

TEST_F(ClockifyClientTest, StartTimeEntryWithoutTagSendsEmptyTagIds) {
    m_Server.Post("/api/v1/workspaces/ws1/time-entries", [this](const httplib::Request &req,
                                                                httplib::Response &res) {
        Record(req);
        res.status = 201;
        res.set_content(R"({"id":"e1","userId":"u1"})", "application/json");
    });

    MakeClient().StartTimeEntry("Remote Work", "");

    auto body = nlohmann::json::parse(SeenRequests().at(0).body);
    EXPECT_TRUE(body["tagIds"].is_array());
    EXPECT_TRUE(body["tagIds"].empty());
}

TEST_F(ClockifyClientTest, StartTimeEntryFailsOnErrorStatus) {
    m_Server.Post("/api/v1/workspaces/ws1/time-entries", [](const httplib::Request &,
                                                            httplib::Response &res) {
        res.status = 400;
        res.set_content(R"({"message":"bad project"})", "application/json");
    });

    EXPECT_THROW(MakeClient().StartTimeEntry("Normal Work", ""), ClockifyError);
}

TEST_F(ClockifyClientTest, StartTimeEntryFailsWithoutIds) {
    m_Server.Post("/api/v1/workspaces/ws1/time-entries", [](const httplib::Request &,
                                                            httplib::Response &res) {
        res.status = 201;
        res.set_content(R"({"description":"Normal Work"})", "application/json");
    });

    EXPECT_THROW(MakeClient().StartTimeEntry("Normal Work", ""), ClockifyError);
}

TEST_F(ClockifyClientTest, StartTimeEntryFailsOnInvalidJson) {
    m_Server.Post("/api/v1/workspaces/ws1/time-entries", [](const httplib::Request &,
                                                            httplib::Response &res) {
        res.status = 201;
        res.set_content("<html>gateway</html>", "text/html");
    });

    EXPECT_THROW(MakeClient().StartTimeEntry("Normal Work", ""), ClockifyError);
}

TEST_F(ClockifyClientTest, StopRunningTimeEntryPatchesUserEntries) {
    m_Server.Patch("/api/v1/workspaces/ws1/user/u7/time-entries",
                   [this](const httplib::Request &req, httplib::Response &res) {
                       Record(req);
                       res.set_content(R"({"id":"e42","userId":"u7"})", "application/json");
                   });

    MakeClient().StopRunningTimeEntry(TimeEntryRef{"e42", "u7"});

    auto seen = SeenRequests();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].method, "PATCH");
    auto body = nlohmann::json::parse(seen[0].body);
    ASSERT_TRUE(body.contains("end"));
    EXPECT_EQ(body.size(), 1u);
}

TEST_F(ClockifyClientTest, StopWithNothingRunningIsNotAnError) {
    m_Server.Patch("/api/v1/workspaces/ws1/user/u7/time-entries",
                   [](const httplib::Request &, httplib::Response &res) {
                       res.status = 404;
                       res.set_content(R"({"message":"no running entry"})", "application/json");
                   });

    EXPECT_NO_THROW(MakeClient().StopRunningTimeEntry(TimeEntryRef{"e42", "u7"}));
}

TEST_F(ClockifyClientTest, StopFailsOnServerError) {
    m_Server.Patch("/api/v1/workspaces/ws1/user/u7/time-entries",
                   [](const httplib::Request &, httplib::Response &res) { res.status = 500; });

    EXPECT_THROW(MakeClient().StopRunningTimeEntry(TimeEntryRef{"e42", "u7"}), ClockifyError);
}

TEST(ClockifyUnreachableTest, TransportFailureThrows) {
    // nothing listens on port 1
    ClockifyClient client("http://127.0.0.1:1", "k", "ws1", "proj1");
    EXPECT_THROW(client.GetTags(), ClockifyError);
}

TEST_F(ClockifyClientTest, GetTagsSkipsNonStringIds) {
    m_Server.Get("/api/v1/workspaces/ws1/tags", [](const httplib::Request &,
                                                   httplib::Response &res) {
        res.set_content(R"([{"id":17,"name":"@Work"},{"id":"","name":"@PC"},{"id":"p","name":"@Phone"}])",
                        "application/json");
    });

    auto tags = MakeClient().GetTags();

    ASSERT_EQ(tags.size(), 1u);
    EXPECT_EQ(tags[0].id, "p");
}
