#include <catch2/catch_test_macros.hpp>

#include "download/download_manager.hpp"
#include "download/status_stream.hpp"
#include "mock_runtime.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <vector>

using namespace std::chrono_literals;
using json = nlohmann::json;

TEST_CASE("DownloadStatusStream", "[downloads]") {
    MockFetcher fetcher;
    DownloadManager mgr(fetcher, "/cache");

    SECTION("UnknownModelYieldsOneError") {
        DownloadStatusStream stream(mgr, "nope", 1ms);

        auto event = stream.next();
        REQUIRE(event);
        REQUIRE((*event)["status"] == "error");
        REQUIRE((*event)["kind"] == "NotFound");
        REQUIRE((*event)["message"] == "Model nope not found");
        REQUIRE(stream.finished());
        REQUIRE_FALSE(stream.next());
    }

    SECTION("FollowsToCompletion") {
        fetcher.files = {{.name = "w", .size = 300, .chunks = {100, 100, 100}}};
        fetcher.chunk_delay = 5ms;
        REQUIRE(mgr.submit("m"));

        DownloadStatusStream stream(mgr, "m", 1ms);
        std::vector<json> events;
        while (auto e = stream.next()) events.push_back(*e);

        REQUIRE_FALSE(events.empty());
        for (auto& e : events) {
            REQUIRE(e["status"] == "ok");
            REQUIRE(e["event"] == "progress");
        }
        REQUIRE(events.back()["download"]["state"] == "completed");
        REQUIRE(events.back()["download"]["progress"] == 100.0);

        // Only changes are emitted
        for (size_t i = 1; i < events.size(); ++i) {
            bool changed = events[i]["download"]["state"] != events[i - 1]["download"]["state"] ||
                           events[i]["download"]["progress"] != events[i - 1]["download"]["progress"];
            REQUIRE(changed);
        }
    }

    SECTION("PollIsSilentWithoutChange") {
        fetcher.hold();
        REQUIRE(mgr.submit("m"));
        REQUIRE(wait_until([&] { return mgr.status("m").state == DownloadStatus::Downloading; }));

        DownloadStatusStream stream(mgr, "m", 1ms);
        REQUIRE(stream.poll());
        REQUIRE_FALSE(stream.poll());
        REQUIRE_FALSE(stream.finished());

        fetcher.release();
        REQUIRE(wait_until([&] { return mgr.status("m").terminal(); }));
        auto last = stream.poll();
        REQUIRE(last);
        REQUIRE((*last)["download"]["state"] == "completed");
        REQUIRE(stream.finished());
    }

    SECTION("EndsOnFailure") {
        fetcher.failure = Error{.kind = ErrorKind::TransientIO, .message = "boom"};
        REQUIRE(mgr.submit("m"));
        REQUIRE(wait_until([&] { return mgr.status("m").terminal(); }));

        DownloadStatusStream stream(mgr, "m", 1ms);
        auto e = stream.next();
        REQUIRE(e);
        REQUIRE((*e)["download"]["state"] == "failed");
        REQUIRE((*e)["download"]["error"] == "boom");
        REQUIRE_FALSE(stream.next());
    }
}
