#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "segments/segment_extractor.hpp"

#include <nlohmann/json.hpp>

using Catch::Matchers::WithinAbs;
using json = nlohmann::json;

TEST_CASE("Segment extraction", "[segments]") {

    SECTION("SentenceInfoInOrder") {
        json record = {
            {"text", "ignored"},
            {"sentence_info", {
                {{"text", "第一句。"}, {"start", 0.0}, {"end", 1.5}},
                {{"text", "第二句。"}, {"start", 1.5}, {"end", 3.0}},
                {{"text", "第三句。"}, {"start", 3.2}, {"end", 4.8}},
            }},
        };

        auto segs = segments::extract(record);
        REQUIRE(segs.size() == 3);
        REQUIRE(segs[0].text == "第一句。");
        REQUIRE(segs[2].text == "第三句。");
        REQUIRE_THAT(segs[2].start_sec, WithinAbs(3.2, 1e-9));
        REQUIRE_THAT(segs[2].end_sec, WithinAbs(4.8, 1e-9));
    }

    SECTION("SentenceInfoSkipsIncompleteEntries") {
        json record = {
            {"sentence_info", {
                {{"text", "   "}, {"start", 0}, {"end", 1}},
                {{"text", "no end"}, {"start", 0}},
                {{"text", "bad start"}, {"start", "abc"}, {"end", 2}},
                {{"text", " kept "}, {"start", "2.5"}, {"end", 3}},
            }},
        };

        auto segs = segments::extract(record);
        REQUIRE(segs.size() == 1);
        REQUIRE(segs[0].text == "kept");
        REQUIRE_THAT(segs[0].start_sec, WithinAbs(2.5, 1e-9));
    }

    SECTION("IdeographicSpaceOnlyEntriesSkipped") {
        json record = {
            {"sentence_info", {
                {{"text", "　"}, {"start", 0}, {"end", 1}},
                {{"text", "　你好　"}, {"start", 1}, {"end", 2}},
            }},
        };

        auto segs = segments::extract(record);
        REQUIRE(segs.size() == 1);
        REQUIRE(segs[0].text == "你好");
    }

    SECTION("StampSentsMillisecondsToSeconds") {
        json record = {
            {"stamp_sents", {
                {{"text_seg", "hello world"}, {"punc", "."}, {"start", 1200}, {"end", 3400}},
            }},
        };

        auto segs = segments::extract(record);
        REQUIRE(segs.size() == 1);
        REQUIRE(segs[0].text == "hello world.");
        REQUIRE_THAT(segs[0].start_sec, WithinAbs(1.2, 1e-9));
        REQUIRE_THAT(segs[0].end_sec, WithinAbs(3.4, 1e-9));
    }

    SECTION("StampSentsEncodedAsString") {
        json record = {
            {"stamp_sents", R"([{"text_seg": "abc", "punc": "", "start": 0, "end": 500}])"},
        };

        auto segs = segments::extract(record);
        REQUIRE(segs.size() == 1);
        REQUIRE_THAT(segs[0].end_sec, WithinAbs(0.5, 1e-9));
    }

    SECTION("MalformedStampSentsFallsThroughToText") {
        json record = {
            {"stamp_sents", "not json ["},
            {"text", "你好。再见！"},
            {"timestamp", {{0, 500}, {500, 1000}, {1100, 1500}, {1500, 2000}}},
        };

        auto segs = segments::extract(record);
        REQUIRE(segs.size() == 2);
        REQUIRE_THAT(segs[0].end_sec, WithinAbs(1.0, 1e-9));
        REQUIRE_THAT(segs[1].start_sec, WithinAbs(1.1, 1e-9));
        REQUIRE_THAT(segs[1].end_sec, WithinAbs(2.0, 1e-9));
    }

    SECTION("TimestampEncodedAsString") {
        json record = {
            {"text", "一。二。"},
            {"timestamp", "[[0, 100], [200, 300]]"},
        };

        auto segs = segments::extract(record);
        REQUIRE(segs.size() == 2);
        REQUIRE_THAT(segs[1].start_sec, WithinAbs(0.2, 1e-9));
    }

    SECTION("SingleSentenceSpansAllStamps") {
        json record = {
            {"text", "one long sentence"},
            {"timestamp", {{100, 200}, {200, 900}, {900, 2500}}},
        };

        auto segs = segments::extract(record);
        REQUIRE(segs.size() == 1);
        REQUIRE_THAT(segs[0].start_sec, WithinAbs(0.1, 1e-9));
        REQUIRE_THAT(segs[0].end_sec, WithinAbs(2.5, 1e-9));
    }

    SECTION("TextWithoutTimestampIsUntimed") {
        json record = {{"text", "  plain  "}};

        auto segs = segments::extract(record);
        REQUIRE(segs.size() == 1);
        REQUIRE(segs[0].text == "plain");
        REQUIRE(segs[0].start_sec == 0.0);
        REQUIRE(segs[0].end_sec == 0.0);
    }

    SECTION("UnrecognizableRecordsGiveNothing") {
        REQUIRE(segments::extract(json::object()).empty());
        REQUIRE(segments::extract(json::array()).empty());
        REQUIRE(segments::extract(json{{"text", "   "}}).empty());
        REQUIRE(segments::extract(json{{"sentence_info", "nope"}, {"text", 5}}).empty());
    }
}

TEST_CASE("Sentence timing detection", "[segments]") {
    REQUIRE(segments::has_sentence_timing(json{{"sentence_info", {{{"text", "a"}}}}}));
    REQUIRE(segments::has_sentence_timing(json{{"stamp_sents", "[{}]"}}));
    REQUIRE_FALSE(segments::has_sentence_timing(json{{"stamp_sents", ""}}));
    REQUIRE_FALSE(segments::has_sentence_timing(json{{"sentence_info", json::array()}}));
    REQUIRE_FALSE(segments::has_sentence_timing(json{{"text", "x"}}));
}
