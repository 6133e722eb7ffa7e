#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "segments/sentence_splitter.hpp"

#include <string>
#include <vector>

using Catch::Matchers::WithinAbs;
using namespace segments;

TEST_CASE("split_sentences", "[segments]") {

    SECTION("SplitsOnFullWidthMarks") {
        auto s = split_sentences("你好。再见！真的吗？好；");
        REQUIRE(s == std::vector<std::string>{"你好。", "再见！", "真的吗？", "好；"});
    }

    SECTION("RunOfMarksIsOneBoundary") {
        auto s = split_sentences("真的吗？！好的。");
        REQUIRE(s == std::vector<std::string>{"真的吗？！", "好的。"});
    }

    SECTION("TrailingFragmentWithoutMark") {
        auto s = split_sentences("第一句。第二句");
        REQUIRE(s == std::vector<std::string>{"第一句。", "第二句"});
    }

    SECTION("IdeographicSpaceFragmentsDropped") {
        auto s = split_sentences("\u3000。你好。");
        REQUIRE(s == std::vector<std::string>{"你好。"});
    }

    SECTION("WhitespaceFragmentsDropped") {
        auto s = split_sentences("  。你好。  ");
        REQUIRE(s == std::vector<std::string>{"你好。"});
    }

    SECTION("AsciiPunctuationIsNotABoundary") {
        auto s = split_sentences("Hello. World!");
        REQUIRE(s == std::vector<std::string>{"Hello. World!"});
    }

    SECTION("NoFragmentsReturnsWholeText") {
        auto s = split_sentences("。！");
        REQUIRE(s == std::vector<std::string>{"。！"});
    }
}

TEST_CASE("locate_sentences", "[segments]") {

    SECTION("MonotonicSpans") {
        std::string text = "你好。你好。";
        auto spans = locate_sentences({"你好。", "你好。"}, text);
        REQUIRE(spans.size() == 2);
        REQUIRE(spans[0].begin == 0);
        REQUIRE(spans[1].begin > spans[0].begin);
        REQUIRE(spans[1].begin >= spans[0].end);
    }

    SECTION("MissingSentenceFallsBackToScanPosition") {
        std::string text = "abc def";
        auto spans = locate_sentences({"abc", "zzz"}, text);
        REQUIRE(spans.size() == 2);
        REQUIRE(spans[1].begin == spans[0].end);
        REQUIRE(spans[0].found);
        REQUIRE_FALSE(spans[1].found);
    }
}

TEST_CASE("map_sentences_to_timestamps", "[segments]") {

    SECTION("TwoSentencesFourStamps") {
        std::string text = "你好。再见！";
        auto segs = map_sentences_to_timestamps(
            split_sentences(text),
            {{0, 500}, {500, 1000}, {1100, 1500}, {1500, 2000}}, text);

        REQUIRE(segs.size() == 2);
        REQUIRE(segs[0].text == "你好。");
        REQUIRE_THAT(segs[0].start_sec, WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(segs[0].end_sec, WithinAbs(1.0, 1e-9));
        REQUIRE(segs[1].text == "再见！");
        REQUIRE_THAT(segs[1].start_sec, WithinAbs(1.1, 1e-9));
        REQUIRE_THAT(segs[1].end_sec, WithinAbs(2.0, 1e-9));
    }

    SECTION("RemainderGoesToLeadingGroups") {
        // 5 stamps over 3 sentences: 2 + 2 + 1
        std::vector<WordStamp> stamps = {
            {0, 100}, {100, 200}, {200, 300}, {300, 400}, {400, 500},
        };
        auto segs = map_sentences_to_timestamps({"a。", "b。", "c。"}, stamps, "a。b。c。");

        REQUIRE(segs.size() == 3);
        REQUIRE_THAT(segs[0].start_sec, WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(segs[0].end_sec, WithinAbs(0.2, 1e-9));
        REQUIRE_THAT(segs[1].start_sec, WithinAbs(0.2, 1e-9));
        REQUIRE_THAT(segs[1].end_sec, WithinAbs(0.4, 1e-9));
        REQUIRE_THAT(segs[2].start_sec, WithinAbs(0.4, 1e-9));
        REQUIRE_THAT(segs[2].end_sec, WithinAbs(0.5, 1e-9));
    }

    SECTION("FewerStampsDropsTrailingSentences") {
        auto segs = map_sentences_to_timestamps({"a。", "b。", "c。"}, {{0, 100}, {100, 300}},
                                                "a。b。c。");

        REQUIRE(segs.size() == 2);
        REQUIRE(segs[0].text == "a。");
        REQUIRE(segs[1].text == "b。");
        REQUIRE_THAT(segs[1].end_sec, WithinAbs(0.3, 1e-9));
    }

    SECTION("EmptyInputs") {
        REQUIRE(map_sentences_to_timestamps({}, {{0, 1}}, "a").empty());
        REQUIRE(map_sentences_to_timestamps({"a"}, {}, "a").empty());
    }

    SECTION("TextComesFromLocatedSpan") {
        std::string text = "好。好。";
        auto segs = map_sentences_to_timestamps({"好。", "好。"}, {{0, 100}, {100, 200}}, text);

        REQUIRE(segs.size() == 2);
        REQUIRE(segs[0].text == "好。");
        REQUIRE(segs[1].text == "好。");
        REQUIRE_THAT(segs[1].start_sec, WithinAbs(0.1, 1e-9));
    }

    SECTION("UnlocatedSentenceKeepsItsOwnText") {
        auto segs = map_sentences_to_timestamps({"abc", "zzz"}, {{0, 100}, {100, 200}}, "abc def");

        REQUIRE(segs.size() == 2);
        REQUIRE(segs[0].text == "abc");
        REQUIRE(segs[1].text == "zzz");
    }
}

TEST_CASE("trim", "[segments]") {

    SECTION("AsciiWhitespace") {
        REQUIRE(trim("  hi \n") == "hi");
        REQUIRE(trim(" \t\r\n").empty());
        REQUIRE(trim("x") == "x");
    }

    SECTION("IdeographicSpace") {
        REQUIRE(trim("\u3000你好\u3000 ") == "你好");
        REQUIRE(trim("\u3000").empty());
    }

    SECTION("OtherUnicodeSpaces") {
        REQUIRE(trim("\u00A0a\u2003") == "a");
        REQUIRE(trim("\u202F\u205F").empty());
    }

    SECTION("InnerSpacesKept") {
        REQUIRE(trim("\u3000a\u3000b\u3000") == "a\u3000b");
    }
}
