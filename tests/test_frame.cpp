#include <catch2/catch_test_macros.hpp>
#include "frame.hpp"

using namespace docrelay;

TEST_CASE("encode_frame: event line, data line, blank line", "[frame]") {
    REQUIRE(encode_frame("progress", R"({"progress":5})") ==
            "event: progress\ndata: {\"progress\":5}\n\n");
}

TEST_CASE("encode_frame: Frame overload matches", "[frame]") {
    Frame f{frame_kinds::Saved, R"({"slug":"a-b"})"};
    REQUIRE(encode_frame(f) == encode_frame("saved", R"({"slug":"a-b"})"));
}

TEST_CASE("is_event_stream: media type match", "[frame]") {
    REQUIRE(is_event_stream("text/event-stream"));
    REQUIRE(is_event_stream("Text/Event-Stream"));
    REQUIRE(is_event_stream("text/event-stream; charset=utf-8"));
    REQUIRE(is_event_stream(" text/event-stream ;charset=utf-8"));
}

TEST_CASE("is_event_stream: other types rejected", "[frame]") {
    REQUIRE_FALSE(is_event_stream("application/json"));
    REQUIRE_FALSE(is_event_stream(""));
    REQUIRE_FALSE(is_event_stream("text/event-streamx"));
}
