#include <catch2/catch_test_macros.hpp>
#include "sse.hpp"
#include <vector>

using namespace docrelay;

// Helper: collect all frames from a single feed
static std::vector<Frame> collect_frames(FrameDecoder& decoder, const std::string& chunk) {
    std::vector<Frame> frames;
    decoder.feed(chunk, [&](const Frame& f) { frames.push_back(f); });
    return frames;
}

static const std::string kSequence =
    "event: progress\ndata: {\"progress\":10,\"message\":\"Cloning\"}\n\n"
    "event: progress\r\ndata: {\"progress\":60,\"message\":\"Writing\"}\r\n\r\n"
    ": keep-alive\n\n"
    "event: done\ndata: {\"docs\":{\"title\":\"X\"}}\n\n"
    "event: saved\ndata: {\"slug\":\"x-owner123\",\"repoName\":\"x\"}\n\n";

// ── Basic frame decoding ────────────────────────────────────────

TEST_CASE("FrameDecoder: named frame", "[sse]") {
    FrameDecoder decoder;
    auto frames = collect_frames(decoder, "event: progress\ndata: {}\n\n");
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0].kind == "progress");
    REQUIRE(frames[0].payload == "{}");
}

TEST_CASE("FrameDecoder: data without a space after the colon", "[sse]") {
    FrameDecoder decoder;
    auto frames = collect_frames(decoder, "event:done\ndata:{\"docs\":1}\n\n");
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0].kind == "done");
    REQUIRE(frames[0].payload == "{\"docs\":1}");
}

TEST_CASE("FrameDecoder: multiple data lines joined with newline", "[sse]") {
    FrameDecoder decoder;
    auto frames = collect_frames(decoder, "event: done\ndata: line1\ndata: line2\n\n");
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0].payload == "line1\nline2");
}

TEST_CASE("FrameDecoder: CRLF line endings", "[sse]") {
    FrameDecoder decoder;
    auto frames = collect_frames(decoder, "event: error\r\ndata: {\"error\":\"x\"}\r\n\r\n");
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0].kind == "error");
    REQUIRE(frames[0].payload == "{\"error\":\"x\"}");
}

TEST_CASE("FrameDecoder: comments and unknown fields ignored", "[sse]") {
    FrameDecoder decoder;
    auto frames = collect_frames(decoder,
        ": ping\nid: 7\nretry: 100\nevent: progress\ndata: {}\n\n");
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0].kind == "progress");
}

TEST_CASE("FrameDecoder: blank line without data dispatches nothing and clears kind", "[sse]") {
    FrameDecoder decoder;
    auto frames = collect_frames(decoder, "event: done\n\ndata: {}\n\n");
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0].kind.empty());
}

TEST_CASE("FrameDecoder: kind cleared after each frame", "[sse]") {
    FrameDecoder decoder;
    auto frames = collect_frames(decoder, "event: progress\ndata: a\n\ndata: b\n\n");
    REQUIRE(frames.size() == 2);
    REQUIRE(frames[0].kind == "progress");
    REQUIRE(frames[1].kind.empty());
}

// ── State across feeds ──────────────────────────────────────────

TEST_CASE("FrameDecoder: incomplete line kept for next feed", "[sse]") {
    FrameDecoder decoder;
    auto frames = collect_frames(decoder, "event: prog");
    REQUIRE(frames.empty());
    REQUIRE(decoder.partial_line() == "event: prog");

    frames = collect_frames(decoder, "ress\ndata: {}\n");
    REQUIRE(frames.empty());
    REQUIRE(decoder.pending_kind() == "progress");

    frames = collect_frames(decoder, "\n");
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0].kind == "progress");
}

TEST_CASE("FrameDecoder: CR and LF split across feeds", "[sse]") {
    FrameDecoder decoder;
    std::vector<Frame> frames;
    auto cb = [&](const Frame& f) { frames.push_back(f); };
    decoder.feed("event: done\r", cb);
    decoder.feed("\ndata: 1\r", cb);
    decoder.feed("\n\r", cb);
    decoder.feed("\n", cb);
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0].kind == "done");
    REQUIRE(frames[0].payload == "1");
}

TEST_CASE("FrameDecoder: every two-way split yields the same frames", "[sse]") {
    FrameDecoder whole;
    auto expected = collect_frames(whole, kSequence);
    REQUIRE(expected.size() == 4);

    for (size_t split = 0; split <= kSequence.size(); ++split) {
        FrameDecoder decoder;
        std::vector<Frame> got;
        auto cb = [&](const Frame& f) { got.push_back(f); };
        decoder.feed(kSequence.substr(0, split), cb);
        decoder.feed(kSequence.substr(split), cb);

        REQUIRE(got.size() == expected.size());
        for (size_t i = 0; i < got.size(); ++i) {
            REQUIRE(got[i].kind == expected[i].kind);
            REQUIRE(got[i].payload == expected[i].payload);
        }
    }
}

TEST_CASE("FrameDecoder: byte-at-a-time feed yields the same frames", "[sse]") {
    FrameDecoder whole;
    auto expected = collect_frames(whole, kSequence);

    FrameDecoder decoder;
    std::vector<Frame> got;
    for (char c : kSequence) {
        decoder.feed(&c, 1, [&](const Frame& f) { got.push_back(f); });
    }
    REQUIRE(got.size() == expected.size());
    for (size_t i = 0; i < got.size(); ++i) {
        REQUIRE(got[i].kind == expected[i].kind);
        REQUIRE(got[i].payload == expected[i].payload);
    }
}

TEST_CASE("FrameDecoder: reset discards partial state", "[sse]") {
    FrameDecoder decoder;
    collect_frames(decoder, "event: done\ndata: {\"do");
    decoder.reset();
    REQUIRE(decoder.partial_line().empty());
    REQUIRE(decoder.pending_kind().empty());

    auto frames = collect_frames(decoder, "\n\n");
    REQUIRE(frames.empty());
}
