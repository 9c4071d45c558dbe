#include <catch2/catch_test_macros.hpp>
#include "completion.hpp"
#include "frame.hpp"
#include "fake_artifact_store.hpp"
#include "recording_sink.hpp"

using namespace docrelay;

static GenerationSession owned_session() {
    GenerationSession s;
    s.owner = "user-0123456789";
    s.repo_url = "https://github.com/acme/widgets";
    s.repo_name = "widgets";
    return s;
}

TEST_CASE("CompletionHandler: persists docs and writes saved frame", "[completion]") {
    FakeArtifactStore store;
    RecordingSink sink;
    CompletionHandler handler(store, owned_session());

    auto slug = handler.complete({{"docs", {{"title", "W"}}}}, sink);

    REQUIRE(slug.has_value());
    REQUIRE(*slug == "widgets-user-012");
    REQUIRE(store.calls.size() == 1);
    REQUIRE(store.calls[0].owner == "user-0123456789");
    REQUIRE(store.calls[0].repo_url == "https://github.com/acme/widgets");
    REQUIRE(store.calls[0].docs["title"] == "W");
    REQUIRE(sink.bytes ==
            encode_frame("saved", R"({"repoName":"widgets","slug":"widgets-user-012"})"));
    REQUIRE(handler.fired());
}

TEST_CASE("CompletionHandler: fires at most once", "[completion]") {
    FakeArtifactStore store;
    RecordingSink sink;
    CompletionHandler handler(store, owned_session());

    REQUIRE(handler.complete({{"docs", 1}}, sink).has_value());
    REQUIRE_FALSE(handler.complete({{"docs", 2}}, sink).has_value());
    REQUIRE(store.calls.size() == 1);
    REQUIRE(sink.write_calls == 1);
}

TEST_CASE("CompletionHandler: payload without docs persists nothing", "[completion]") {
    FakeArtifactStore store;
    RecordingSink sink;
    CompletionHandler handler(store, owned_session());

    REQUIRE_FALSE(handler.complete({{"result", "x"}}, sink).has_value());
    REQUIRE_FALSE(handler.complete(nlohmann::json::array(), sink).has_value());
    REQUIRE(store.calls.empty());
    REQUIRE(sink.bytes.empty());
}

TEST_CASE("CompletionHandler: store failure is swallowed, no saved frame", "[completion]") {
    FakeArtifactStore store;
    store.fail = true;
    RecordingSink sink;
    CompletionHandler handler(store, owned_session());

    std::optional<std::string> slug;
    REQUIRE_NOTHROW(slug = handler.complete({{"docs", {{"a", 1}}}}, sink));
    REQUIRE_FALSE(slug.has_value());
    REQUIRE(store.calls.size() == 1);
    REQUIRE(sink.bytes.empty());
}

TEST_CASE("CompletionHandler: no owner means no persistence", "[completion]") {
    FakeArtifactStore store;
    RecordingSink sink;
    GenerationSession anon = owned_session();
    anon.owner.reset();
    CompletionHandler handler(store, anon);

    REQUIRE_FALSE(handler.complete({{"docs", 1}}, sink).has_value());
    REQUIRE(store.calls.empty());
}

TEST_CASE("CompletionHandler: refused saved frame still reports the slug", "[completion]") {
    FakeArtifactStore store;
    RecordingSink sink;
    sink.accept_writes = 0;
    CompletionHandler handler(store, owned_session());

    auto slug = handler.complete({{"docs", 1}}, sink);
    REQUIRE(slug.has_value());
    REQUIRE(store.count() == 1);
}
