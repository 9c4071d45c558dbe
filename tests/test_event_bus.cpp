#include <catch2/catch_test_macros.hpp>
#include "event_bus.hpp"
#include <string>
#include <vector>

using namespace docrelay;

// Appends one line per delivered event, in delivery order.
struct Timeline {
    std::vector<std::string> lines;

    void watch(EventBus& bus) {
        subscribe<GenerationStateChangedEvent>(bus, [this](const GenerationStateChangedEvent& e) {
            lines.push_back("state " + e.from + "->" + e.to);
        });
        subscribe<GenerationProgressEvent>(bus, [this](const GenerationProgressEvent& e) {
            lines.push_back("progress " + std::to_string(e.progress) + " " + e.message);
        });
        subscribe<GenerationErrorEvent>(bus, [this](const GenerationErrorEvent& e) {
            lines.push_back("error " + e.error);
        });
        subscribe<ArtifactSavedEvent>(bus, [this](const ArtifactSavedEvent& e) {
            lines.push_back("saved " + e.slug);
        });
    }
};

static GenerationProgressEvent progress(int pct, const std::string& message) {
    GenerationProgressEvent ev;
    ev.progress = pct;
    ev.message = message;
    return ev;
}

TEST_CASE("EventBus: a generation run is seen in publish order", "[event_bus]") {
    EventBus bus;
    Timeline timeline;
    timeline.watch(bus);

    GenerationStateChangedEvent requesting;
    requesting.from = "idle";
    requesting.to = "requesting";
    bus.publish(requesting);
    bus.publish(progress(30, "reading sources"));
    bus.publish(progress(90, "writing"));
    ArtifactSavedEvent saved;
    saved.slug = "widgets-owner-12";
    bus.publish(saved);

    REQUIRE(timeline.lines == std::vector<std::string>{
        "state idle->requesting",
        "progress 30 reading sources",
        "progress 90 writing",
        "saved widgets-owner-12",
    });
}

TEST_CASE("EventBus: only handlers for the published tag run", "[event_bus]") {
    EventBus bus;
    int progress_seen = 0;
    int errors_seen = 0;
    bus.subscribe(GenerationProgressEvent::TAG, [&](const Event&) { ++progress_seen; });
    bus.subscribe(GenerationErrorEvent::TAG, [&](const Event&) { ++errors_seen; });

    GenerationErrorEvent failed;
    failed.error = "Agent error: 500";
    bus.publish(failed);
    bus.publish(GenerationResultEvent{});

    REQUIRE(progress_seen == 0);
    REQUIRE(errors_seen == 1);
}

TEST_CASE("EventBus: handlers of one tag run in subscription order", "[event_bus]") {
    EventBus bus;
    std::string trace;
    bus.subscribe(GenerationResultEvent::TAG, [&](const Event&) { trace += "display,"; });
    bus.subscribe(GenerationResultEvent::TAG, [&](const Event&) { trace += "write,"; });

    GenerationResultEvent done;
    done.docs = {{"title", "Widgets"}};
    bus.publish(done);
    REQUIRE(trace == "display,write,");
}

TEST_CASE("EventBus: result handler sees the docs payload", "[event_bus]") {
    EventBus bus;
    nlohmann::json seen;
    subscribe<GenerationResultEvent>(bus, [&](const GenerationResultEvent& e) { seen = e.docs; });

    GenerationResultEvent done;
    done.docs = {{"sections", {"intro", "api"}}};
    bus.publish(done);
    REQUIRE(seen["sections"][1] == "api");
}

TEST_CASE("EventBus: unsubscribed handler stops receiving", "[event_bus]") {
    EventBus bus;
    Timeline timeline;
    uint64_t id = subscribe<GenerationProgressEvent>(bus, [&](const GenerationProgressEvent& e) {
        timeline.lines.push_back(e.message);
    });

    bus.publish(progress(10, "first"));
    REQUIRE(bus.unsubscribe(id));
    REQUIRE_FALSE(bus.unsubscribe(id));
    bus.publish(progress(20, "second"));

    REQUIRE(timeline.lines == std::vector<std::string>{"first"});
    REQUIRE(bus.subscriber_count(GenerationProgressEvent::TAG) == 0);
}

TEST_CASE("EventBus: one-shot handler removes itself while being called", "[event_bus]") {
    EventBus bus;
    int calls = 0;
    uint64_t id = 0;
    id = bus.subscribe(ArtifactSavedEvent::TAG, [&](const Event&) {
        ++calls;
        bus.unsubscribe(id);
    });

    ArtifactSavedEvent saved;
    bus.publish(saved);
    bus.publish(saved);
    REQUIRE(calls == 1);
}

TEST_CASE("EventBus: subscriber_count per tag", "[event_bus]") {
    EventBus bus;
    Timeline timeline;
    timeline.watch(bus);
    bus.subscribe(GenerationProgressEvent::TAG, [](const Event&) {});

    REQUIRE(bus.subscriber_count(GenerationProgressEvent::TAG) == 2);
    REQUIRE(bus.subscriber_count(ArtifactSavedEvent::TAG) == 1);
    REQUIRE(bus.subscriber_count(GenerationResultEvent::TAG) == 0);
    REQUIRE(bus.subscriber_count("unknown") == 0);
}
