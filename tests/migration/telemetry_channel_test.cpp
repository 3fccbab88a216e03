/**
 * @file telemetry_channel_test.cpp
 * @brief Unit tests for the per-job telemetry channel
 */

#include <migrator/migration/telemetry_channel.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace migrator;
using namespace migrator::migration;

namespace {

telemetry_event make_log(const std::string& job_id, uint64_t sequence,
                         const std::string& text = "") {
    log_line line;
    line.sequence = sequence;
    line.source = log_source::export_;
    line.timestamp = std::chrono::system_clock::now();
    line.text = text.empty() ? "line " + std::to_string(sequence) : text;
    return telemetry_event{job_id, line};
}

subscription subscribe_to(telemetry_channel& channel, const std::string& job_id,
                          bool replay = false) {
    auto result = channel.subscribe(job_id, replay);
    REQUIRE(result.is_ok());
    return std::move(result.value());
}

uint64_t sequence_of(const telemetry_event& event) {
    return std::get<log_line>(event.payload).sequence;
}

}  // namespace

TEST_CASE("telemetry_channel delivers to every subscriber in order", "[telemetry]") {
    telemetry_channel channel(64);
    channel.open("job-1");

    auto first = channel.subscribe("job-1");
    auto second = channel.subscribe("job-1");
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());
    CHECK(channel.subscriber_count("job-1") == 2);

    auto sub_a = std::move(first.value());
    auto sub_b = std::move(second.value());

    for (uint64_t i = 1; i <= 10; ++i) {
        channel.publish(make_log("job-1", i));
    }

    auto events_a = sub_a.drain();
    auto events_b = sub_b.drain();
    REQUIRE(events_a.size() == 10);
    REQUIRE(events_b.size() == 10);
    for (uint64_t i = 0; i < 10; ++i) {
        CHECK(sequence_of(events_a[i]) == i + 1);
        CHECK(sequence_of(events_b[i]) == i + 1);
    }
    CHECK(sub_a.dropped_count() == 0);
}

TEST_CASE("telemetry_channel keeps jobs separate", "[telemetry]") {
    telemetry_channel channel;
    channel.open("job-1");
    channel.open("job-2");

    auto sub = subscribe_to(channel, "job-1");
    channel.publish(make_log("job-2", 1));
    channel.publish(make_log("job-1", 1));

    auto events = sub.drain();
    REQUIRE(events.size() == 1);
    CHECK(events[0].job_id == "job-1");
}

TEST_CASE("telemetry_channel drops the oldest events when a subscriber lags",
          "[telemetry]") {
    telemetry_channel channel(4);
    channel.open("job-1");

    auto sub = subscribe_to(channel, "job-1");
    for (uint64_t i = 1; i <= 10; ++i) {
        channel.publish(make_log("job-1", i));
    }

    CHECK(sub.dropped_count() == 6);
    auto events = sub.drain();
    REQUIRE(events.size() == 4);
    CHECK(sequence_of(events.front()) == 7);
    CHECK(sequence_of(events.back()) == 10);
}

TEST_CASE("telemetry_channel subscription ends after close", "[telemetry]") {
    telemetry_channel channel;
    channel.open("job-1");

    auto sub = subscribe_to(channel, "job-1");
    channel.publish(make_log("job-1", 1));

    state_change change;
    change.from = job_state::importing;
    change.to = job_state::completed;
    channel.publish(telemetry_event{"job-1", change});
    channel.close("job-1");

    CHECK(channel.is_closed("job-1"));
    CHECK_FALSE(sub.finished());

    auto first = sub.next();
    REQUIRE(first.has_value());
    CHECK(first->is_log());

    auto last = sub.next();
    REQUIRE(last.has_value());
    REQUIRE(last->is_state_change());
    CHECK(std::get<state_change>(last->payload).to == job_state::completed);

    CHECK_FALSE(sub.next().has_value());
    CHECK(sub.finished());

    // Publishing after close is ignored.
    channel.publish(make_log("job-1", 2));
    CHECK(sub.drain().empty());
}

TEST_CASE("telemetry_channel blocking next wakes on publish", "[telemetry]") {
    telemetry_channel channel;
    channel.open("job-1");
    auto sub = subscribe_to(channel, "job-1");

    std::thread producer([&channel] {
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
        channel.publish(make_log("job-1", 1, "from producer"));
        channel.close("job-1");
    });

    auto event = sub.next();
    producer.join();

    REQUIRE(event.has_value());
    CHECK(std::get<log_line>(event->payload).text == "from producer");
    CHECK_FALSE(sub.next().has_value());
}

TEST_CASE("telemetry_channel next_for times out", "[telemetry]") {
    telemetry_channel channel;
    channel.open("job-1");
    auto sub = subscribe_to(channel, "job-1");

    CHECK_FALSE(sub.next_for(std::chrono::milliseconds{20}).has_value());
    CHECK_FALSE(sub.finished());
}

TEST_CASE("telemetry_channel replays history", "[telemetry]") {
    telemetry_channel channel(2);
    channel.open("job-1");
    for (uint64_t i = 1; i <= 5; ++i) {
        channel.publish(make_log("job-1", i));
    }

    SECTION("replay while the job runs") {
        auto sub = subscribe_to(channel, "job-1", true);
        channel.publish(make_log("job-1", 6));

        auto events = sub.drain();
        REQUIRE(events.size() == 6);
        CHECK(sequence_of(events.front()) == 1);
        CHECK(sequence_of(events.back()) == 6);
    }

    SECTION("replay after the job finished") {
        channel.close("job-1");
        auto sub = subscribe_to(channel, "job-1", true);

        auto events = sub.drain();
        CHECK(events.size() == 5);
        CHECK(sub.finished());
    }

    SECTION("without replay only new events arrive") {
        auto sub = subscribe_to(channel, "job-1");
        channel.publish(make_log("job-1", 6));
        auto events = sub.drain();
        REQUIRE(events.size() == 1);
        CHECK(sequence_of(events[0]) == 6);
    }
}

TEST_CASE("telemetry_channel unknown job and unsubscribe", "[telemetry]") {
    telemetry_channel channel;

    auto missing = channel.subscribe("nope");
    REQUIRE(missing.is_err());
    CHECK(missing.error().code == error_codes::job_not_found);

    channel.open("job-1");
    auto sub = subscribe_to(channel, "job-1");
    CHECK(channel.subscriber_count("job-1") == 1);

    sub.unsubscribe();
    CHECK_FALSE(sub.valid());
    CHECK(sub.finished());
    CHECK(channel.subscriber_count("job-1") == 0);

    // Publishing to a job whose subscriber left must not fail.
    channel.publish(make_log("job-1", 1));
}

TEST_CASE("telemetry_channel releases old closed streams", "[telemetry]") {
    telemetry_channel channel(16, 100, 2);
    for (const std::string id : {"job-1", "job-2", "job-3"}) {
        channel.open(id);
        channel.publish(make_log(id, 1));
        channel.close(id);
    }

    auto released = channel.subscribe("job-1", true);
    REQUIRE(released.is_err());
    CHECK(released.error().code == error_codes::job_not_found);

    auto kept = subscribe_to(channel, "job-3", true);
    CHECK(kept.drain().size() == 1);
    CHECK(channel.is_closed("job-2"));

    SECTION("running streams are never released") {
        channel.open("live");
        channel.open("job-4");
        channel.close("job-4");
        channel.open("job-5");
        channel.close("job-5");
        CHECK_FALSE(channel.is_closed("live"));
        CHECK(channel.subscribe("live").is_ok());
    }
}

TEST_CASE("telemetry_channel remove ends subscribers", "[telemetry]") {
    telemetry_channel channel;
    channel.open("job-1");
    auto sub = subscribe_to(channel, "job-1");
    channel.publish(make_log("job-1", 1));

    channel.remove("job-1");

    CHECK(sub.drain().size() == 1);
    CHECK(sub.finished());
    CHECK(channel.subscribe("job-1").is_err());

    // Events for a removed job are ignored.
    channel.publish(make_log("job-1", 2));
}

TEST_CASE("telemetry_channel finished_subscription yields the given events",
          "[telemetry]") {
    std::vector<telemetry_event> events;
    for (uint64_t i = 1; i <= 3; ++i) {
        events.push_back(make_log("job-1", i));
    }

    auto sub = telemetry_channel::finished_subscription(std::move(events));
    CHECK(sub.valid());
    CHECK_FALSE(sub.finished());

    for (uint64_t i = 1; i <= 3; ++i) {
        auto event = sub.next();
        REQUIRE(event.has_value());
        CHECK(sequence_of(*event) == i);
    }
    CHECK_FALSE(sub.next().has_value());
    CHECK(sub.finished());
    CHECK(sub.dropped_count() == 0);
}
