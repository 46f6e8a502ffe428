// tests/test_progress_channel.cpp
#include "tinylm/training/progress.hpp"
#include "test_utils.hpp"
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace tinylm::training;
using namespace tinylm_test;

namespace {

ProgressEvent step_event(size_t step) {
    ProgressEvent event;
    event.kind = EventKind::Step;
    event.step = step;
    event.max_steps = 100;
    event.train_loss = 1.0;
    return event;
}

ProgressEvent terminal_event(EventKind kind, size_t step) {
    ProgressEvent event;
    event.kind = kind;
    event.step = step;
    return event;
}

} // namespace

int main() {
    std::cout << "Testing ProgressChannel..." << std::endl;

    try {
        section("Test 1: FIFO delivery");
        ProgressChannel channel(8);
        for (size_t i = 1; i <= 3; ++i) {
            channel.publish(step_event(i));
        }
        check(channel.size() == 3, "three queued");
        check(channel.try_pop()->step == 1, "oldest first");
        auto rest = channel.drain();
        check(rest.size() == 2 && rest[0].step == 2 && rest[1].step == 3, "drain keeps order");
        check(!channel.try_pop().has_value(), "empty after drain");
        check(!channel.pop_for(std::chrono::milliseconds(10)).has_value(), "pop_for times out when empty");

        section("Test 2: overflow drops the oldest non-terminal events");
        ProgressChannel small(3);
        small.publish(step_event(1));
        small.publish(terminal_event(EventKind::Completed, 2));
        small.publish(step_event(3));
        small.publish(step_event(4));
        check(small.size() == 3, "capacity respected");
        check(small.dropped() == 1, "one event dropped");
        auto kept = small.drain();
        check(kept[0].kind == EventKind::Completed && kept[1].step == 3 && kept[2].step == 4,
              "step 1 dropped, terminal event kept");

        section("Test 3: terminal events always get through");
        ProgressChannel tiny(1);
        tiny.publish(terminal_event(EventKind::Failed, 1));
        tiny.publish(step_event(2));
        tiny.publish(terminal_event(EventKind::Cancelled, 3));
        auto survivors = tiny.drain();
        check(survivors.size() == 2, "both terminal events survive");
        check(survivors[0].kind == EventKind::Failed && survivors[1].kind == EventKind::Cancelled, "in order");
        check(tiny.dropped() == 1, "step event counted as dropped");

        section("Test 4: the producer never blocks");
        ProgressChannel bounded(16);
        for (size_t i = 0; i < 10000; ++i) {
            bounded.publish(step_event(i));
        }
        check(bounded.size() == 16 && bounded.dropped() == 10000 - 16, "10000 publishes into 16 slots");
        check(bounded.try_pop()->step == 10000 - 16, "newest events retained");

        section("Test 5: dispatcher");
        ProgressChannel shared(1024);
        std::mutex mutex;
        std::vector<size_t> seen;
        {
            ProgressDispatcher dispatcher(shared, [&](const ProgressEvent& event) {
                if (event.step == 5) {
                    throw std::runtime_error("observer failure");
                }
                std::lock_guard<std::mutex> lock(mutex);
                seen.push_back(event.step);
            });
            std::thread producer([&] {
                for (size_t i = 1; i <= 50; ++i) {
                    shared.publish(step_event(i));
                }
                shared.publish(terminal_event(EventKind::Completed, 51));
            });
            producer.join();
            dispatcher.stop();
        }
        check(seen.size() == 50, "every event but the failing one delivered");
        check(seen.back() == 51, "terminal event delivered last");

        section("Test 6: JSON form");
        ProgressEvent event = step_event(7);
        event.learning_rate = 0.5;
        auto j = event.to_json();
        check(j["kind"] == "step" && j["step"] == 7 && j["train_loss"] == 1.0, "fields present");
        check(j["val_loss"].is_null(), "missing loss is null");
        check(!event.is_terminal() && terminal_event(EventKind::Cancelled, 1).is_terminal(), "terminal kinds");

        check(throws<std::invalid_argument>([] { ProgressChannel zero(0); }), "zero capacity rejected");
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return finish("test_progress_channel");
}
