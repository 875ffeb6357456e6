#include <cassert>
#include <string>

#include "engine/event_bus.hpp"
#include "engine/journal.hpp"
#include "engine/recorder.hpp"
#include "utils/ring_buffer.hpp"

using namespace tollgate::engine;

// Minimal tracked component for exercising Journal directly.
struct Counter : Revertible {
    int value{0};
    int saved{0};
    int checkpoints{0};

    void checkpoint() override {
        saved = value;
        ++checkpoints;
    }
    void rollback() override { value = saved; }
    void release() override {}
};

static void test_ring_buffer_overwrites_oldest() {
    tollgate::utils::RingBuffer<int> rb(3);
    for (int i = 1; i <= 5; ++i) {
        rb.push(i);
    }
    assert(rb.size() == 3);
    assert(rb.dropped() == 2);
    assert(*rb.pop() == 3);
    assert(*rb.pop() == 4);
    assert(*rb.pop() == 5);
    assert(!rb.pop().has_value());
}

static void test_publish_outside_request() {
    EventBus bus(8);
    bus.emit(Event::Type::Transfer, "a");
    bus.emit(Event::Type::FeesCredited, "b");
    assert(bus.published() == 2);
    auto first = bus.poll();
    assert(first.has_value());
    assert(first->seq == 1);
    assert(first->payload == "a");
    auto second = bus.poll();
    assert(second->seq == 2);
    assert(second->type == Event::Type::FeesCredited);
    assert(bus.empty());
}

static void test_request_batches_events() {
    Journal journal;
    EventBus bus(8);
    journal.track(bus);

    {
        Journal::Scope scope(journal);
        bus.emit(Event::Type::Transfer, "dropped-1");
        bus.emit(Event::Type::Transfer, "dropped-2");
        assert(bus.pending() == 2);
        assert(bus.empty());
    }
    assert(bus.pending() == 0);
    assert(bus.empty());
    assert(journal.reverted() == 1);

    {
        Journal::Scope scope(journal);
        bus.emit(Event::Type::RateChanged, "kept");
        {
            Journal::Scope inner(journal);
            bus.emit(Event::Type::ThresholdChanged, "inner");
            inner.commit();
        }
        assert(bus.empty());
        scope.commit();
    }
    assert(journal.committed() == 1);
    auto kept = bus.poll();
    assert(kept.has_value());
    // Sequence numbers of the rolled-back request are reused.
    assert(kept->seq == 1);
    assert(kept->payload == "kept");
    auto inner = bus.poll();
    assert(inner->seq == 2);
    assert(inner->type == Event::Type::ThresholdChanged);
}

static void test_journal_checkpoints_once_per_request() {
    Journal journal;
    Counter counter;
    journal.track(counter);
    journal.track(counter);

    {
        Journal::Scope outer(journal);
        counter.value = 5;
        {
            Journal::Scope inner(journal);
            counter.value = 7;
            // inner exits without commit; outer decides
        }
        assert(counter.value == 7);
        assert(journal.depth() == 1);
        outer.commit();
    }
    assert(counter.value == 7);
    assert(counter.checkpoints == 1);

    {
        Journal::Scope outer(journal);
        counter.value = 9;
    }
    assert(counter.value == 7);
    assert(!journal.in_request());
}

static void test_overflow_counts_drops() {
    EventBus bus(2);
    bus.emit(Event::Type::Transfer, "1");
    bus.emit(Event::Type::Transfer, "2");
    bus.emit(Event::Type::Transfer, "3");
    assert(bus.dropped() == 1);
    assert(bus.poll()->payload == "2");
    assert(std::string(event_type_name(Event::Type::PairMigrated)) == "PairMigrated");
}

static void test_recorder_writes_published_events() {
    EventBus bus(4);
    bus.emit(Event::Type::Transfer, "from=a to=b amount=1");
    const std::string path = "test_event_bus_record.csv";
    {
        Recorder recorder(path);
        assert(recorder.is_open());
        assert(recorder.drain(bus) == 1);
        assert(recorder.recorded() == 1);
    }
    assert(bus.empty());
}

int main() {
    test_ring_buffer_overwrites_oldest();
    test_publish_outside_request();
    test_request_batches_events();
    test_journal_checkpoints_once_per_request();
    test_overflow_counts_drops();
    test_recorder_writes_published_events();
    return 0;
}
