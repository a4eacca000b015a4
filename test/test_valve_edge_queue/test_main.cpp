#include <unity.h>

#include "Modules/IrrigationModule/RuntimeTracker.h"
#include "Modules/ValveModule/ValveEdgeQueue.h"

static ValveChangedPayload edge(uint8_t zone, bool on, uint32_t tsMs)
{
    ValveChangedPayload p{};
    p.zone = zone;
    p.on = on ? 1 : 0;
    p.tsMs = tsMs;
    return p;
}

// Minimal stand-in for the irrigation side: feeds edges to a tracker.
struct TrackerSink {
    RuntimeTracker tracker;
    float waterMm = 0.0f;
    bool accept = true;
    uint8_t seen = 0;

    bool operator()(const ValveChangedPayload& e)
    {
        if (!accept) return false;
        ++seen;
        if (e.on) {
            tracker.valveOn(e.tsMs);
        } else {
            IrrigationRun run{};
            if (tracker.valveOff(e.tsMs, 10.0f, run) == RunEdgeResult::Closed) waterMm += run.waterMm;
        }
        return true;
    }
};

void test_drain_delivers_in_order()
{
    ValveEdgeQueue q;
    TEST_ASSERT_TRUE(q.push(edge(0, true, 1000)));
    TEST_ASSERT_TRUE(q.push(edge(0, false, 1801000)));
    TEST_ASSERT_EQUAL_UINT8(2, q.size());

    TrackerSink sink;
    TEST_ASSERT_EQUAL_UINT8(2, q.drain([&sink](const ValveChangedPayload& e) { return sink(e); }));
    TEST_ASSERT_TRUE(q.empty());
    TEST_ASSERT_FALSE(sink.tracker.isOpen());
    TEST_ASSERT_EQUAL_FLOAT(5.0f, sink.waterMm);
}

void test_deferred_off_edge_keeps_original_timestamp()
{
    TrackerSink sink;
    sink(edge(1, true, 0));

    // The close could not be posted; later edges queue behind it.
    ValveEdgeQueue q;
    q.push(edge(1, false, 600000));
    q.push(edge(1, true, 3600000));
    q.push(edge(1, false, 3900000));

    sink.accept = false;
    TEST_ASSERT_EQUAL_UINT8(0, q.drain([&sink](const ValveChangedPayload& e) { return sink(e); }));
    TEST_ASSERT_EQUAL_UINT8(3, q.size());

    sink.accept = true;
    TEST_ASSERT_EQUAL_UINT8(3, q.drain([&sink](const ValveChangedPayload& e) { return sink(e); }));
    // 600 s + 300 s at 10 mm/h, not the 3900 s span.
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 2.5f, sink.waterMm);
}

void test_drain_stops_at_first_refusal()
{
    ValveEdgeQueue q;
    q.push(edge(0, true, 1));
    q.push(edge(0, false, 2));
    q.push(edge(0, true, 3));

    uint8_t budget = 1;
    TEST_ASSERT_EQUAL_UINT8(1, q.drain([&budget](const ValveChangedPayload&) {
        if (budget == 0) return false;
        --budget;
        return true;
    }));
    TEST_ASSERT_EQUAL_UINT8(2, q.size());

    uint32_t firstTs = 0;
    q.drain([&firstTs](const ValveChangedPayload& e) {
        if (firstTs == 0) firstTs = e.tsMs;
        return true;
    });
    TEST_ASSERT_EQUAL_UINT32(2, firstTs);
}

void test_full_queue_drops_oldest()
{
    ValveEdgeQueue q;
    for (uint8_t i = 0; i < ValveEdgeQueue::CAPACITY; ++i) {
        TEST_ASSERT_TRUE(q.push(edge(0, (i % 2) == 0, 100U + i)));
    }
    TEST_ASSERT_FALSE(q.push(edge(0, true, 999)));
    TEST_ASSERT_EQUAL_UINT8(ValveEdgeQueue::CAPACITY, q.size());
    TEST_ASSERT_EQUAL_UINT32(1, q.droppedCount());

    uint32_t firstTs = 0;
    uint32_t lastTs = 0;
    q.drain([&](const ValveChangedPayload& e) {
        if (firstTs == 0) firstTs = e.tsMs;
        lastTs = e.tsMs;
        return true;
    });
    TEST_ASSERT_EQUAL_UINT32(101, firstTs);
    TEST_ASSERT_EQUAL_UINT32(999, lastTs);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_drain_delivers_in_order);
    RUN_TEST(test_deferred_off_edge_keeps_original_timestamp);
    RUN_TEST(test_drain_stops_at_first_refusal);
    RUN_TEST(test_full_queue_drops_oldest);
    return UNITY_END();
}
