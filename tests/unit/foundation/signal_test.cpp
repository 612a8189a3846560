#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "msim/foundation/signal.hpp"

using namespace msim::foundation;

TEST(SignalTest, EmitReachesAllSlotsInConnectionOrder) {
    Signal<int> signal;
    std::vector<std::string> calls;

    signal.connect([&](int v) { calls.push_back("a" + std::to_string(v)); });
    signal.connect([&](int v) { calls.push_back("b" + std::to_string(v)); });
    signal.emit(1);

    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], "a1");
    EXPECT_EQ(calls[1], "b1");
}

TEST(SignalTest, DisconnectStopsDelivery) {
    Signal<int> signal;
    int hits = 0;
    auto id = signal.connect([&](int) { ++hits; });

    EXPECT_TRUE(signal.disconnect(id));
    EXPECT_FALSE(signal.disconnect(id));
    signal.emit(0);
    EXPECT_EQ(hits, 0);
}

TEST(SignalTest, SlotIdsAreNotReused) {
    Signal<> signal;
    auto first = signal.connect([] {});
    signal.disconnect(first);
    auto second = signal.connect([] {});
    EXPECT_NE(first, second);
}

TEST(SignalTest, SlotMayEmitOnSameSignal) {
    Signal<int> signal;
    std::vector<int> seen;
    signal.connect([&](int depth) {
        seen.push_back(depth);
        if (depth < 2) {
            signal.emit(depth + 1);
        }
    });

    signal.emit(0);
    EXPECT_EQ(seen, (std::vector<int>{0, 1, 2}));
}

TEST(SignalTest, SlotMayDisconnectItself) {
    Signal<> signal;
    int hits = 0;
    Signal<>::SlotId self = 0;
    self = signal.connect([&] {
        ++hits;
        signal.disconnect(self);
    });

    signal.emit();
    signal.emit();
    EXPECT_EQ(hits, 1);
}
