#include <gtest/gtest.h>
#include "darksim/event/EventCollection.hh"

#include <string>

using namespace darksim;

namespace {

EventCollection MakeAlternating(int n) {
    EventCollection c;
    for (int i = 0; i < n; ++i) {
        const bool signal = (i % 2 == 0);
        c.Add(DetectionEvent(i, 10.0 * i, 1.0 + i, 1.5 + i, signal, Vec3{0.0, 0.0, 0.0},
                             {{"event_type", signal ? "dark_matter" : "background"}}));
    }
    return c;
}

} // namespace

TEST(EventCollectionTest, CountsStayConsistent) {
    const auto c = MakeAlternating(10);
    EXPECT_EQ(c.size(), 10u);
    EXPECT_EQ(c.signal_count(), 5u);
    EXPECT_EQ(c.background_count(), 5u);
    EXPECT_EQ(c.signal_count() + c.background_count(), c.size());
}

TEST(EventCollectionTest, PreservesOrderAndValues) {
    const auto c = MakeAlternating(4);
    const auto energies = c.ObservedEnergies();
    const auto times = c.Timestamps();
    ASSERT_EQ(energies.size(), 4u);
    ASSERT_EQ(times.size(), 4u);
    for (std::size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(c[i].id(), i);
        EXPECT_DOUBLE_EQ(energies[i], 1.5 + i);
        EXPECT_DOUBLE_EQ(times[i], 10.0 * i);
    }
    EXPECT_EQ(c[1].metadata().at("event_type").get<std::string>(), "background");
}

TEST(EventCollectionTest, EmptyCollection) {
    const EventCollection c;
    EXPECT_TRUE(c.empty());
    EXPECT_TRUE(c.ObservedEnergies().empty());
    EXPECT_EQ(c.begin(), c.end());
}

TEST(DetectionEventTest, NonObjectMetadataReplaced) {
    const DetectionEvent ev(0, 0.0, 1.0, 1.0, true, Vec3{0.0, 0.0, 0.0},
                            nlohmann::json::array({1, 2}));
    EXPECT_TRUE(ev.metadata().is_object());
    EXPECT_TRUE(ev.metadata().empty());
}
