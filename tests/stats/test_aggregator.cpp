#include <gtest/gtest.h>
#include "darksim/core/Errors.hh"
#include "darksim/stats/Aggregator.hh"

#include <cmath>
#include <vector>

using namespace darksim;
using namespace darksim::stats;

namespace {

EventCollection MakeEvents(const std::vector<double>& energies, const std::vector<bool>& signal) {
    EventCollection c;
    for (std::size_t i = 0; i < energies.size(); ++i) {
        c.Add(DetectionEvent(i, static_cast<double>(i), energies[i], energies[i], signal[i],
                             Vec3{0.0, 0.0, 0.0}));
    }
    return c;
}

} // namespace

TEST(AggregatorTest, BasicStatistics) {
    const auto ev = MakeEvents({0.0, 4.5, 9.0}, {true, false, true});
    const auto st = ComputeStatistics(ev, 4, 365.0);
    EXPECT_EQ(st.total, 3u);
    EXPECT_EQ(st.signal_count, 2u);
    EXPECT_EQ(st.background_count, 1u);
    EXPECT_DOUBLE_EQ(st.mean_energy_keV, 4.5);
    EXPECT_DOUBLE_EQ(st.min_energy_keV, 0.0);
    EXPECT_DOUBLE_EQ(st.max_energy_keV, 9.0);
    EXPECT_DOUBLE_EQ(st.exposure_kg_day, 365.0);
    EXPECT_DOUBLE_EQ(st.efficiency, 0.5);
}

TEST(AggregatorTest, EmptyCollectionGivesNaNEnergies) {
    const EventCollection ev;
    const auto st = ComputeStatistics(ev, 0, 1.0);
    EXPECT_EQ(st.total, 0u);
    EXPECT_TRUE(std::isnan(st.mean_energy_keV));
    EXPECT_TRUE(std::isnan(st.max_energy_keV));
    EXPECT_TRUE(std::isnan(st.min_energy_keV));
    EXPECT_DOUBLE_EQ(st.efficiency, 0.0);
}

TEST(AggregatorTest, HistogramEdgesAndTotals) {
    const std::vector<double> values{0.5, 1.0, 2.5, 7.0, 10.0};
    const auto h = EqualWidthHistogram(values, 10, "h", "h");
    ASSERT_EQ(h.nbins(), 10);
    ASSERT_EQ(h.edges.size(), 11u);
    EXPECT_DOUBLE_EQ(h.edges.front(), 0.0);
    EXPECT_DOUBLE_EQ(h.edges.back(), 10.0);
    EXPECT_EQ(h.total(), static_cast<long long>(values.size()));
    // the maximum falls in the last bin
    EXPECT_EQ(h.counts.back(), 1);
    EXPECT_EQ(h.counts[0], 1);
    EXPECT_EQ(h.counts[1], 1);
}

TEST(AggregatorTest, HistogramKeepsValuesJustBelowMaximum) {
    for (int nbins : {3, 7, 10, 49, 100}) {
        for (double xmax : {0.3, 1.1, 7.7, 1e5 / 3.0, 365.0 * 86400.0}) {
            const double below = std::nextafter(xmax, 0.0);
            const auto h = EqualWidthHistogram({0.0, below, xmax}, nbins, "h", "h");
            ASSERT_EQ(h.nbins(), nbins);
            EXPECT_EQ(h.total(), 3) << "nbins=" << nbins << " xmax=" << xmax;
            EXPECT_EQ(h.counts.back(), 2) << "nbins=" << nbins << " xmax=" << xmax;
        }
    }
}

TEST(AggregatorTest, HistogramEmptyAndInvalid) {
    EXPECT_TRUE(EqualWidthHistogram({}, 5, "h", "h").empty());
    EXPECT_THROW(EqualWidthHistogram({1.0}, 0, "h", "h"), ConfigurationError);
}

TEST(AggregatorTest, HistogramAllZeros) {
    const auto h = EqualWidthHistogram({0.0, 0.0, 0.0}, 4, "h", "h");
    ASSERT_EQ(h.nbins(), 4);
    EXPECT_DOUBLE_EQ(h.edges.back(), 1.0);
    EXPECT_EQ(h.counts[0], 3);
    EXPECT_EQ(h.total(), 3);
}

TEST(AggregatorTest, SpectraFromCollection) {
    const auto ev = MakeEvents({1.0, 2.0, 3.0, 4.0}, {true, true, false, false});
    const auto e = EnergySpectrum(ev, 4);
    const auto t = TemporalDistribution(ev, 3);
    EXPECT_EQ(e.total(), 4);
    EXPECT_EQ(t.total(), 4);
    EXPECT_DOUBLE_EQ(e.edges.back(), 4.0);
    EXPECT_DOUBLE_EQ(t.edges.back(), 3.0);  // timestamps 0..3
}

TEST(AggregatorTest, DerivedMetrics) {
    RunStatistics st;
    st.total = 150;
    st.signal_count = 50;
    st.background_count = 100;

    StatisticsConfig cfg;
    const auto m = ComputeDerivedMetrics(st, cfg);
    EXPECT_EQ(m.method, "simple");
    EXPECT_DOUBLE_EQ(m.signal_to_background, 0.5);
    EXPECT_NEAR(m.significance_sigma, 50.0 / std::sqrt(150.0), 1e-12);
    EXPECT_TRUE(m.discovery_threshold_met);

    cfg.discovery_threshold_sigma = 5.0;
    EXPECT_FALSE(ComputeDerivedMetrics(st, cfg).discovery_threshold_met);
}

TEST(AggregatorTest, DerivedMetricsWithoutBackground) {
    RunStatistics st;
    st.total = st.signal_count = 3;
    const auto m = ComputeDerivedMetrics(st, StatisticsConfig{});
    EXPECT_TRUE(std::isinf(m.signal_to_background));
    EXPECT_TRUE(std::isinf(m.significance_sigma));
    EXPECT_TRUE(m.discovery_threshold_met);

    const auto none = ComputeDerivedMetrics(RunStatistics{}, StatisticsConfig{});
    EXPECT_DOUBLE_EQ(none.signal_to_background, 0.0);
    EXPECT_DOUBLE_EQ(none.significance_sigma, 0.0);
    EXPECT_FALSE(none.discovery_threshold_met);
}
