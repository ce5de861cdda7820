#include <gtest/gtest.h>
#include "darksim/core/Errors.hh"
#include "darksim/physics/PhysicalConstants.hh"
#include "darksim/simulation/SimulationRun.hh"

#include <string>

using namespace darksim;

namespace {

DetectorConfiguration Germanium() {
    return Configure("germanium", 1.0, 15.0, 1.0, 0.02, 365.0);
}

} // namespace

TEST(SimulationRunTest, SameSeedReproducesEvents) {
    SimulationOptions opt;
    opt.rng_seed = 12345;
    SimulationRun a(Germanium(), opt);
    SimulationRun b(Germanium(), opt);
    const auto ea = a.Run(200, 200);
    const auto eb = b.Run(200, 200);
    ASSERT_EQ(ea.size(), eb.size());
    for (std::size_t i = 0; i < ea.size(); ++i) {
        EXPECT_EQ(ea[i].observed_energy_keV(), eb[i].observed_energy_keV());
        EXPECT_EQ(ea[i].timestamp_s(), eb[i].timestamp_s());
        EXPECT_EQ(ea[i].is_signal(), eb[i].is_signal());
    }
}

TEST(SimulationRunTest, SameSeedReproducesSummary) {
    SimulationOptions opt;
    opt.rng_seed = 12345;
    const auto a = RunSimulation(Germanium(), 1000, 1000, opt);
    const auto b = RunSimulation(Germanium(), 1000, 1000, opt);

    EXPECT_EQ(a.statistics.total, b.statistics.total);
    EXPECT_EQ(a.statistics.signal_count, b.statistics.signal_count);
    EXPECT_EQ(a.statistics.background_count, b.statistics.background_count);
    EXPECT_EQ(a.statistics.mean_energy_keV, b.statistics.mean_energy_keV);
    EXPECT_EQ(a.statistics.max_energy_keV, b.statistics.max_energy_keV);
    EXPECT_EQ(a.statistics.min_energy_keV, b.statistics.min_energy_keV);
    EXPECT_EQ(a.statistics.efficiency, b.statistics.efficiency);
    EXPECT_EQ(a.energy_spectrum.edges, b.energy_spectrum.edges);
    EXPECT_EQ(a.energy_spectrum.counts, b.energy_spectrum.counts);
    EXPECT_EQ(a.temporal_distribution.edges, b.temporal_distribution.edges);
    EXPECT_EQ(a.temporal_distribution.counts, b.temporal_distribution.counts);
    EXPECT_EQ(a.mean_wimp_speed_m_s, b.mean_wimp_speed_m_s);
    EXPECT_EQ(a.expected_signal_rate_per_day, b.expected_signal_rate_per_day);
}

TEST(SimulationRunTest, RepeatedRunIsReseeded) {
    SimulationRun run(Germanium(), SimulationOptions{});
    const auto first = run.Run(50, 50);
    const auto second = run.Run(50, 50);
    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i)
        EXPECT_EQ(first[i].observed_energy_keV(), second[i].observed_energy_keV());
}

TEST(SimulationRunTest, DifferentSeedsDiffer) {
    SimulationOptions o1, o2;
    o1.rng_seed = 1;
    o2.rng_seed = 2;
    const auto e1 = SimulationRun(Germanium(), o1).Run(0, 20);
    const auto e2 = SimulationRun(Germanium(), o2).Run(0, 20);
    ASSERT_EQ(e1.size(), e2.size());
    bool any_diff = false;
    for (std::size_t i = 0; i < e1.size(); ++i)
        any_diff |= e1[i].observed_energy_keV() != e2[i].observed_energy_keV();
    EXPECT_TRUE(any_diff);
}

TEST(SimulationRunTest, CountsAndThreshold) {
    SimulationRun run(Germanium(), SimulationOptions{});
    const auto ev = run.Run(1000, 1000);
    EXPECT_EQ(ev.background_count(), 1000u);
    EXPECT_LE(ev.signal_count(), 1000u);
    EXPECT_GT(ev.signal_count(), 0u);
    EXPECT_EQ(ev.size(), ev.signal_count() + ev.background_count());
    for (const auto& e : ev) {
        EXPECT_GE(e.observed_energy_keV(), 0.0);
        EXPECT_GE(e.timestamp_s(), 0.0);
        EXPECT_LE(e.timestamp_s(), 365.0 * 86400.0);
        if (e.is_signal()) {
            EXPECT_GE(e.observed_energy_keV(), 1.0);
            EXPECT_EQ(e.metadata().at("event_type").get<std::string>(), "dark_matter");
            EXPECT_TRUE(e.metadata().contains("recoil_energy_keV"));
        } else {
            EXPECT_EQ(e.metadata().at("interaction").get<std::string>(), "electron_recoil");
        }
    }
    EXPECT_GT(run.mean_wimp_speed_m_s(), 0.0);
    EXPECT_LT(run.mean_wimp_speed_m_s(), 544e3);
}

TEST(SimulationRunTest, EmptyRun) {
    SimulationRun run(Germanium(), SimulationOptions{});
    const auto ev = run.Run(0, 0);
    EXPECT_TRUE(ev.empty());
    const auto r = run.Summarize(ev, 0, 0);
    EXPECT_EQ(r.statistics.total, 0u);
    EXPECT_TRUE(r.energy_spectrum.empty());
    EXPECT_TRUE(r.temporal_distribution.empty());
    EXPECT_GT(r.mean_wimp_speed_m_s, 0.0);
}

TEST(SimulationRunTest, IdsSequentialAfterShuffle) {
    SimulationOptions opt;
    opt.shuffle = true;
    SimulationRun run(Germanium(), opt);
    const auto ev = run.Run(300, 300);
    for (std::size_t i = 0; i < ev.size(); ++i) EXPECT_EQ(ev[i].id(), i);

    // without shuffling all signal precedes background
    bool mixed = false;
    bool seen_background = false;
    for (const auto& e : ev) {
        if (!e.is_signal()) seen_background = true;
        else if (seen_background) mixed = true;
    }
    EXPECT_TRUE(mixed);
}

TEST(SimulationRunTest, InvalidInputsRejected) {
    SimulationRun run(Germanium(), SimulationOptions{});
    EXPECT_THROW(run.Run(-1, 0), ConfigurationError);
    EXPECT_THROW(run.Run(0, -1), ConfigurationError);
    EXPECT_THROW(run.RunExpectedBackground(-1), ConfigurationError);

    SimulationOptions opt;
    opt.halo.v0_m_s = 0.0;
    EXPECT_THROW(SimulationRun(Germanium(), opt), ConfigurationError);

    opt = SimulationOptions{};
    opt.energy_bins = 0;
    EXPECT_THROW(SimulationRun(Germanium(), opt), ConfigurationError);

    opt = SimulationOptions{};
    opt.halo.v0_m_s = 2e8;
    opt.halo.v_escape_m_s = 1e9;
    EXPECT_THROW(SimulationRun(Germanium(), opt), ConfigurationError);
    opt.halo.v_escape_m_s = phys::kSpeedOfLight_m_s;
    EXPECT_THROW(SimulationRun(Germanium(), opt), ConfigurationError);
}

TEST(SimulationRunTest, UnreachableVelocityCutThrowsSamplingError) {
    SimulationOptions opt;
    opt.halo.v_escape_m_s = 1.0;
    SimulationRun run(Germanium(), opt);
    EXPECT_THROW(run.Run(1, 0), SamplingError);
    EXPECT_NO_THROW(run.Run(0, 5));
}

TEST(SimulationRunTest, ExpectedBackgroundFollowsRate) {
    const auto quiet = Configure("germanium", 1.0, 15.0, 1.0, 0.0, 365.0);
    SimulationRun none(quiet, SimulationOptions{});
    EXPECT_EQ(none.RunExpectedBackground(10).background_count(), 0u);

    // mean 0.02 * 1 kg * 365 d = 7.3, most draws land inside [0, 100] keV
    SimulationRun some(Germanium(), SimulationOptions{});
    const auto ev = some.RunExpectedBackground(0);
    EXPECT_EQ(ev.signal_count(), 0u);
    EXPECT_LT(ev.background_count(), 40u);
}

TEST(SimulationRunTest, RunSimulationSummary) {
    SimulationOptions opt;
    opt.energy_bins = 20;
    opt.time_bins = 10;
    const auto r = RunSimulation(Germanium(), 500, 500, opt);
    EXPECT_EQ(r.n_signal_requested, 500);
    EXPECT_EQ(r.n_background_requested, 500);
    EXPECT_EQ(r.rng_seed, 12345u);
    EXPECT_EQ(r.statistics.background_count, 500u);
    EXPECT_EQ(r.energy_spectrum.nbins(), 20);
    EXPECT_EQ(r.temporal_distribution.nbins(), 10);
    EXPECT_EQ(r.energy_spectrum.total(), static_cast<long long>(r.statistics.total));
    EXPECT_EQ(r.temporal_distribution.total(), static_cast<long long>(r.statistics.total));
    EXPECT_DOUBLE_EQ(r.statistics.efficiency,
                     static_cast<double>(r.statistics.signal_count) / 500.0);
    EXPECT_GT(r.expected_signal_rate_per_day, 0.0);
    EXPECT_EQ(r.detector.kind_name(), "germanium");
}
