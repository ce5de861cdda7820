#include "darksim/io/ConfigManager.hh"
#include "darksim/io/ResultJson.hh"
#include "darksim/io/RootExport.hh"
#include "darksim/simulation/SimulationHistory.hh"
#include "darksim/simulation/SimulationRun.hh"
#include "darksim/stats/Aggregator.hh"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

// helper: print first N bins of a histogram
static void PrintFirstBins(const darksim::stats::Histogram1D& h, const char* unit,
                           int n_to_print = 10) {
    const int nb = h.nbins();
    const int n = std::min(nb, n_to_print);
    std::cout << "    [" << unit << "] : counts\n";
    for (int i = 0; i < n; ++i) {
        std::cout << "    " << std::setw(10) << h.edges[i] << " - " << std::setw(10) << h.edges[i + 1]
                  << " : " << h.counts[i] << "\n";
    }
    if (nb > n) std::cout << "    ... (" << (nb - n) << " more bins)\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: darksim_run <config.json>\n";
        return 1;
    }

    try {
        // -------------------- Load config --------------------
        darksim::ConfigManager cfg(argv[1]);
        cfg.parse();

        const auto& det = cfg.detector();
        const auto& run = cfg.run();

        std::cout << "[darksim] Run: " << run.label << "\n"
                  << "  Detector: " << det.kind_name() << " (Z=" << det.Z() << ", A=" << det.A() << ")\n"
                  << "  Mass [kg]: " << det.mass_kg() << "\n"
                  << "  Exposure [kg·day]: " << det.exposure_kg_day() << "\n"
                  << "  Threshold [keV]: " << det.threshold_keV() << "\n"
                  << "  Resolution: " << det.resolution() << "\n"
                  << "  Seed: " << cfg.options().rng_seed << "\n";

        // -------------------- Simulate --------------------
        darksim::SimulationRun sim(det, cfg.options());
        const bool poisson_bkg = (run.background_mode == darksim::BackgroundMode::Poisson);
        const auto events = poisson_bkg ? sim.RunExpectedBackground(run.n_signal)
                                        : sim.Run(run.n_signal, run.n_background);
        const long long n_bkg = poisson_bkg ? static_cast<long long>(events.background_count())
                                            : run.n_background;

        darksim::SimulationHistory history(run.history_capacity);
        const auto sim_id = history.Append(sim.Summarize(events, run.n_signal, n_bkg), run.label);
        const auto& result = history.Latest()->result;
        const auto metrics = darksim::stats::ComputeDerivedMetrics(result.statistics, cfg.statistics());

        // -------------------- Summary --------------------
        const auto& st = result.statistics;
        std::cout << "\n[statistics]\n"
                  << "  total events      : " << st.total << "\n"
                  << "  DM candidates     : " << st.signal_count << "\n"
                  << "  background events : " << st.background_count << "\n"
                  << "  signal efficiency : " << st.efficiency << "\n"
                  << "  mean / min / max E [keV]: " << st.mean_energy_keV << " / "
                  << st.min_energy_keV << " / " << st.max_energy_keV << "\n"
                  << "  expected WIMP rate [events/day]: " << result.expected_signal_rate_per_day << "\n";

        std::cout << "\n[significance]\n"
                  << "  method            : " << metrics.method << "\n"
                  << "  Z [sigma]         : " << metrics.significance_sigma << "\n"
                  << "  S/B               : " << metrics.signal_to_background << "\n"
                  << "  discovery (>= " << metrics.threshold_sigma << " sigma): "
                  << (metrics.discovery_threshold_met ? "yes" : "no") << "\n";

        if (run.verbosity > 1) {
            std::cout << "\n[energy-spectrum]\n";
            PrintFirstBins(result.energy_spectrum, "keV");
            std::cout << "\n[temporal-distribution]\n";
            PrintFirstBins(result.temporal_distribution, "s");
        }

        // -------------------- Outputs --------------------
        std::filesystem::create_directories(run.outdir);
        const std::string stem = run.outdir + "/" + (run.label.empty() ? "darksim" : run.label);

        darksim::WriteRootFile(result, stem + ".root");

        auto j = darksim::ToJson(*history.Find(sim_id));
        j["derived"] = darksim::ToJson(metrics);
        std::ofstream jout(stem + ".json");
        if (!jout) throw std::runtime_error("Cannot write " + stem + ".json");
        jout << j.dump(2) << "\n";

        std::cout << "\n[output] histograms written to: " << stem << ".root\n"
                  << "         summary written to   : " << stem << ".json\n";
        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 2;
    }
}
