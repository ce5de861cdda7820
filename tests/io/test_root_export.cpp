#include <gtest/gtest.h>
#include "darksim/io/RootExport.hh"
#include "darksim/simulation/SimulationRun.hh"

#include <TFile.h>
#include <TH1D.h>

#include <memory>
#include <string>

using namespace darksim;

TEST(RootExportTest, ToTH1DCopiesBinsAndCounts) {
    stats::Histogram1D h;
    h.edges  = {0.0, 1.0, 2.0, 4.0};
    h.counts = {3, 0, 5};
    const auto th = ToTH1D(h, "h_test", "test");
    ASSERT_NE(th, nullptr);
    EXPECT_EQ(th->GetNbinsX(), 3);
    EXPECT_DOUBLE_EQ(th->GetXaxis()->GetBinUpEdge(3), 4.0);
    EXPECT_DOUBLE_EQ(th->GetBinContent(1), 3.0);
    EXPECT_DOUBLE_EQ(th->GetBinContent(3), 5.0);
    EXPECT_DOUBLE_EQ(th->Integral(), 8.0);

    EXPECT_EQ(ToTH1D(stats::Histogram1D{}, "h_empty", "empty"), nullptr);
}

TEST(RootExportTest, WritesBothHistograms) {
    SimulationOptions opt;
    opt.energy_bins = 10;
    opt.time_bins = 5;
    const auto r = RunSimulation(Configure("germanium", 1.0, 15.0, 1.0, 0.02, 365.0),
                                 50, 50, opt);
    const std::string path = ::testing::TempDir() + "darksim_export_test.root";
    WriteRootFile(r, path);

    TFile f(path.c_str(), "READ");
    ASSERT_FALSE(f.IsZombie());
    auto* hE = dynamic_cast<TH1D*>(f.Get("energy_spectrum"));
    auto* hT = dynamic_cast<TH1D*>(f.Get("temporal_distribution"));
    ASSERT_NE(hE, nullptr);
    ASSERT_NE(hT, nullptr);
    EXPECT_EQ(hE->GetNbinsX(), 10);
    EXPECT_DOUBLE_EQ(hE->Integral(), static_cast<double>(r.statistics.total));
    EXPECT_DOUBLE_EQ(hT->Integral(), static_cast<double>(r.statistics.total));
}
