#include "darksim/io/RootExport.hh"

#include <TFile.h>
#include <TH1D.h>

#include <stdexcept>

namespace darksim {

std::unique_ptr<TH1D> ToTH1D(const stats::Histogram1D& h,
                             const std::string& name, const std::string& title) {
  if (h.empty()) return nullptr;
  auto out = std::make_unique<TH1D>(name.c_str(), title.c_str(), h.nbins(), h.edges.data());
  out->SetDirectory(nullptr);
  for (int i = 1; i <= h.nbins(); ++i)
    out->SetBinContent(i, static_cast<double>(h.counts[static_cast<size_t>(i - 1)]));
  out->SetEntries(static_cast<double>(h.total()));
  return out;
}

void WriteRootFile(const SimulationResult& r, const std::string& path) {
  TFile fout(path.c_str(), "RECREATE");
  if (fout.IsZombie()) throw std::runtime_error("Cannot create ROOT file: " + path);

  auto hE = ToTH1D(r.energy_spectrum, "energy_spectrum", "Observed energy;E [keV];events");
  auto hT = ToTH1D(r.temporal_distribution, "temporal_distribution", "Event time;t [s];events");
  fout.cd();
  if (hE) hE->Write();
  if (hT) hT->Write();
  fout.Close();
}

} // namespace darksim
