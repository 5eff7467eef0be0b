#include "loader.hpp"

#include "../log/log.hpp"
#include "emitter.hpp"

namespace sn {

Loader::Loader(std::string const &fname)
  : dataset_{fname, Dataset::Mode::Read}
  , xml_{dataset_.readHeader()}
  , cfg_{ParseHeader(xml_)}
{
  Log::Print("Loader", "{} has {} records, matrix {}, {} coils", fname, dataset_.nAcquisitions(), cfg_.matrix, cfg_.coils);
}

auto Loader::config() const -> HeaderConfig const & { return cfg_; }
auto Loader::header() const -> std::string const & { return xml_; }
auto Loader::shape() const -> Sz3 { return cfg_.matrix; }
auto Loader::nCoils() const -> Index { return cfg_.coils; }
auto Loader::nShots() const -> Index { return cfg_.shots; }
auto Loader::nSamples() const -> Index { return cfg_.samples; }
auto Loader::nFrames() const -> Index { return Repetitions(cfg_).full; }
auto Loader::nAcquisitions() const -> Index { return dataset_.nAcquisitions(); }

template <int ND> auto Loader::cartesian() const -> FrameAssembler<Cartesian<ND>>
{
  if (cfg_.sampling != Sampling::Cartesian) { Log::Warn("Loader", "Header trajectory is not Cartesian"); }
  return FrameAssembler<Cartesian<ND>>(dataset_, cfg_);
}

template auto Loader::cartesian<2>() const -> FrameAssembler<Cartesian<2>>;
template auto Loader::cartesian<3>() const -> FrameAssembler<Cartesian<3>>;

auto Loader::noncartesian() const -> FrameAssembler<NonCartesian>
{
  if (cfg_.sampling != Sampling::NonCartesian) { Log::Warn("Loader", "Header trajectory is Cartesian"); }
  return FrameAssembler<NonCartesian>(dataset_, cfg_);
}

auto Loader::smaps() const -> std::optional<Cx4>
{
  auto s = dataset_.readImage<4>("smaps");
  if (!s) { Log::Warn("Loader", "No sensitivity maps in {}", dataset_.filename()); }
  return s;
}

auto Loader::coilCovariance() const -> std::optional<Cx2>
{
  auto c = dataset_.readImage<2>("coil_cov");
  if (!c) { Log::Warn("Loader", "No coil covariance in {}", dataset_.filename()); }
  return c;
}

auto Loader::images() const -> std::vector<std::string> { return dataset_.images(); }

auto Loader::catalog() const -> WaveformCatalog const &
{
  if (!catalog_) { catalog_ = ParseWaveformCatalog(xml_); }
  return *catalog_;
}

auto Loader::nWaveforms() const -> Index { return dataset_.nWaveforms(); }

auto Loader::dynamic(Index const index) const -> DynamicEntry { return WaveformReader(dataset_, catalog()).read(index); }

auto Loader::allDynamic() const -> std::vector<DynamicEntry>
{
  WaveformCatalog const *cat = nullptr;
  try {
    cat = &catalog();
  } catch (Log::Failure const &f) {
    Log::Warn("Loader", "Waveform catalogue is unreadable, no waveforms returned: {}", f.what());
    return {};
  }
  return WaveformReader(dataset_, *cat).readAll();
}

void Loader::close() { dataset_.close(); }

} // namespace sn
