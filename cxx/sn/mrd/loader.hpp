#pragma once

#include "../io/dataset.hpp"
#include "assembler.hpp"
#include "waveform.hpp"

namespace sn {

/*
 * Opens a container read-only and parses its header once. Assemblers and waveform readers handed out
 * here refer to the loader's dataset and must not outlive it.
 */
struct Loader
{
  Loader(std::string const &fname);

  auto config() const -> HeaderConfig const &;
  auto header() const -> std::string const &;
  auto shape() const -> Sz3;
  auto nCoils() const -> Index;
  auto nShots() const -> Index;
  auto nSamples() const -> Index;
  auto nFrames() const -> Index;
  auto nAcquisitions() const -> Index;

  template <int ND> auto cartesian() const -> FrameAssembler<Cartesian<ND>>;
  auto                   noncartesian() const -> FrameAssembler<NonCartesian>;

  auto smaps() const -> std::optional<Cx4>;
  auto coilCovariance() const -> std::optional<Cx2>;
  auto images() const -> std::vector<std::string>;

  auto catalog() const -> WaveformCatalog const &;
  auto nWaveforms() const -> Index;
  auto dynamic(Index const index) const -> DynamicEntry;
  auto allDynamic() const -> std::vector<DynamicEntry>;

  void close();

private:
  Dataset                                dataset_;
  std::string                            xml_;
  HeaderConfig                           cfg_;
  mutable std::optional<WaveformCatalog> catalog_;
};

} // namespace sn
