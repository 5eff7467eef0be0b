#pragma once

#include "header.hpp"
#include "stream.hpp"

#include <functional>
#include <optional>

namespace sn {

struct RepetitionCount
{
  Index  full;      // Complete repetitions that fit in the simulation time
  bool   exact;     // False if a partial trailing repetition was discarded
  double remainder; // ms
};

auto Repetitions(HeaderConfig const &cfg) -> RepetitionCount;
auto SampleTimeUs(HeaderConfig const &cfg) -> float;      // Dwell per sample
auto ReadoutDurationMs(HeaderConfig const &cfg) -> float; // Duration of one record

/*
 * The upstream input for one repetition
 */
struct ShotBlock
{
  Cx3 ks;   // channel, sample, shot
  Re3 traj; // k, sample, shot
};

using ShotSource = std::function<ShotBlock(Index const repetition)>;

struct EmitSummary
{
  Index repetitions = 0;
  Index records = 0;
  bool  exact = true;
};

auto Emit(AcquisitionSink &sink, HeaderConfig const &cfg, ShotSource const &source) -> EmitSummary;

/*
 * Everything besides the records that goes into a container
 */
struct Sideband
{
  WaveformCatalog       catalog;
  std::vector<Waveform> waveforms;
  std::optional<Cx4>    smaps;   // channel, i, j, k
  std::optional<Cx2>    coilCov; // channel, channel
};

auto EmitFile(std::string const &fname, HeaderConfig const &cfg, ShotSource const &source, Sideband const &extra = {})
  -> EmitSummary;

} // namespace sn
