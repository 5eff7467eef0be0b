#include "emitter.hpp"

#include "../io/dataset.hpp"
#include "../log/log.hpp"
#include "errors.hpp"

#include <cmath>
#include <limits>

namespace sn {

auto Repetitions(HeaderConfig const &cfg) -> RepetitionCount
{
  double const duration = double(cfg.TR) * cfg.shots;
  if (!(duration > 0.)) { throw Log::Failure("Emit", "Repetition duration TR {} x shots {} must be positive", cfg.TR, cfg.shots); }
  // TR and the duration are stored as float, so a quotient within a few float ulps of an integer is that integer
  double const q = cfg.maxSimTime / duration;
  double const nearest = std::round(q);
  if (std::abs(q - nearest) <= 4. * std::numeric_limits<float>::epsilon() * std::max(q, 1.)) {
    return RepetitionCount{.full = static_cast<Index>(nearest), .exact = true, .remainder = 0.};
  }
  double const n = std::floor(q);
  return RepetitionCount{.full = static_cast<Index>(n), .exact = false, .remainder = cfg.maxSimTime - n * duration};
}

auto SampleTimeUs(HeaderConfig const &cfg) -> float { return cfg.dwell * 1000.f; }

auto ReadoutDurationMs(HeaderConfig const &cfg) -> float { return cfg.dwell * cfg.samples; }

auto Emit(AcquisitionSink &sink, HeaderConfig const &cfg, ShotSource const &source) -> EmitSummary
{
  auto const reps = Repetitions(cfg);
  if (!reps.exact) {
    Log::Warn("Emit", "Simulation time {} ms is not a multiple of {} shots x TR {} ms, discarding {} ms", cfg.maxSimTime,
              cfg.shots, cfg.TR, reps.remainder);
  }
  if (reps.full == 0) { Log::Warn("Emit", "Simulation time {} ms is shorter than one repetition", cfg.maxSimTime); }
  // Shot and repetition indices are 16 bit in the record header
  Index const limit = std::numeric_limits<uint16_t>::max();
  if (cfg.shots - 1 > limit || reps.full - 1 > limit) {
    throw Log::Failure("Emit", "{} shots and {} repetitions do not fit the 16 bit record indices", cfg.shots, reps.full);
  }

  Index const nD = cfg.nDims();
  float const dwell = SampleTimeUs(cfg);
  Log::Print("Emit", "{} repetitions of {} shots, {} samples, {} coils, readout {} ms", reps.full, cfg.shots, cfg.samples,
             cfg.coils, ReadoutDurationMs(cfg));

  uint32_t counter = 0;
  for (Index ir = 0; ir < reps.full; ir++) {
    ShotBlock const block = source(ir);
    if (block.ks.dimension(0) != cfg.coils || block.ks.dimension(1) != cfg.samples || block.ks.dimension(2) != cfg.shots) {
      throw Log::Failure("Emit", "Repetition {} k-space has shape {}, header expects {}", ir, block.ks.dimensions(),
                         Sz3{cfg.coils, cfg.samples, cfg.shots});
    }
    if (block.traj.dimension(0) != nD || block.traj.dimension(1) != cfg.samples || block.traj.dimension(2) != cfg.shots) {
      throw Log::Failure("Emit", "Repetition {} trajectory has shape {}, header expects {}", ir, block.traj.dimensions(),
                         Sz3{nD, cfg.samples, cfg.shots});
    }
    for (Index is = 0; is < cfg.shots; is++) {
      Acquisition acq;
      acq.resize(cfg.samples, cfg.coils, nD);
      acq.head.scan_counter = counter++;
      acq.head.repetition = ir;
      acq.head.kspace_encode_step_1 = is;
      acq.head.sample_time_us = dwell;
      acq.data = block.ks.chip<2>(is);
      acq.traj = block.traj.chip<2>(is);
      if (is == 0) {
        acq.set(Flag::FirstInEncodeStep1);
        acq.set(Flag::FirstInRepetition);
        if (ir == 0) { acq.set(Flag::FirstInMeasurement); }
      }
      if (is == cfg.shots - 1) {
        acq.set(Flag::LastInEncodeStep1);
        acq.set(Flag::LastInRepetition);
        if (ir == reps.full - 1) { acq.set(Flag::LastInMeasurement); }
      }
      sink.appendAcquisition(acq);
    }
    Log::Debug("Emit", "Repetition {} scans {}-{}", ir, counter - cfg.shots, counter - 1);
  }
  return EmitSummary{.repetitions = reps.full, .records = counter, .exact = reps.exact};
}

auto EmitFile(std::string const &fname, HeaderConfig const &cfg, ShotSource const &source, Sideband const &extra)
  -> EmitSummary
{
  auto const start = Log::Now();
  Dataset    ds(fname, Dataset::Mode::Create);
  ds.writeHeader(SerializeHeader(cfg, extra.catalog));
  auto const summary = Emit(ds, cfg, source);
  for (auto const &w : extra.waveforms) {
    if (!extra.catalog.contains(w.head.waveform_id)) {
      Log::Warn("Emit", "Waveform type {} is not in the catalogue", w.head.waveform_id);
    }
    ds.appendWaveform(w);
  }
  if (extra.smaps) { ds.writeImage("smaps", *extra.smaps, HD5::Dims::SENSE); }
  if (extra.coilCov) { ds.writeImage("coil_cov", *extra.coilCov, HD5::Dims::Covariance); }
  ds.close();
  Log::Print("Emit", "Wrote {} records and {} waveforms to {} in {}", summary.records, extra.waveforms.size(), fname,
             Log::ToNow(start));
  return summary;
}

} // namespace sn
