#include "acquisition.hpp"

#include "../log/log.hpp"
#include "errors.hpp"
#include "stream.hpp"

#include <limits>

namespace sn {

auto FlagName(Flag const f) -> std::string
{
  switch (f) {
  case Flag::FirstInEncodeStep1: return "FIRST_IN_ENCODE_STEP1";
  case Flag::LastInEncodeStep1: return "LAST_IN_ENCODE_STEP1";
  case Flag::FirstInRepetition: return "FIRST_IN_REPETITION";
  case Flag::LastInRepetition: return "LAST_IN_REPETITION";
  case Flag::LastInMeasurement: return "LAST_IN_MEASUREMENT";
  case Flag::FirstInMeasurement: return "FIRST_IN_MEASUREMENT";
  }
  return fmt::format("BIT_{}", static_cast<int>(f));
}

auto FlagNames(uint64_t const flags) -> std::vector<std::string>
{
  std::vector<std::string> names;
  for (int bit = 1; bit <= 64; bit++) {
    if (flags & (uint64_t(1) << (bit - 1))) { names.push_back(FlagName(Flag(bit))); }
  }
  return names;
}

FlagSequenceError::FlagSequenceError(long const scan, std::string const &problem)
  : Log::Failure("Frame", "Scan {}: {}", scan, problem)
  , scan_{scan}
{
}

void Acquisition::resize(Index const samples, Index const channels, Index const trajDims)
{
  auto const limit = std::numeric_limits<uint16_t>::max();
  if (samples > limit || channels > limit || trajDims > limit) {
    throw Log::Failure("Acq", "Samples {} channels {} dimensions {} exceed the header limit", samples, channels, trajDims);
  }
  head.number_of_samples = samples;
  head.active_channels = channels;
  head.trajectory_dimensions = trajDims;
  data.resize(channels, samples);
  data.setZero();
  traj.resize(trajDims, samples);
  traj.setZero();
}

auto AcquisitionStream::readAcquisition(Index const index) const -> Acquisition
{
  if (index < 0 || index >= nAcquisitions()) {
    throw Log::Failure("Stream", "Record {} requested from a stream of {}", index, nAcquisitions());
  }
  return records[index];
}

void Waveform::resize(Index const samples, Index const channels)
{
  auto const limit = std::numeric_limits<uint16_t>::max();
  if (samples > limit || channels > limit) {
    throw Log::Failure("Acq", "Waveform samples {} channels {} exceed the header limit", samples, channels);
  }
  head.number_of_samples = samples;
  head.channels = channels;
  data.resize(channels, samples);
  data.setZero();
}

} // namespace sn
