#pragma once

#include "../types.hpp"
#include "flags.hpp"

namespace sn {

/*
 * Fixed layout header, stored as a compound in the container. Field names follow ISMRMRD.
 * The shot index within a repetition lives in kspace_encode_step_1.
 */
struct AcquisitionHeader
{
  uint16_t version = 1;
  uint64_t flags = 0;
  uint32_t scan_counter = 0;
  uint16_t number_of_samples = 0;
  uint16_t active_channels = 0;
  uint16_t trajectory_dimensions = 0;
  float    sample_time_us = 0.f;
  uint16_t kspace_encode_step_1 = 0;
  uint16_t kspace_encode_step_2 = 0;
  uint16_t repetition = 0;
};

struct Acquisition
{
  AcquisitionHeader head;
  Re2               traj; // k, sample
  Cx2               data; // channel, sample

  void resize(Index const samples, Index const channels, Index const trajDims);
  auto samples() const -> Index { return data.dimension(1); }
  auto channels() const -> Index { return data.dimension(0); }

  void set(Flag const f) { head.flags |= Bit(f); }
  void clear(Flag const f) { head.flags &= ~Bit(f); }
  auto isSet(Flag const f) const -> bool { return head.flags & Bit(f); }
  auto flagNames() const -> std::vector<std::string> { return FlagNames(head.flags); }
};

struct WaveformHeader
{
  uint16_t version = 1;
  uint64_t flags = 0;
  uint32_t measurement_uid = 0;
  uint32_t scan_counter = 0;
  uint32_t time_stamp = 0;
  uint16_t channels = 0;
  uint16_t number_of_samples = 0;
  float    sample_time_us = 0.f;
  uint16_t waveform_id = 0;
};

struct Waveform
{
  WaveformHeader head;
  Re2            data; // channel, sample

  void resize(Index const samples, Index const channels);
};

} // namespace sn
