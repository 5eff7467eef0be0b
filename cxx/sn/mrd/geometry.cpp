#include "geometry.hpp"

#include "../log/debug.hpp"
#include "../log/log.hpp"
#include "../tensors.hpp"
#include "errors.hpp"

namespace sn {

template <int ND> Cartesian<ND>::Cartesian(HeaderConfig const &cfg)
  : shape{FirstN<ND>(cfg.matrix)}
  , channels{cfg.coils}
{
  if (ND == 2 && cfg.matrix[2] != 1) {
    throw Log::Failure("Frame", "Matrix {} is 3D, cannot assemble 2D Cartesian frames", cfg.matrix);
  }
}

template <int ND> auto Cartesian<ND>::blank() const -> Frame
{
  Frame f;
  f.ks.resize(AddFront(shape, channels));
  f.ks.setZero();
  f.mask.resize(shape);
  f.mask.setConstant(false);
  return f;
}

template <int ND> void Cartesian<ND>::insert(Acquisition const &acq, Index const, Frame &frame) const
{
  auto const &h = acq.head;
  if (acq.channels() != channels) {
    throw Log::Failure("Frame", "Scan {} has {} channels, header has {}", h.scan_counter, acq.channels(), channels);
  }
  if (acq.traj.dimension(0) != ND) {
    throw Log::Failure("Frame", "Scan {} has {}D trajectory, frame is {}D", h.scan_counter, acq.traj.dimension(0), ND);
  }
  for (Index is = 0; is < acq.samples(); is++) {
    Sz<ND> ind;
    for (Index id = 0; id < ND; id++) {
      float const c = acq.traj(id, is);
      Index const r = std::lround(c);
      if (std::abs(c - r) > 1.e-3f || r < 0 || r >= shape[id]) {
        throw Log::Failure("Frame", "Scan {} sample {} co-ordinate {} is not a grid index within {}", h.scan_counter, is, c,
                           shape);
      }
      ind[id] = r;
    }
    frame.mask(ind) = true;
    for (Index ic = 0; ic < channels; ic++) {
      frame.ks(AddFront(ind, ic)) = acq.data(ic, is);
    }
  }
}

template <int ND> void Cartesian<ND>::finish(Frame const &frame, Index const shots) const
{
  Log::Debug("Frame", "Repetition {} {} lines {} of {} points sampled", frame.repetition, shots, Count(frame.mask),
             Product(shape));
  if (Log::IsDebugging()) {
    auto const name = fmt::format("frame-{}", frame.repetition);
    if constexpr (ND == 2) {
      Log::Tensor(name, ToArray(frame.ks.dimensions()), frame.ks.data(), HD5::DNames<3>{"channel", "i", "j"});
    } else {
      Log::Tensor(name, ToArray(frame.ks.dimensions()), frame.ks.data(), HD5::Dims::CartesianFrame);
    }
  }
}

template struct Cartesian<2>;
template struct Cartesian<3>;

NonCartesian::NonCartesian(HeaderConfig const &cfg)
  : channels{cfg.coils}
  , samples{cfg.samples}
  , shots{cfg.shots}
  , nDims{cfg.nDims()}
{
}

auto NonCartesian::blank() const -> Frame
{
  Frame f;
  f.ks.resize(channels, samples, shots);
  f.ks.setZero();
  f.traj.resize(nDims, samples, shots);
  f.traj.setZero();
  return f;
}

void NonCartesian::insert(Acquisition const &acq, Index const shot, Frame &frame) const
{
  auto const &h = acq.head;
  if (shot >= shots) {
    throw FlagSequenceError(h.scan_counter, fmt::format("shot {} is beyond the {} shots in a frame", shot, shots));
  }
  if (h.kspace_encode_step_1 != shot) {
    throw FlagSequenceError(h.scan_counter, fmt::format("shot index {} is out of order, expected {}", h.kspace_encode_step_1, shot));
  }
  if (acq.channels() != channels || acq.samples() != samples) {
    throw Log::Failure("Frame", "Scan {} has {} channels and {} samples, header has {} and {}", h.scan_counter,
                       acq.channels(), acq.samples(), channels, samples);
  }
  if (acq.traj.dimension(0) != nDims) {
    throw Log::Failure("Frame", "Scan {} has {}D trajectory, header is {}D", h.scan_counter, acq.traj.dimension(0), nDims);
  }
  frame.ks.chip<2>(shot) = acq.data;
  frame.traj.chip<2>(shot) = acq.traj;
}

void NonCartesian::finish(Frame const &frame, Index const n) const
{
  if (n < shots) {
    Log::Warn("Frame", "Repetition {} closed after {} of {} shots, missing shots are zero", frame.repetition, n, shots);
  }
  Log::Debug("Frame", "Repetition {} {} shots", frame.repetition, n);
  if (Log::IsDebugging()) {
    Log::Tensor(fmt::format("frame-{}", frame.repetition), ToArray(frame.ks.dimensions()), frame.ks.data(),
                HD5::Dims::NoncartesianFrame);
  }
}

} // namespace sn
