#pragma once

#include "acquisition.hpp"
#include "header.hpp"

namespace sn {

/*
 * Geometry policies for FrameAssembler. Each owns the frame layout and knows where a record lands in it.
 * The flag logic lives in the assembler and is shared.
 */
template <int ND> struct Cartesian
{
  struct Frame
  {
    CxN<ND + 1> ks;   // channel, i, j[, k]
    BN<ND>      mask; // i, j[, k]
    Index       repetition = 0;
  };

  Cartesian(HeaderConfig const &cfg);
  auto blank() const -> Frame;
  void insert(Acquisition const &acq, Index const shot, Frame &frame) const;
  void finish(Frame const &frame, Index const shots) const;

  Sz<ND> shape;
  Index  channels;
};

struct NonCartesian
{
  struct Frame
  {
    Cx3   ks;   // channel, sample, shot
    Re3   traj; // k, sample, shot
    Index repetition = 0;
  };

  NonCartesian(HeaderConfig const &cfg);
  auto blank() const -> Frame;
  void insert(Acquisition const &acq, Index const shot, Frame &frame) const;
  void finish(Frame const &frame, Index const shots) const;

  Index channels, samples, shots, nDims;
};

} // namespace sn
