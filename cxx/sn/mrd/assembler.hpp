#pragma once

#include "geometry.hpp"
#include "stream.hpp"

#include <optional>

namespace sn {

enum struct AssemblyState
{
  AwaitingFirstShot,
  Accumulating,
  FrameComplete,
  Exhausted
};

auto ToString(AssemblyState const s) -> std::string;

/*
 * Walks a record stream once and yields one frame per repetition. Frames are moved out, the assembler
 * starts the next repetition with fresh zeroed buffers. Any error leaves it Exhausted.
 */
template <typename Geometry> struct FrameAssembler
{
  using Frame = typename Geometry::Frame;

  FrameAssembler(AcquisitionSource const &source, HeaderConfig const &cfg);

  auto next() -> std::optional<Frame>; // Empty once the stream is done
  auto state() const -> AssemblyState;
  auto position() const -> Index; // Records consumed
  auto frames() const -> Index;   // Frames yielded

private:
  AcquisitionSource const &source_;
  Geometry                 geometry_;
  Frame                    frame_;
  AssemblyState            state_;
  Index                    cursor_, shot_, frames_;
};

using CartesianAssembler2 = FrameAssembler<Cartesian<2>>;
using CartesianAssembler3 = FrameAssembler<Cartesian<3>>;
using NonCartesianAssembler = FrameAssembler<NonCartesian>;

} // namespace sn
