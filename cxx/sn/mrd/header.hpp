#pragma once

#include "../types.hpp"
#include "catalog.hpp"

namespace sn {

enum struct Sampling
{
  Cartesian,
  NonCartesian
};

/*
 * Everything the framing needs to know about a stream, stored in the ISMRMRD XML header.
 * A 2D volume has matrix[2] == 1.
 */
struct HeaderConfig
{
  Sz3            matrix{1, 1, 1};
  Eigen::Array3f fov = Eigen::Array3f::Ones(); // mm
  Index          coils = 1;
  Index          shots = 1;   // Per frame
  Index          samples = 1; // Per shot
  float          field = 3.f; // T
  float          TR = 0.f, TE = 0.f, FA = 0.f;
  float          gmax = 0.f, smax = 0.f;
  float          dwell = 0.f;      // ms
  float          maxSimTime = 0.f; // ms
  Index          seed = 0;
  Sampling       sampling = Sampling::NonCartesian;

  auto nDims() const -> Index { return matrix[2] == 1 ? 2 : 3; }
};

auto operator==(HeaderConfig const &a, HeaderConfig const &b) -> bool;

auto ParseHeader(std::string const &xml) -> HeaderConfig;
auto SerializeHeader(HeaderConfig const &cfg, WaveformCatalog const &catalog = {}) -> std::string;

} // namespace sn
