#pragma once

#include "mrd/emitter.hpp"

namespace sn {

auto CartesianLines(HeaderConfig const &cfg) -> Re3; // k, sample, shot in grid indices
auto SpiralShots(HeaderConfig const &cfg) -> Re3;    // k, sample, shot in grid units about the centre
auto Trajectory(HeaderConfig const &cfg) -> Re3;     // Picks one of the above from the header

/*
 * A stand-in for the simulator. Each repetition gets the same trajectory and complex Gaussian samples
 * seeded from the header so streams are reproducible.
 */
auto Sampler(HeaderConfig const &cfg, Re3 const &traj) -> ShotSource;

} // namespace sn
