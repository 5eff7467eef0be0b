#include "sampler.hpp"

#include "log/log.hpp"

#include <numbers>

namespace sn {

auto CartesianLines(HeaderConfig const &cfg) -> Re3
{
  Index const nD = cfg.nDims();
  Index const nRead = cfg.matrix[0];
  Index const nPE = cfg.matrix[1] * cfg.matrix[2];
  if (cfg.shots > nPE) { Log::Warn("Sampler", "{} lines requested but only {} phase encodes, some repeat", cfg.shots, nPE); }
  if (cfg.samples > nRead) {
    Log::Warn("Sampler", "{} samples requested on a {} point readout, some repeat", cfg.samples, nRead);
  }

  Re3 traj(nD, cfg.samples, cfg.shots);
  for (Index is = 0; is < cfg.shots; is++) {
    Index const pe = is * nPE / cfg.shots;
    Index const iy = pe % cfg.matrix[1];
    Index const iz = pe / cfg.matrix[1];
    for (Index ir = 0; ir < cfg.samples; ir++) {
      traj(0, ir, is) = ir * nRead / cfg.samples;
      traj(1, ir, is) = iy;
      if (nD == 3) { traj(2, ir, is) = iz; }
    }
  }
  Log::Print("Sampler", "Cartesian trajectory {} lines of {} samples", cfg.shots, cfg.samples);
  return traj;
}

namespace {
auto Read(Index const nRead) -> Re1
{
  Re1 read(nRead);
  for (Index ir = 0; ir < nRead; ir++) {
    read(ir) = nRead > 1 ? (float)(ir) / (nRead - 1) : 0.f;
  }
  return read;
}

/* 2D interleaved Archimedean spiral, one interleave per shot. The number of turns is chosen so the
 * interleaves together meet Nyquist at the edge of k-space.
 */
auto Spiral2D(Index const nRead, Index const nShot, Index const matrix) -> Re3
{
  Re3         traj(2, nRead, nShot);
  auto const  read = Read(nRead);
  float const turns = std::max(1.f, 0.5f * matrix / nShot);
  for (Index is = 0; is < nShot; is++) {
    float const offset = 2.f * std::numbers::pi_v<float> * is / nShot;
    for (Index ir = 0; ir < nRead; ir++) {
      float const r = 0.5f * read(ir);
      float const theta = 2.f * std::numbers::pi_v<float> * turns * read(ir) + offset;
      traj(0, ir, is) = r * std::cos(theta);
      traj(1, ir, is) = r * std::sin(theta);
    }
  }
  return traj;
}

/* This implements the Archimedean spiral described in S. T. S. Wong and M. S. Roos, ‘A strategy for
 * sampling on a sphere applied to 3D selective RF pulse design’, Magnetic Resonance in Medicine,
 * vol. 32, no. 6, pp. 778–784, Dec. 1994, doi: 10.1002/mrm.1910320614.
 */
auto Spiral3D(Index const nRead, Index const nSpoke) -> Re3
{
  Re3 traj(3, nRead, nSpoke);
  traj.setZero();
  auto const read = Read(nRead);
  // Currently to do an outer product, you need to contract over empty indices
  Eigen::array<Eigen::IndexPair<Index>, 0> empty = {};
  Re1                                      endPoint(Sz1{3});

  endPoint(0) = 0.f;
  endPoint(1) = 0.f;
  endPoint(2) = 1.f;
  traj.chip<2>(0) = endPoint.contract(read, empty);
  Index const half = nSpoke / 2;
  if (half == 0) { return 0.5f * traj; }
  endPoint(0) = 1.f;
  endPoint(2) = 0.f;
  traj.chip<2>(half) = endPoint.contract(read, empty);

  double const d_t = 1. / half;                           // Change in theta
  double const c2 = nSpoke * 4. * std::numbers::pi;       // The velocity squared
  double       t = 0.;
  double       phi = 0.;
  for (Index is = 1; is < half; is++) {
    t += d_t;
    double const cos_t2 = t * t;
    double const sin_t2 = 1. - cos_t2;
    double const sin_t = std::sqrt(sin_t2);
    double const d_phi = 0.5 * d_t * std::sqrt((1. / sin_t2) * (c2 - (1. / sin_t2)));
    phi += d_phi;
    endPoint(0) = std::cos(phi) * sin_t;
    endPoint(1) = std::sin(phi) * sin_t;
    endPoint(2) = t;
    traj.chip<2>(half - is) = endPoint.contract(read, empty);
    endPoint(0) = std::cos(phi) * sin_t;
    endPoint(1) = -std::sin(phi) * sin_t;
    endPoint(2) = -t;
    traj.chip<2>(half + is) = endPoint.contract(read, empty);
  }
  // An odd spoke count leaves one spoke over, point it at the south pole
  if (nSpoke % 2) {
    endPoint(0) = 0.f;
    endPoint(1) = 0.f;
    endPoint(2) = -1.f;
    traj.chip<2>(nSpoke - 1) = endPoint.contract(read, empty);
  }
  // Trajectory is stored between -0.5 and 0.5, so scale
  return 0.5f * traj;
}
} // namespace

auto SpiralShots(HeaderConfig const &cfg) -> Re3
{
  Index const nD = cfg.nDims();
  Re3         traj = nD == 2 ? Spiral2D(cfg.samples, cfg.shots, cfg.matrix[0]) : Spiral3D(cfg.samples, cfg.shots);
  for (Index id = 0; id < nD; id++) {
    traj.chip<0>(id) = traj.chip<0>(id) * (float)cfg.matrix[id];
  }
  Log::Print("Sampler", "{}D spiral trajectory {} shots of {} samples", nD, cfg.shots, cfg.samples);
  return traj;
}

auto Trajectory(HeaderConfig const &cfg) -> Re3
{
  return cfg.sampling == Sampling::Cartesian ? CartesianLines(cfg) : SpiralShots(cfg);
}

auto Sampler(HeaderConfig const &cfg, Re3 const &traj) -> ShotSource
{
  if (traj.dimension(0) != cfg.nDims() || traj.dimension(1) != cfg.samples || traj.dimension(2) != cfg.shots) {
    throw Log::Failure("Sampler", "Trajectory shape {} does not match header {}D {} samples {} shots", traj.dimensions(),
                       cfg.nDims(), cfg.samples, cfg.shots);
  }
  return [cfg, traj](Index const repetition) {
    // Eigen treats a zero seed as a request for a random one
    uint64_t const seed = static_cast<uint64_t>(cfg.seed + repetition) + 1;
    ShotBlock      block;
    block.ks.resize(cfg.coils, cfg.samples, cfg.shots);
    block.ks = block.ks.random(Eigen::internal::NormalRandomGenerator<Cx>(seed));
    block.traj = traj;
    return block;
  };
}

} // namespace sn
