#include "args.hpp"

#include "sn/log/log.hpp"
#include "sn/mrd/emitter.hpp"
#include "sn/sampler.hpp"

#include <numbers>

using namespace sn;

namespace {
long const MotionWaveformType = 1;

auto MotionWaveform(HeaderConfig const &cfg, Index const reps, float const amplitude) -> Waveform
{
  // Rigid body motion, three translations in mm then three rotations in degrees, one sample per repetition
  Waveform w;
  w.resize(std::max(reps, Index(1)), 6);
  w.head.waveform_id = MotionWaveformType;
  w.head.sample_time_us = cfg.TR * cfg.shots * 1000.f;
  for (Index ir = 0; ir < w.data.dimension(1); ir++) {
    float const phase = 2.f * std::numbers::pi_v<float> * ir / w.data.dimension(1);
    for (Index ia = 0; ia < 6; ia++) {
      w.data(ia, ir) = amplitude * std::sin(phase + ia * std::numbers::pi_v<float> / 6.f);
    }
  }
  return w;
}
} // namespace

void main_simulate(args::Subparser &parser)
{
  args::Positional<std::string> oname(parser, "FILE", "Output container");

  SzFlag<3>              matrix(parser, "M", "Matrix size x,y,z (z=1 for 2D)", {"matrix", 'm'}, Sz3{32, 32, 1});
  ArrayFlag<float, 3>    fov(parser, "FOV", "Field of view in mm (default 1 mm voxels)", {"fov"});
  args::ValueFlag<Index> coils(parser, "C", "Receive coils", {"coils", 'c'}, 4);
  args::ValueFlag<Index> shots(parser, "S", "Shots per frame", {"shots", 's'}, 16);
  args::ValueFlag<Index> samples(parser, "N", "Samples per shot", {"samples", 'n'}, 256);
  args::ValueFlag<float> TR(parser, "TR", "Repetition time (ms)", {"tr"}, 50.f);
  args::ValueFlag<float> TE(parser, "TE", "Echo time (ms)", {"te"}, 25.f);
  args::ValueFlag<float> FA(parser, "FA", "Flip angle (degrees)", {"fa"}, 15.f);
  args::ValueFlag<float> gmax(parser, "G", "Gradient limit (mT/m)", {"gmax"}, 40.f);
  args::ValueFlag<float> smax(parser, "S", "Slew limit (T/m/s)", {"smax"}, 180.f);
  args::ValueFlag<float> dwell(parser, "D", "Dwell time (ms)", {"dwell"}, 0.01f);
  args::ValueFlag<float> time(parser, "T", "Simulation time (ms)", {"time", 't'}, 1000.f);
  args::ValueFlag<Index> seed(parser, "R", "Random seed", {"seed"}, 0);
  args::ValueFlag<float> field(parser, "B0", "Field strength (T)", {"field"}, 3.f);
  args::Flag             cart(parser, "C", "Cartesian lines instead of spirals", {"cart"});
  args::ValueFlag<float> motion(parser, "A", "Add a rigid motion waveform with this amplitude", {"motion"});
  args::Flag             smaps(parser, "S", "Store uniform sensitivity maps and coil covariance", {"smaps"});

  ParseCommand(parser);
  auto const cmd = parser.GetCommand().Name();
  if (!oname) { throw args::Error("No output file specified"); }

  HeaderConfig cfg;
  cfg.matrix = matrix.Get();
  cfg.fov = fov ? fov.Get() : Eigen::Array3f(float(cfg.matrix[0]), float(cfg.matrix[1]), float(cfg.matrix[2]));
  cfg.coils = coils.Get();
  cfg.shots = shots.Get();
  cfg.samples = samples.Get();
  cfg.field = field.Get();
  cfg.TR = TR.Get();
  cfg.TE = TE.Get();
  cfg.FA = FA.Get();
  cfg.gmax = gmax.Get();
  cfg.smax = smax.Get();
  cfg.dwell = dwell.Get();
  cfg.maxSimTime = time.Get();
  cfg.seed = seed.Get();
  cfg.sampling = cart ? Sampling::Cartesian : Sampling::NonCartesian;
  if (cart) { cfg.samples = cfg.matrix[0]; }

  Sideband extra;
  if (motion) {
    extra.catalog[MotionWaveformType] =
      WaveformType{.name = "motion",
                   .parameters = {{"axes", std::string("tx,ty,tz,rx,ry,rz")},
                                  {"amplitude", double(motion.Get())},
                                  {"channels", long(6)},
                                  {"weights", Eigen::ArrayXf(Eigen::ArrayXf::Ones(6))}}};
    extra.waveforms.push_back(MotionWaveform(cfg, Repetitions(cfg).full, motion.Get()));
  }
  if (smaps) {
    Cx4 maps(cfg.coils, cfg.matrix[0], cfg.matrix[1], cfg.matrix[2]);
    maps.setConstant(Cx(1.f / std::sqrt(float(cfg.coils))));
    extra.smaps = maps;
    Cx2 cov(cfg.coils, cfg.coils);
    cov.setZero();
    for (Index ic = 0; ic < cfg.coils; ic++) {
      cov(ic, ic) = Cx(1.f);
    }
    extra.coilCov = cov;
  }

  auto const traj = Trajectory(cfg);
  auto const summary = EmitFile(oname.Get(), cfg, Sampler(cfg, traj), extra);
  Log::Print(cmd, "{} repetitions{}, {} records", summary.repetitions, summary.exact ? "" : " (truncated)", summary.records);
}
