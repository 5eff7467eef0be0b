#include "args.hpp"

#include "sn/log/log.hpp"
#include "sn/mrd/emitter.hpp"
#include "sn/mrd/loader.hpp"

using namespace sn;

void main_info(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Input container");
  args::Flag                    xml(parser, "X", "Print the raw XML header", {"xml", 'x'});
  ParseCommand(parser, iname);

  Loader      loader(iname.Get());
  auto const &cfg = loader.config();
  if (xml) {
    fmt::print("{}\n", loader.header());
    return;
  }

  auto const reps = Repetitions(cfg);
  fmt::print("Sampling:     {}\n", cfg.sampling == Sampling::Cartesian ? "Cartesian" : "Non-Cartesian");
  fmt::print("Matrix:       {}\n", fmt::join(loader.shape(), ","));
  fmt::print("FOV (mm):     {}\n", fmt::join(cfg.fov, ","));
  fmt::print("Field (T):    {}\n", cfg.field);
  fmt::print("Coils:        {}\n", cfg.coils);
  fmt::print("Shots:        {}\n", cfg.shots);
  fmt::print("Samples:      {}\n", cfg.samples);
  fmt::print("TR/TE (ms):   {}/{}\n", cfg.TR, cfg.TE);
  fmt::print("Flip angle:   {}\n", cfg.FA);
  fmt::print("Gmax/Smax:    {}/{}\n", cfg.gmax, cfg.smax);
  fmt::print("Dwell (ms):   {}\n", cfg.dwell);
  fmt::print("Time (ms):    {}\n", cfg.maxSimTime);
  fmt::print("Seed:         {}\n", cfg.seed);
  fmt::print("Frames:       {}{}\n", reps.full, reps.exact ? "" : fmt::format(" ({} ms unused)", reps.remainder));
  fmt::print("Records:      {}\n", loader.nAcquisitions());
  fmt::print("Waveforms:    {}\n", loader.nWaveforms());
  for (auto const &[id, type] : loader.catalog()) {
    fmt::print("  {:>4} {}\n", id, type.name);
    for (auto const &[name, value] : type.parameters) {
      fmt::print("       {} = {}\n", name, ToString(value));
    }
  }
  auto const images = loader.images();
  fmt::print("Images:       {}\n", fmt::join(images, ", "));
}
