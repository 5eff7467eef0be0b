#include "args.hpp"

#include "sn/log/log.hpp"
#include "sn/mrd/loader.hpp"

using namespace sn;

void main_waveforms(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Input container");
  args::Flag                    values(parser, "V", "Print the samples as well", {"values"});
  ParseCommand(parser, iname);
  auto const cmd = parser.GetCommand().Name();

  Loader     loader(iname.Get());
  auto const entries = loader.allDynamic();
  for (auto const &e : entries) {
    fmt::print("{} ({}) scan {} time {} channels {} samples {} dwell {} us\n", e.name, e.id, e.head.scan_counter,
               e.head.time_stamp, e.data.dimension(0), e.data.dimension(1), e.head.sample_time_us);
    if (values) {
      for (Index ic = 0; ic < e.data.dimension(0); ic++) {
        Re1 const ch = e.data.chip<0>(ic);
        fmt::print("  {}\n", fmt::join(ch.data(), ch.data() + ch.size(), " "));
      }
    }
  }
  Log::Print(cmd, "Listed {} of {} waveforms", entries.size(), loader.nWaveforms());
}
