#include "args.hpp"

#include "sn/io/writer.hpp"
#include "sn/log/log.hpp"
#include "sn/mrd/loader.hpp"

using namespace sn;

namespace {

template <int ND> void WriteCartesian(Loader const &loader, HD5::Writer &writer)
{
  auto assembler = loader.cartesian<ND>();
  std::vector<typename Cartesian<ND>::Frame> frames;
  while (auto frame = assembler.next()) {
    frames.push_back(std::move(*frame));
  }
  Sz3 const   shape = loader.shape();
  Index const nC = loader.nCoils();
  Index const nF = frames.size();
  Cx5         ks(nC, shape[0], shape[1], shape[2], nF);
  Re4         mask(shape[0], shape[1], shape[2], nF);
  for (Index ifr = 0; ifr < nF; ifr++) {
    ks.chip<4>(ifr) = frames[ifr].ks.reshape(Sz4{nC, shape[0], shape[1], shape[2]});
    mask.chip<3>(ifr) = frames[ifr].mask.template cast<float>().reshape(shape);
  }
  writer.writeTensor(HD5::Keys::Data, HD5::Shape<5>(ToArray(ks.dimensions())), ks.data(), HD5::Dims::Cartesian);
  writer.writeTensor(HD5::Keys::Mask, HD5::Shape<4>(ToArray(mask.dimensions())), mask.data(), HD5::Dims::Mask);
  Log::Print("frames", "Wrote {} Cartesian frames", nF);
}

void WriteNonCartesian(Loader const &loader, HD5::Writer &writer)
{
  auto                              assembler = loader.noncartesian();
  std::vector<NonCartesian::Frame> frames;
  while (auto frame = assembler.next()) {
    frames.push_back(std::move(*frame));
  }
  Index const nC = loader.nCoils(), nS = loader.nSamples(), nT = loader.nShots();
  Index const nD = loader.config().nDims();
  Index const nF = frames.size();
  Cx5         ks(nC, nS, nT, 1, nF);
  Re4         traj(nD, nS, nT, nF);
  for (Index ifr = 0; ifr < nF; ifr++) {
    ks.chip<4>(ifr) = frames[ifr].ks.reshape(Sz4{nC, nS, nT, 1});
    traj.chip<3>(ifr) = frames[ifr].traj;
  }
  writer.writeTensor(HD5::Keys::Data, HD5::Shape<5>(ToArray(ks.dimensions())), ks.data(), HD5::Dims::Noncartesian);
  writer.writeTensor(HD5::Keys::Trajectory, HD5::Shape<4>(ToArray(traj.dimensions())), traj.data(), HD5::Dims::Trajectory);
  Log::Print("frames", "Wrote {} non-Cartesian frames", nF);
}

} // namespace

void main_frames(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Input container");
  args::Positional<std::string> oname(parser, "FILE", "Output frames file");
  ParseCommand(parser, iname, oname);
  auto const cmd = parser.GetCommand().Name();

  Loader      loader(iname.Get());
  HD5::Writer writer(oname.Get());
  writer.writeString(HD5::Keys::Header, loader.header());
  if (loader.config().sampling == Sampling::Cartesian) {
    if (loader.config().nDims() == 2) {
      WriteCartesian<2>(loader, writer);
    } else {
      WriteCartesian<3>(loader, writer);
    }
  } else {
    WriteNonCartesian(loader, writer);
  }
  writer.writeString(HD5::Keys::Log, fmt::format("{}", fmt::join(Log::Saved(), "\n")));
  Log::Print(cmd, "Finished");
}
