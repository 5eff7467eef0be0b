#include "args.hpp"

#include "sn/io/writer.hpp"
#include "sn/log/debug.hpp"

#include <exception>
#include <fmt/format.h>
#include <scn/scan.h>

using namespace sn;

namespace {
std::unordered_map<int, Log::Display> levelMap{
  {0, Log::Display::None}, {1, Log::Display::Ephemeral}, {2, Log::Display::Low}, {3, Log::Display::High}};
}

args::Group                      global_group("GLOBAL OPTIONS");
args::HelpFlag                   help(global_group, "H", "Show this help message", {'h', "help"});
args::MapFlag<int, Log::Display> verbosity(global_group, "V", "Log level 0-3", {'v', "verbosity"}, levelMap, Log::Display::Low);
args::ValueFlag<std::string>     debug(global_group, "F", "Write debug images to file", {"debug"});
args::ValueFlag<Index>           deflate_level(global_group, "D", "Set deflate level (0=none)", {"deflate"}, 2);

void SetLogging(std::string const &name)
{
  if (verbosity) {
    Log::SetDisplayLevel(verbosity.Get());
  } else if (char *const env_p = std::getenv("SN_VERBOSITY")) {
    auto const it = levelMap.find(std::atoi(env_p));
    if (it == levelMap.end()) { throw args::Error(fmt::format("SN_VERBOSITY must be 0-3, was {}", env_p)); }
    Log::SetDisplayLevel(it->second);
  }
  Log::Print(name, "Welcome to SNAKE");
  if (debug) { Log::SetDebugFile(debug.Get()); }
}

void SetDeflate()
{
  if (deflate_level) {
    HD5::SetDeflate(deflate_level.Get());
  } else if (char *const env_p = std::getenv("SN_DEFLATE")) {
    HD5::SetDeflate(atoi(env_p));
  }
}

void ParseCommand(args::Subparser &parser)
{
  args::GlobalOptions globals(parser, global_group);
  parser.Parse();
  SetLogging(parser.GetCommand().Name());
  SetDeflate();
}

void ParseCommand(args::Subparser &parser, args::Positional<std::string> &iname)
{
  ParseCommand(parser);
  if (!iname) { throw args::Error("No input file specified"); }
}

void ParseCommand(args::Subparser &parser, args::Positional<std::string> &iname, args::Positional<std::string> &oname)
{
  ParseCommand(parser);
  if (!iname) { throw args::Error("No input file specified"); }
  if (!oname) { throw args::Error("No output file specified"); }
}

class ArgsError : public std::runtime_error
{
public:
  ArgsError(std::string const &msg)
    : std::runtime_error(msg)
  {
  }
};

template <int N> void SzReader<N>::operator()(std::string const &name, std::string const &value, sn::Sz<N> &sz)
{
  size_t ind = 0;
  if (auto result = scn::scan<Index>(value, "{}")) {
    sz[ind] = result->value();
    for (ind = 1; ind < N; ind++) {
      result = scn::scan<Index>(result->range(), ",{}");
      if (!result) { throw(ArgsError(fmt::format("Could not read {} from '{}'", name, value))); }
      sz[ind] = result->value();
    }
  } else {
    throw(ArgsError(fmt::format("Could not read {} from '{}'", name, value)));
  }
}

template struct SzReader<3>;

template <typename T, int ND>
void ArrayReader<T, ND>::operator()(std::string const &name, std::string const &value, Eigen::Array<T, ND, 1> &v)
{
  size_t ind = 0;
  if (auto result = scn::scan<T>(value, "{}")) {
    v[ind] = result->value();
    for (ind = 1; ind < ND; ind++) {
      result = scn::scan<T>(result->range(), ",{}");
      if (!result) { throw(ArgsError(fmt::format("Could not read {} from '{}'", name, value))); }
      v[ind] = result->value();
    }
  } else {
    throw(ArgsError(fmt::format("Could not read {} from '{}'", name, value)));
  }
}

template struct ArrayReader<float, 3>;
