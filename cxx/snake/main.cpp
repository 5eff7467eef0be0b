#include "args.hpp"
#include "sn/log/log.hpp"

using namespace sn;

#define COMMAND(PARSER, NM, CMD, DESC)                                                                                         \
  void          main_##NM(args::Subparser &parser);                                                                            \
  args::Command NM(PARSER, CMD, DESC, &main_##NM);

int main(int const argc, char const *const argv[])
{
  args::ArgumentParser parser("SNAKE");
  args::GlobalOptions  globals(parser, global_group);

  args::Group stream(parser, "STREAM");
  COMMAND(stream, simulate, "simulate", "Emit a synthetic acquisition stream");
  COMMAND(stream, frames, "frames", "Assemble k-space frames from a stream");

  args::Group data(parser, "DATA");
  COMMAND(data, info, "info", "Print the header and contents of a container");
  COMMAND(data, waveforms, "waveforms", "List the waveforms in a container");

  try {
    parser.ParseCLI(argc, argv);
    Log::End();
  } catch (args::Help &) {
    fmt::print(stderr, "{}\n", parser.Help());
    return EXIT_SUCCESS;
  } catch (args::Error &e) {
    fmt::print(stderr, "{}\n", parser.Help());
    fmt::print(stderr, fmt::fg(fmt::terminal_color::bright_red), "{}\n", e.what());
    return EXIT_FAILURE;
  } catch (Log::Failure &f) {
    Log::Fail(f);
    Log::End();
    return EXIT_FAILURE;
  } catch (std::exception const &e) {
    Log::Fail(Log::Failure("None", "{}", e.what()));
    Log::End();
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
