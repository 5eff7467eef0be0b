#include "header.hpp"

#include "../log/log.hpp"
#include "emitter.hpp"
#include "errors.hpp"

#include <scn/scan.h>

namespace sn {

namespace {
std::string const Namespace = "http://www.ismrm.org/ISMRMRD";
float const       GyromagneticRatio = 42.577478e6f; // Hz/T

auto Required(XML::Node root, std::vector<std::string> const &path) -> XML::Node
{
  auto n = XML::Find(root, path);
  if (!n) { throw MalformedHeaderError("Header", "Missing required field {}", fmt::join(path, "/")); }
  return n;
}

template <typename T> auto Number(XML::Node n) -> T
{
  auto const text = XML::Text(n);
  auto       result = scn::scan<T>(text, "{}");
  if (!result || !result->range().empty()) {
    throw MalformedHeaderError("Header", "Field {} is not a number: '{}'", XML::Name(n), text);
  }
  return result->value();
}

template <typename T> auto Number(XML::Node root, std::vector<std::string> const &path) -> T
{
  return Number<T>(Required(root, path));
}

template <typename T> auto Number(XML::Node root, std::vector<std::string> const &path, T const def) -> T
{
  auto n = XML::Find(root, path);
  return n ? Number<T>(n) : def;
}

auto UserParameter(Parameters const &params, std::vector<std::string> const &names) -> ParameterValue
{
  for (auto const &name : names) {
    auto const it = params.find(name);
    if (it != params.end()) { return it->second; }
  }
  throw MalformedHeaderError("Header", "Missing required user parameter {}", names.front());
}

auto UserFloat(Parameters const &params, std::vector<std::string> const &names) -> float
{
  auto const v = UserParameter(params, names);
  if (auto const *d = std::get_if<double>(&v)) { return static_cast<float>(*d); }
  if (auto const *l = std::get_if<long>(&v)) { return static_cast<float>(*l); }
  throw MalformedHeaderError("Header", "User parameter {} is not numeric", names.front());
}

auto UserIndex(Parameters const &params, std::vector<std::string> const &names) -> Index
{
  auto const v = UserParameter(params, names);
  if (auto const *l = std::get_if<long>(&v)) { return *l; }
  if (auto const *d = std::get_if<double>(&v)) {
    if (*d == std::floor(*d)) { return static_cast<Index>(*d); }
  }
  throw MalformedHeaderError("Header", "User parameter {} is not an integer", names.front());
}

void AddXYZ(XML::Node parent, std::string const &name, auto const &v)
{
  auto n = XML::AddChild(parent, name);
  XML::AddChild(n, "x", fmt::format("{}", v[0]));
  XML::AddChild(n, "y", fmt::format("{}", v[1]));
  XML::AddChild(n, "z", fmt::format("{}", v[2]));
}

void AddLimit(XML::Node parent, std::string const &name, Index const maximum)
{
  auto n = XML::AddChild(parent, name);
  XML::AddChild(n, "minimum", "0");
  XML::AddChild(n, "maximum", fmt::format("{}", maximum));
  XML::AddChild(n, "center", fmt::format("{}", maximum / 2));
}
} // namespace

auto operator==(HeaderConfig const &a, HeaderConfig const &b) -> bool
{
  return std::equal(a.matrix.begin(), a.matrix.end(), b.matrix.begin()) && (a.fov == b.fov).all() && a.coils == b.coils &&
         a.shots == b.shots && a.samples == b.samples && a.field == b.field && a.TR == b.TR && a.TE == b.TE &&
         a.FA == b.FA && a.gmax == b.gmax && a.smax == b.smax && a.dwell == b.dwell && a.maxSimTime == b.maxSimTime &&
         a.seed == b.seed && a.sampling == b.sampling;
}

auto ParseHeader(std::string const &xml) -> HeaderConfig
{
  XML::Document doc = [&xml]() {
    try {
      return XML::Document::Parse(xml);
    } catch (Log::Failure const &f) {
      throw MalformedHeaderError("Header", "{}", f.what());
    }
  }();
  auto const root = doc.root();
  if (XML::Name(root) != "ismrmrdHeader") { throw MalformedHeaderError("Header", "Root element is {}", XML::Name(root)); }

  HeaderConfig cfg;
  cfg.coils = Number<Index>(root, {"acquisitionSystemInformation", "receiverChannels"});
  cfg.field = Number<float>(root, {"acquisitionSystemInformation", "systemFieldStrength_T"}, 3.f);

  auto const encoding = Required(root, {"encoding"});
  auto const matrix = Required(encoding, {"encodedSpace", "matrixSize"});
  cfg.matrix = Sz3{Number<Index>(matrix, {"x"}), Number<Index>(matrix, {"y"}), Number<Index>(matrix, {"z"}, 1)};
  if (auto const fov = XML::Find(encoding, {"encodedSpace", "fieldOfView_mm"})) {
    cfg.fov = Eigen::Array3f(Number<float>(fov, {"x"}), Number<float>(fov, {"y"}), Number<float>(fov, {"z"}));
  } else {
    cfg.fov = Eigen::Array3f(cfg.matrix[0], cfg.matrix[1], cfg.matrix[2]);
  }
  cfg.samples = Number<Index>(encoding, {"encodingLimits", "kspace_encoding_step_0", "maximum"});
  cfg.shots = Number<Index>(encoding, {"encodingLimits", "kspace_encoding_step_1", "maximum"});
  if (auto const traj = XML::Child(encoding, "trajectory")) {
    cfg.sampling = XML::Text(traj) == "cartesian" ? Sampling::Cartesian : Sampling::NonCartesian;
  }

  cfg.TR = Number<float>(root, {"sequenceParameters", "TR"});
  cfg.TE = Number<float>(root, {"sequenceParameters", "TE"});
  cfg.FA = Number<float>(root, {"sequenceParameters", "flipAngle_deg"});

  Parameters params;
  try {
    params = ParseParameters(Required(root, {"userParameters"}));
  } catch (MalformedHeaderError const &) {
    throw;
  } catch (Log::Failure const &f) {
    throw MalformedHeaderError("Header", "{}", f.what());
  }
  cfg.gmax = UserFloat(params, {"gmax"});
  cfg.smax = UserFloat(params, {"smax"});
  cfg.dwell = UserFloat(params, {"dwell_time_ms"});
  cfg.maxSimTime = UserFloat(params, {"max_sim_time_ms", "max_sim_time"});
  cfg.seed = UserIndex(params, {"rng_seed"});

  if (!(cfg.TR > 0.f)) { throw MalformedHeaderError("Header", "TR {} ms must be positive", cfg.TR); }
  if (cfg.coils < 1 || cfg.shots < 1 || cfg.samples < 1 || cfg.matrix[0] < 1 || cfg.matrix[1] < 1 || cfg.matrix[2] < 1) {
    throw MalformedHeaderError("Header", "Coils {} shots {} samples {} matrix {} must all be positive", cfg.coils, cfg.shots,
                               cfg.samples, cfg.matrix);
  }
  Log::Debug("Header", "Matrix {} coils {} shots {} samples {}", cfg.matrix, cfg.coils, cfg.shots, cfg.samples);
  return cfg;
}

auto SerializeHeader(HeaderConfig const &cfg, WaveformCatalog const &catalog) -> std::string
{
  XML::Document doc("ismrmrdHeader", Namespace);
  auto const    root = doc.root();

  auto asi = XML::AddChild(root, "acquisitionSystemInformation");
  XML::AddChild(asi, "systemVendor", "SNAKE-fMRI");
  XML::AddChild(asi, "systemModel", "simulator");
  XML::AddChild(asi, "systemFieldStrength_T", fmt::format("{}", cfg.field));
  XML::AddChild(asi, "receiverChannels", fmt::format("{}", cfg.coils));
  XML::AddChild(asi, "deviceID", "snake");

  auto ec = XML::AddChild(root, "experimentalConditions");
  XML::AddChild(ec, "H1resonanceFrequency_Hz", fmt::format("{}", static_cast<long>(GyromagneticRatio * cfg.field)));

  auto encoding = XML::AddChild(root, "encoding");
  auto encoded = XML::AddChild(encoding, "encodedSpace");
  AddXYZ(encoded, "matrixSize", cfg.matrix);
  AddXYZ(encoded, "fieldOfView_mm", cfg.fov);
  auto recon = XML::AddChild(encoding, "reconSpace");
  AddXYZ(recon, "matrixSize", cfg.matrix);
  AddXYZ(recon, "fieldOfView_mm", cfg.fov);
  auto limits = XML::AddChild(encoding, "encodingLimits");
  AddLimit(limits, "kspace_encoding_step_0", cfg.samples);
  AddLimit(limits, "kspace_encoding_step_1", cfg.shots);
  AddLimit(limits, "repetition", Repetitions(cfg).full);
  XML::AddChild(encoding, "trajectory", cfg.sampling == Sampling::Cartesian ? "cartesian" : "other");

  auto seq = XML::AddChild(root, "sequenceParameters");
  XML::AddChild(seq, "TR", fmt::format("{}", cfg.TR));
  XML::AddChild(seq, "TE", fmt::format("{}", cfg.TE));
  XML::AddChild(seq, "flipAngle_deg", fmt::format("{}", cfg.FA));

  SerializeParameters(Parameters{{"gmax", double(cfg.gmax)},
                                 {"smax", double(cfg.smax)},
                                 {"dwell_time_ms", double(cfg.dwell)},
                                 {"max_sim_time_ms", double(cfg.maxSimTime)},
                                 {"rng_seed", long(cfg.seed)}},
                      XML::AddChild(root, "userParameters"));

  SerializeWaveformCatalog(catalog, root);
  return doc.toString();
}

} // namespace sn
