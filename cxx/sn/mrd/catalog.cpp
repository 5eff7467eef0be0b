#include "catalog.hpp"

#include "../log/log.hpp"
#include "../sys/base64.hpp"
#include "errors.hpp"

#include <bit>
#include <cstring>
#include <scn/scan.h>

namespace sn {

namespace {
auto ParseLong(std::string const &text, std::string const &name) -> long
{
  auto result = scn::scan<long>(text, "{}");
  if (!result || !result->range().empty()) { throw Log::Failure("Catalog", "Parameter {} is not an integer: '{}'", name, text); }
  return result->value();
}

auto ParseDouble(std::string const &text, std::string const &name) -> double
{
  auto result = scn::scan<double>(text, "{}");
  if (!result || !result->range().empty()) { throw Log::Failure("Catalog", "Parameter {} is not a number: '{}'", name, text); }
  return result->value();
}

auto DecodeFloats(std::string const &text, std::string const &name) -> Eigen::ArrayXf
{
  auto const bytes = Base64Decode(text);
  if (bytes.size() % sizeof(float)) {
    throw Log::Failure("Catalog", "Parameter {} holds {} bytes, not a float32 array", name, bytes.size());
  }
  Eigen::ArrayXf values(bytes.size() / sizeof(float));
  for (Index ii = 0; ii < values.size(); ii++) {
    uint32_t u = 0;
    for (int ib = 0; ib < 4; ib++) {
      u |= uint32_t(bytes[ii * 4 + ib]) << (8 * ib);
    }
    values[ii] = std::bit_cast<float>(u);
  }
  return values;
}

auto EncodeFloats(Eigen::ArrayXf const &values) -> std::string
{
  std::vector<uint8_t> bytes(values.size() * sizeof(float));
  for (Index ii = 0; ii < values.size(); ii++) {
    uint32_t const u = std::bit_cast<uint32_t>(values[ii]);
    for (int ib = 0; ib < 4; ib++) {
      bytes[ii * 4 + ib] = (u >> (8 * ib)) & 0xFF;
    }
  }
  return Base64Encode(bytes);
}
} // namespace

auto ParseParameters(XML::Node userParameters) -> Parameters
{
  Parameters params;
  for (auto const p : XML::Children(userParameters)) {
    auto const encoding = XML::Name(p);
    auto const nameNode = XML::Child(p, "name");
    auto const valueNode = XML::Child(p, "value");
    if (!nameNode || !valueNode) { throw Log::Failure("Catalog", "{} is missing a name or value", encoding); }
    auto const name = XML::Text(nameNode);
    auto const value = XML::Text(valueNode);
    if (encoding == "userParameterLong") {
      params[name] = ParseLong(value, name);
    } else if (encoding == "userParameterDouble") {
      params[name] = ParseDouble(value, name);
    } else if (encoding == "userParameterString") {
      params[name] = value;
    } else if (encoding == "userParameterBase64") {
      params[name] = DecodeFloats(value, name);
    } else {
      throw UnknownParameterEncodingError("Catalog", "Parameter {} has unknown encoding {}", name, encoding);
    }
  }
  return params;
}

void SerializeParameters(Parameters const &params, XML::Node userParameters)
{
  // ISMRMRD wants the encodings grouped in this order
  for (auto const &kv : params) {
    if (auto const *v = std::get_if<long>(&kv.second)) {
      auto p = XML::AddChild(userParameters, "userParameterLong");
      XML::AddChild(p, "name", kv.first);
      XML::AddChild(p, "value", fmt::format("{}", *v));
    }
  }
  for (auto const &kv : params) {
    if (auto const *v = std::get_if<double>(&kv.second)) {
      auto p = XML::AddChild(userParameters, "userParameterDouble");
      XML::AddChild(p, "name", kv.first);
      XML::AddChild(p, "value", fmt::format("{}", *v));
    }
  }
  for (auto const &kv : params) {
    if (auto const *v = std::get_if<std::string>(&kv.second)) {
      auto p = XML::AddChild(userParameters, "userParameterString");
      XML::AddChild(p, "name", kv.first);
      XML::AddChild(p, "value", *v);
    }
  }
  for (auto const &kv : params) {
    if (auto const *v = std::get_if<Eigen::ArrayXf>(&kv.second)) {
      auto p = XML::AddChild(userParameters, "userParameterBase64");
      XML::AddChild(p, "name", kv.first);
      XML::AddChild(p, "value", EncodeFloats(*v));
    }
  }
}

auto ParseWaveformCatalog(XML::Node root) -> WaveformCatalog
{
  WaveformCatalog catalog;
  for (auto const wi : XML::Children(root, "waveformInformation")) {
    auto const nameNode = XML::Child(wi, "waveformName");
    auto const typeNode = XML::Child(wi, "waveformType");
    if (!nameNode || !typeNode) { throw Log::Failure("Catalog", "waveformInformation is missing a name or type"); }
    auto const name = XML::Text(nameNode);
    auto const id = ParseLong(XML::Text(typeNode), name);
    if (catalog.contains(id)) { throw Log::Failure("Catalog", "Waveform type {} is declared twice", id); }
    WaveformType t{.name = name};
    if (auto const up = XML::Child(wi, "userParameters")) { t.parameters = ParseParameters(up); }
    Log::Debug("Catalog", "Waveform type {} {} with {} parameters", id, name, t.parameters.size());
    catalog[id] = std::move(t);
  }
  return catalog;
}

auto ParseWaveformCatalog(std::string const &xml) -> WaveformCatalog
{
  auto const doc = XML::Document::Parse(xml);
  return ParseWaveformCatalog(doc.root());
}

void SerializeWaveformCatalog(WaveformCatalog const &catalog, XML::Node root)
{
  for (auto const &kv : catalog) {
    auto wi = XML::AddChild(root, "waveformInformation");
    XML::AddChild(wi, "waveformName", kv.second.name);
    XML::AddChild(wi, "waveformType", fmt::format("{}", kv.first));
    if (!kv.second.parameters.empty()) { SerializeParameters(kv.second.parameters, XML::AddChild(wi, "userParameters")); }
  }
}

auto Same(ParameterValue const &a, ParameterValue const &b) -> bool
{
  if (a.index() != b.index()) { return false; }
  if (auto const *fa = std::get_if<Eigen::ArrayXf>(&a)) {
    auto const &fb = std::get<Eigen::ArrayXf>(b);
    return fa->size() == fb.size() && std::memcmp(fa->data(), fb.data(), fa->size() * sizeof(float)) == 0;
  }
  return std::visit(
    [&b](auto const &va) -> bool {
      using T = std::decay_t<decltype(va)>;
      if constexpr (std::is_same_v<T, Eigen::ArrayXf>) {
        return false;
      } else {
        return va == std::get<T>(b);
      }
    },
    a);
}

auto Same(WaveformCatalog const &a, WaveformCatalog const &b) -> bool
{
  if (a.size() != b.size()) { return false; }
  for (auto const &kv : a) {
    auto const it = b.find(kv.first);
    if (it == b.end() || it->second.name != kv.second.name) { return false; }
    auto const &pa = kv.second.parameters;
    auto const &pb = it->second.parameters;
    if (pa.size() != pb.size()) { return false; }
    for (auto const &p : pa) {
      auto const ip = pb.find(p.first);
      if (ip == pb.end() || !Same(p.second, ip->second)) { return false; }
    }
  }
  return true;
}

auto ToString(ParameterValue const &v) -> std::string
{
  return std::visit(
    [](auto const &x) -> std::string {
      using T = std::decay_t<decltype(x)>;
      if constexpr (std::is_same_v<T, Eigen::ArrayXf>) {
        return fmt::format("[{} floats]", x.size());
      } else {
        return fmt::format("{}", x);
      }
    },
    v);
}

} // namespace sn
