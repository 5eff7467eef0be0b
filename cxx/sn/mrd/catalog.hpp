#pragma once

#include "../io/xml.hpp"
#include "../types.hpp"

#include <map>
#include <string>
#include <variant>

namespace sn {

/*
 * Waveform parameters are stored in the header as ISMRMRD user parameters. Base64 parameters hold
 * little-endian float32 arrays.
 */
using ParameterValue = std::variant<long, double, std::string, Eigen::ArrayXf>;
using Parameters = std::map<std::string, ParameterValue>;

struct WaveformType
{
  std::string name;
  Parameters  parameters;
};

using WaveformCatalog = std::map<long, WaveformType>;

auto ParseWaveformCatalog(std::string const &xml) -> WaveformCatalog;
auto ParseWaveformCatalog(XML::Node root) -> WaveformCatalog;
void SerializeWaveformCatalog(WaveformCatalog const &catalog, XML::Node root);

auto ParseParameters(XML::Node userParameters) -> Parameters;
void SerializeParameters(Parameters const &params, XML::Node userParameters);

auto Same(ParameterValue const &a, ParameterValue const &b) -> bool;
auto Same(WaveformCatalog const &a, WaveformCatalog const &b) -> bool;
auto ToString(ParameterValue const &v) -> std::string;

} // namespace sn
