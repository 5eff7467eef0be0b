#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace sn {
namespace HD5 {

using Handle = int64_t;
using Index = long int;

template <typename T> struct type_tag
{
};

template <size_t N> using Shape = std::array<Index, N>;

template <typename T> Handle type_impl(type_tag<T>, bool const alt = false);

template <typename T> Handle type(bool const alt = false) { return type_impl(type_tag<T>{}, alt); }

void                     Init();
auto                     Exists(Handle const h, std::string const &name) -> bool;
void                     CheckedCall(int status, std::string const &msg);
std::string              GetError();
std::vector<std::string> List(Handle h);

namespace Keys {
std::string const Data = "data";
std::string const Dataset = "dataset";
std::string const Header = "xml";
std::string const Images = "images";
std::string const Log = "log";
std::string const Mask = "mask";
std::string const Trajectory = "trajectory";
std::string const Waveforms = "waveforms";
} // namespace Keys

// Horrible hack due to DSizes shenanigans
template <size_t N> struct DNames : std::array<std::string, N>
{
};

namespace Dims {
DNames<5> const Cartesian = {"channel", "i", "j", "k", "frame"};
DNames<4> const CartesianFrame = {"channel", "i", "j", "k"};
DNames<2> const Covariance = {"channel", "channel"};
DNames<4> const Mask = {"i", "j", "k", "frame"};
DNames<5> const Noncartesian = {"channel", "sample", "shot", "slab", "frame"};
DNames<3> const NoncartesianFrame = {"channel", "sample", "shot"};
DNames<4> const SENSE = {"channel", "i", "j", "k"};
DNames<4> const Trajectory = {"k", "sample", "shot", "frame"};
} // namespace Dims

} // namespace HD5
} // namespace sn
