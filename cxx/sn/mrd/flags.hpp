#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sn {

/*
 * Acquisition flags use the ISMRMRD bit numbering, bit n has value 1 << (n - 1).
 * ISMRMRD has no first-in-measurement flag so it takes the first user bit.
 */
enum struct Flag : int
{
  FirstInEncodeStep1 = 1,
  LastInEncodeStep1 = 2,
  FirstInRepetition = 13,
  LastInRepetition = 14,
  LastInMeasurement = 25,
  FirstInMeasurement = 57
};

constexpr auto Bit(Flag const f) -> uint64_t { return uint64_t(1) << (static_cast<int>(f) - 1); }

auto FlagName(Flag const f) -> std::string;
auto FlagNames(uint64_t const flags) -> std::vector<std::string>;

inline auto OpensRepetition(uint64_t const flags) -> bool
{
  return flags & (Bit(Flag::FirstInRepetition) | Bit(Flag::FirstInMeasurement));
}

inline auto ClosesRepetition(uint64_t const flags) -> bool
{
  return flags & (Bit(Flag::LastInRepetition) | Bit(Flag::LastInMeasurement));
}

} // namespace sn
