#pragma once

#include "../log/log.hpp"

namespace sn {

struct MalformedHeaderError : Log::Failure
{
  using Log::Failure::Failure;
};

struct FlagSequenceError : Log::Failure
{
  FlagSequenceError(long const scan, std::string const &problem);
  auto scanCounter() const -> long { return scan_; }

private:
  long scan_;
};

struct TruncatedStreamError : Log::Failure
{
  using Log::Failure::Failure;
};

struct ContainerNotFoundError : Log::Failure
{
  using Log::Failure::Failure;
};

struct ContainerWriteError : Log::Failure
{
  using Log::Failure::Failure;
};

struct UnknownParameterEncodingError : Log::Failure
{
  using Log::Failure::Failure;
};

struct LookupError : Log::Failure
{
  using Log::Failure::Failure;
};

} // namespace sn
