#pragma once

#include "hd5-core.hpp"
#include <string>

namespace sn {
namespace HD5 {

void SetDeflate(Index const d); //! Set the global compression (deflate) level

struct Writer
{
  Writer(Writer const &) = delete;
  Writer(std::string const &fname, bool const append = false);
  Writer(Handle const fid); //! Wraps an open file or group without taking ownership
  ~Writer();
  void writeString(std::string const &label, std::string const &string);

  template <typename Scalar, size_t N> void
  writeTensor(std::string const &label, Shape<N> const &shape, Scalar const *data, DNames<N> const &dims);

  bool exists(std::string const &name) const;

private:
  Handle handle_;
  bool   owner_;
};

} // namespace HD5
} // namespace sn
