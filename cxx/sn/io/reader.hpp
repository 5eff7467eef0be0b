#pragma once

#include "hd5-core.hpp"

#include <string>

namespace sn {
namespace HD5 {

/*
 * Reads tensors and strings out of HDF5 files or groups. Used for frame exports and dataset images.
 */
struct Reader
{
  Reader(Reader const &) = delete;
  Reader(std::string const &fname, bool const altComplex = false);
  Reader(Handle const fid, bool const altComplex = false);
  ~Reader();

  auto list() const -> std::vector<std::string>;                                           // List all datasets
  auto exists(std::string const &label = Keys::Data) const -> bool;                        // Does a data-set exist?
  auto order(std::string const &label = Keys::Data) const -> Index;                        // Determine order of tensor dataset
  auto dimensions(std::string const &label = Keys::Data) const -> std::vector<Index>;      // Get Tensor dimensions

  auto readString(std::string const &label) const -> std::string;

  template <typename T> auto readTensor(std::string const &label = Keys::Data) const -> T;
  template <int N> auto      readDNames(std::string const &label = Keys::Data) const -> DNames<N>;

protected:
  Handle handle_;
  bool   owner_, altComplex_;
};

} // namespace HD5
} // namespace sn
