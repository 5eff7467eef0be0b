#include "reader.hpp"

#include "../log/log.hpp"
#include "../types.hpp"
#include <filesystem>
#include <hdf5.h>
#include <hdf5_hl.h>

namespace sn {
namespace HD5 {

Reader::Reader(std::string const &fname, bool const altX)
  : owner_{true}
  , altComplex_{altX}
{
  if (!std::filesystem::exists(fname)) { throw Log::Failure("HD5", "File does not exist: {}", fname); }
  Init();
  handle_ = H5Fopen(fname.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
  if (handle_ < 0) { throw Log::Failure("HD5", "Failed to open {}", fname); }
  Log::Print("HD5", "Opened {} for reading id {}", fname, handle_);
}

Reader::Reader(Handle const fid, bool const altX)
  : handle_{fid}
  , owner_{false}
  , altComplex_{altX}
{
  Init();
  Log::Debug("HD5", "Reader id {}", handle_);
}

Reader::~Reader()
{
  if (owner_) {
    H5Fclose(handle_);
    Log::Debug("HD5", "Closed id {}", handle_);
  }
}

auto Reader::list() const -> std::vector<std::string> { return List(handle_); }

auto Reader::order(std::string const &name) const -> Index
{
  hid_t dset = H5Dopen(handle_, name.c_str(), H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not open tensor {}", name); }
  hid_t     ds = H5Dget_space(dset);
  int const ndims = H5Sget_simple_extent_ndims(ds);
  CheckedCall(H5Sclose(ds), "Could not close dataspace");
  CheckedCall(H5Dclose(dset), "Could not close dataset");
  return ndims;
}

auto Reader::dimensions(std::string const &label) const -> std::vector<Index>
{
  hid_t dset = H5Dopen(handle_, label.c_str(), H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not open tensor {}", label); }

  hid_t                ds = H5Dget_space(dset);
  int const            ND = H5Sget_simple_extent_ndims(ds);
  std::vector<hsize_t> hdims(ND);
  H5Sget_simple_extent_dims(ds, hdims.data(), NULL);
  std::vector<Index> dims(ND);
  for (int ii = 0; ii < ND; ii++) {
    dims[ii] = hdims[ii];
  }
  std::reverse(dims.begin(), dims.end()); // HD5=row-major, Eigen=col-major
  CheckedCall(H5Sclose(ds), "Could not close dataspace");
  CheckedCall(H5Dclose(dset), "Could not close dataset");
  return dims;
}

template <typename T> auto Reader::readTensor(std::string const &name) const -> T
{
  constexpr auto ND = T::NumDimensions;
  using Scalar = typename T::Scalar;
  hid_t dset = H5Dopen(handle_, name.c_str(), H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not open tensor '{}'", name); }
  hid_t      ds = H5Dget_space(dset);
  auto const rank = H5Sget_simple_extent_ndims(ds);
  if (rank != ND) {
    H5Sclose(ds);
    H5Dclose(dset);
    throw Log::Failure("HD5", "Tensor {} has rank {} expected {}", name, rank, ND);
  }

  std::array<hsize_t, ND> dims;
  H5Sget_simple_extent_dims(ds, dims.data(), NULL);
  typename Eigen::Tensor<Scalar, ND>::Dimensions tDims;
  std::copy_n(dims.begin(), ND, tDims.begin());
  std::reverse(tDims.begin(), tDims.end()); // HD5=row-major, Eigen=col-major
  Eigen::Tensor<Scalar, ND> tensor(tDims);
  herr_t ret_value = H5Dread(dset, type<Scalar>(altComplex_), ds, H5S_ALL, H5P_DATASET_XFER_DEFAULT, tensor.data());
  H5Sclose(ds);
  H5Dclose(dset);
  if (ret_value < 0) {
    throw Log::Failure("HD5", "Error reading tensor {} code {}", name, ret_value);
  } else {
    Log::Debug("HD5", "Read tensor {} shape {}", name, tDims);
  }
  return tensor;
}

template auto Reader::readTensor<Re4>(std::string const &) const -> Re4;
template auto Reader::readTensor<Cx2>(std::string const &) const -> Cx2;
template auto Reader::readTensor<Cx4>(std::string const &) const -> Cx4;
template auto Reader::readTensor<Cx5>(std::string const &) const -> Cx5;

template <int N> auto Reader::readDNames(std::string const &name) const -> DNames<N>
{
  if (N != order(name)) { throw Log::Failure("HD5", "Asked for {} dimension names, but {} order tensor", N, order(name)); }
  hid_t ds = H5Dopen(handle_, name.c_str(), H5P_DEFAULT);
  if (ds < 0) { throw Log::Failure("HD5", "Could not open tensor '{}'", name); }
  DNames<N> names;
  for (Index ii = 0; ii < N; ii++) {
    char buffer[64] = {0};
    H5DSget_label(ds, ii, buffer, sizeof(buffer));
    names[ii] = std::string(buffer);
  }
  std::reverse(names.begin(), names.end());
  H5Dclose(ds);
  return names;
}

template auto Reader::readDNames<4>(std::string const &) const -> DNames<4>;
template auto Reader::readDNames<5>(std::string const &) const -> DNames<5>;

auto Reader::readString(std::string const &name) const -> std::string
{
  hid_t dset = H5Dopen(handle_, name.c_str(), H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not open dataset '{}'", name); }
  hid_t      ds = H5Dget_space(dset);
  auto const rank = H5Sget_simple_extent_ndims(ds);
  if (rank != 1) {
    H5Sclose(ds);
    H5Dclose(dset);
    throw Log::Failure("HD5", "String {} has rank {} on disk, must be 1", name, rank);
  }
  hid_t const tid = H5Tcopy(H5T_C_S1);
  H5Tset_size(tid, H5T_VARIABLE);
  H5Tset_cset(tid, H5T_CSET_UTF8);
  char *rdata[1] = {nullptr};
  CheckedCall(H5Dread(dset, tid, ds, H5S_ALL, H5P_DATASET_XFER_DEFAULT, rdata), "Could not read string");
  std::string const r(rdata[0] ? rdata[0] : "");
  CheckedCall(H5Dvlen_reclaim(tid, ds, H5P_DEFAULT, rdata), "Could not reclaim string");
  CheckedCall(H5Tclose(tid), "Could not close string type");
  CheckedCall(H5Sclose(ds), "Could not close string dataspace");
  CheckedCall(H5Dclose(dset), "Could not close string dataset");
  Log::Debug("HD5", "Read string {}", name);
  return r;
}

auto Reader::exists(std::string const &label) const -> bool { return Exists(handle_, label); }

} // namespace HD5
} // namespace sn
