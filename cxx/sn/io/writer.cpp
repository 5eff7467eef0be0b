#include "writer.hpp"

#include "../log/log.hpp"
#include "../types.hpp"
#include <filesystem>
#include <hdf5.h>
#include <hdf5_hl.h>

namespace sn {
namespace HD5 {

namespace {
Index deflate = 2;
}

void SetDeflate(Index d) { deflate = d; }

Writer::Writer(std::string const &fname, bool const append)
  : owner_{true}
{
  Init();
  auto const p = std::filesystem::path(fname).replace_extension(".h5");
  if (append) {
    if (!std::filesystem::exists(p)) { throw Log::Failure("HD5", "File does not exist: {}", p.string()); }
    handle_ = H5Fopen(p.string().c_str(), H5F_ACC_RDWR, H5P_DEFAULT);
  } else {
    handle_ = H5Fcreate(p.string().c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
  }
  if (handle_ < 0) {
    throw Log::Failure("HD5", "Could not open file {} for writing because: {}", fname, GetError());
  } else {
    Log::Print("HD5", "Opened {} for writing id {}", fname, handle_);
  }
}

Writer::Writer(Handle const fid)
  : handle_{fid}
  , owner_{false}
{
  Init();
  Log::Debug("HD5", "Writer id {}", handle_);
}

Writer::~Writer()
{
  if (owner_) {
    H5Fclose(handle_);
    Log::Debug("HD5", "Closed id {}", handle_);
  }
}

void Writer::writeString(std::string const &label, std::string const &string)
{
  hsize_t     dim[1] = {1};
  auto const  space = H5Screate_simple(1, dim, NULL);
  hid_t const tid = H5Tcopy(H5T_C_S1);
  H5Tset_size(tid, H5T_VARIABLE);
  H5Tset_cset(tid, H5T_CSET_UTF8);
  hid_t const dset = H5Dcreate(handle_, label.c_str(), tid, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not create string {} in handle {}: {}", label, handle_, GetError()); }
  auto ptr = string.c_str();
  CheckedCall(H5Dwrite(dset, tid, H5S_ALL, H5S_ALL, H5P_DEFAULT, &ptr), fmt::format("writing string {}", label));
  CheckedCall(H5Dclose(dset), "closing string dataset");
  CheckedCall(H5Tclose(tid), "closing string type");
  CheckedCall(H5Sclose(space), "closing string space");
  Log::Debug("HD5", "Wrote string {}", label);
}

bool Writer::exists(std::string const &name) const { return HD5::Exists(handle_, name); }

template <typename Scalar, size_t N>
void Writer::writeTensor(std::string const &name, Shape<N> const &shape, Scalar const *data, DNames<N> const &labels)
{
  for (size_t ii = 0; ii < N; ii++) {
    if (shape[ii] == 0) { throw Log::Failure("HD5", "Tensor {} had a zero dimension. Dims: {}", name, shape); }
  }

  hsize_t ds_dims[N], chunk_dims[N];
  // HD5=row-major, Eigen=col-major, so need to reverse the dimensions
  std::copy_n(shape.rbegin(), N, ds_dims);
  std::copy_n(ds_dims, N, chunk_dims);
  // Try to stop chunk dimension going over 4 gig
  Index sizeInBytes = Product(shape) * sizeof(Scalar);
  Index dimToShrink = 0;
  while (sizeInBytes >= (1L << 32L)) {
    if (chunk_dims[dimToShrink] > 1) {
      chunk_dims[dimToShrink] /= 2;
      sizeInBytes /= 2;
    }
    dimToShrink = (dimToShrink + 1) % N;
  }

  auto const space = H5Screate_simple(N, ds_dims, NULL);
  auto const plist = H5Pcreate(H5P_DATASET_CREATE);
  CheckedCall(H5Pset_chunk(plist, N, chunk_dims), "setting chunk");
  if (deflate > 0) { CheckedCall(H5Pset_deflate(plist, deflate), "setting deflate"); }

  hid_t const tid = type<Scalar>();
  hid_t const dset = H5Dcreate(handle_, name.c_str(), tid, space, H5P_DEFAULT, plist, H5P_DEFAULT);
  if (dset < 0) { throw Log::Failure("HD5", "Could not create dataset {} dimensions {} error {}", name, shape, GetError()); }
  auto l = labels.rbegin();
  for (size_t ii = 0; ii < N; ii++) {
    CheckedCall(H5DSset_label(dset, ii, l->c_str()), fmt::format("dataset {} dimension {} label {}", name, ii, *l));
    l++;
  }
  CheckedCall(H5Dwrite(dset, tid, H5S_ALL, H5S_ALL, H5P_DEFAULT, data), "Writing data");
  CheckedCall(H5Pclose(plist), "closing plist");
  CheckedCall(H5Sclose(space), "closing space");
  CheckedCall(H5Dclose(dset), "closing dataset");

  Log::Debug("HD5", "Wrote tensor {}", name);
}

template void Writer::writeTensor<float, 4>(std::string const &, Shape<4> const &, float const *, DNames<4> const &);
template void Writer::writeTensor<Cx, 2>(std::string const &, Shape<2> const &, Cx const *, DNames<2> const &);
template void Writer::writeTensor<Cx, 3>(std::string const &, Shape<3> const &, Cx const *, DNames<3> const &);
template void Writer::writeTensor<Cx, 4>(std::string const &, Shape<4> const &, Cx const *, DNames<4> const &);
template void Writer::writeTensor<Cx, 5>(std::string const &, Shape<5> const &, Cx const *, DNames<5> const &);

} // namespace HD5
} // namespace sn
