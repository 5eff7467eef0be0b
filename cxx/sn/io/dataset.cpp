#include "dataset.hpp"

#include "../log/log.hpp"
#include "../mrd/errors.hpp"
#include "reader.hpp"
#include "writer.hpp"

#include <cstdlib>
#include <filesystem>
#include <hdf5.h>
#include <set>

namespace sn {

namespace {
std::set<Dataset *> openDatasets;
bool                exitHookRegistered = false;

void CloseAtExit()
{
  if (!openDatasets.empty()) { Log::Debug("Dataset", "Closing {} containers at exit", openDatasets.size()); }
  Dataset::CloseAll();
}

struct AcquisitionRecord
{
  AcquisitionHeader head;
  hvl_t             traj;
  hvl_t             data;
};

struct WaveformRecord
{
  WaveformHeader head;
  hvl_t          data;
};

/*
 * Owns an HDF5 identifier and hands it to the matching close function on scope exit
 */
struct Scoped
{
  hid_t id;
  herr_t (*closer)(hid_t);
  ~Scoped()
  {
    if (id >= 0) { closer(id); }
  }
  operator hid_t() const { return id; }
};

auto AcquisitionHeaderType() -> hid_t
{
  hid_t t = H5Tcreate(H5T_COMPOUND, sizeof(AcquisitionHeader));
  HD5::CheckedCall(H5Tinsert(t, "version", HOFFSET(AcquisitionHeader, version), H5T_NATIVE_UINT16), "inserting version");
  HD5::CheckedCall(H5Tinsert(t, "flags", HOFFSET(AcquisitionHeader, flags), H5T_NATIVE_UINT64), "inserting flags");
  HD5::CheckedCall(H5Tinsert(t, "scan_counter", HOFFSET(AcquisitionHeader, scan_counter), H5T_NATIVE_UINT32),
                   "inserting scan_counter");
  HD5::CheckedCall(H5Tinsert(t, "number_of_samples", HOFFSET(AcquisitionHeader, number_of_samples), H5T_NATIVE_UINT16),
                   "inserting number_of_samples");
  HD5::CheckedCall(H5Tinsert(t, "active_channels", HOFFSET(AcquisitionHeader, active_channels), H5T_NATIVE_UINT16),
                   "inserting active_channels");
  HD5::CheckedCall(
    H5Tinsert(t, "trajectory_dimensions", HOFFSET(AcquisitionHeader, trajectory_dimensions), H5T_NATIVE_UINT16),
    "inserting trajectory_dimensions");
  HD5::CheckedCall(H5Tinsert(t, "sample_time_us", HOFFSET(AcquisitionHeader, sample_time_us), H5T_NATIVE_FLOAT),
                   "inserting sample_time_us");
  HD5::CheckedCall(
    H5Tinsert(t, "kspace_encode_step_1", HOFFSET(AcquisitionHeader, kspace_encode_step_1), H5T_NATIVE_UINT16),
    "inserting kspace_encode_step_1");
  HD5::CheckedCall(
    H5Tinsert(t, "kspace_encode_step_2", HOFFSET(AcquisitionHeader, kspace_encode_step_2), H5T_NATIVE_UINT16),
    "inserting kspace_encode_step_2");
  HD5::CheckedCall(H5Tinsert(t, "repetition", HOFFSET(AcquisitionHeader, repetition), H5T_NATIVE_UINT16),
                   "inserting repetition");
  return t;
}

auto AcquisitionType() -> hid_t
{
  Scoped const head{AcquisitionHeaderType(), H5Tclose};
  Scoped const vlen{H5Tvlen_create(H5T_NATIVE_FLOAT), H5Tclose};
  hid_t        t = H5Tcreate(H5T_COMPOUND, sizeof(AcquisitionRecord));
  HD5::CheckedCall(H5Tinsert(t, "head", HOFFSET(AcquisitionRecord, head), head), "inserting head");
  HD5::CheckedCall(H5Tinsert(t, "traj", HOFFSET(AcquisitionRecord, traj), vlen), "inserting traj");
  HD5::CheckedCall(H5Tinsert(t, "data", HOFFSET(AcquisitionRecord, data), vlen), "inserting data");
  return t;
}

auto WaveformHeaderType() -> hid_t
{
  hid_t t = H5Tcreate(H5T_COMPOUND, sizeof(WaveformHeader));
  HD5::CheckedCall(H5Tinsert(t, "version", HOFFSET(WaveformHeader, version), H5T_NATIVE_UINT16), "inserting version");
  HD5::CheckedCall(H5Tinsert(t, "flags", HOFFSET(WaveformHeader, flags), H5T_NATIVE_UINT64), "inserting flags");
  HD5::CheckedCall(H5Tinsert(t, "measurement_uid", HOFFSET(WaveformHeader, measurement_uid), H5T_NATIVE_UINT32),
                   "inserting measurement_uid");
  HD5::CheckedCall(H5Tinsert(t, "scan_counter", HOFFSET(WaveformHeader, scan_counter), H5T_NATIVE_UINT32),
                   "inserting scan_counter");
  HD5::CheckedCall(H5Tinsert(t, "time_stamp", HOFFSET(WaveformHeader, time_stamp), H5T_NATIVE_UINT32),
                   "inserting time_stamp");
  HD5::CheckedCall(H5Tinsert(t, "channels", HOFFSET(WaveformHeader, channels), H5T_NATIVE_UINT16), "inserting channels");
  HD5::CheckedCall(H5Tinsert(t, "number_of_samples", HOFFSET(WaveformHeader, number_of_samples), H5T_NATIVE_UINT16),
                   "inserting number_of_samples");
  HD5::CheckedCall(H5Tinsert(t, "sample_time_us", HOFFSET(WaveformHeader, sample_time_us), H5T_NATIVE_FLOAT),
                   "inserting sample_time_us");
  HD5::CheckedCall(H5Tinsert(t, "waveform_id", HOFFSET(WaveformHeader, waveform_id), H5T_NATIVE_UINT16),
                   "inserting waveform_id");
  return t;
}

auto WaveformType() -> hid_t
{
  Scoped const head{WaveformHeaderType(), H5Tclose};
  Scoped const vlen{H5Tvlen_create(H5T_NATIVE_FLOAT), H5Tclose};
  hid_t        t = H5Tcreate(H5T_COMPOUND, sizeof(WaveformRecord));
  HD5::CheckedCall(H5Tinsert(t, "head", HOFFSET(WaveformRecord, head), head), "inserting head");
  HD5::CheckedCall(H5Tinsert(t, "data", HOFFSET(WaveformRecord, data), vlen), "inserting data");
  return t;
}

auto Count(hid_t const group, std::string const &name) -> Index
{
  if (!HD5::Exists(group, name)) { return 0; }
  Scoped const dset{H5Dopen(group, name.c_str(), H5P_DEFAULT), H5Dclose};
  if (dset < 0) { throw Log::Failure("Dataset", "Could not open {}: {}", name, HD5::GetError()); }
  Scoped const space{H5Dget_space(dset), H5Sclose};
  hsize_t      dims[1] = {0};
  H5Sget_simple_extent_dims(space, dims, NULL);
  return dims[0];
}

// Appends one element to an extendible 1-D dataset, creating it on first use
void Append(hid_t const group, std::string const &name, hid_t const type, void const *element)
{
  hsize_t const one[1] = {1};
  if (!HD5::Exists(group, name)) {
    hsize_t const zero[1] = {0}, unlimited[1] = {H5S_UNLIMITED}, chunk[1] = {64};
    Scoped const  space{H5Screate_simple(1, zero, unlimited), H5Sclose};
    Scoped const  plist{H5Pcreate(H5P_DATASET_CREATE), H5Pclose};
    HD5::CheckedCall(H5Pset_chunk(plist, 1, chunk), "setting chunk");
    Scoped const created{H5Dcreate(group, name.c_str(), type, space, H5P_DEFAULT, plist, H5P_DEFAULT), H5Dclose};
    if (created < 0) { throw ContainerWriteError("Dataset", "Could not create {}: {}", name, HD5::GetError()); }
  }
  Scoped const dset{H5Dopen(group, name.c_str(), H5P_DEFAULT), H5Dclose};
  hsize_t      n[1] = {0};
  {
    Scoped const space{H5Dget_space(dset), H5Sclose};
    H5Sget_simple_extent_dims(space, n, NULL);
  }
  hsize_t const extent[1] = {n[0] + 1};
  if (H5Dset_extent(dset, extent) < 0) {
    throw ContainerWriteError("Dataset", "Could not extend {}: {}", name, HD5::GetError());
  }
  Scoped const fspace{H5Dget_space(dset), H5Sclose};
  H5Sselect_hyperslab(fspace, H5S_SELECT_SET, n, NULL, one, NULL);
  Scoped const mspace{H5Screate_simple(1, one, NULL), H5Sclose};
  if (H5Dwrite(dset, type, mspace, fspace, H5P_DEFAULT, element) < 0) {
    throw ContainerWriteError("Dataset", "Could not write element {} of {}: {}", n[0], name, HD5::GetError());
  }
}

// Reads one element of a 1-D dataset. The caller must reclaim the variable length members.
void ReadElement(hid_t const group, std::string const &name, hid_t const type, Index const index, void *element)
{
  Scoped const dset{H5Dopen(group, name.c_str(), H5P_DEFAULT), H5Dclose};
  if (dset < 0) { throw Log::Failure("Dataset", "Could not open {}: {}", name, HD5::GetError()); }
  hsize_t const start[1] = {static_cast<hsize_t>(index)}, one[1] = {1};
  Scoped const  fspace{H5Dget_space(dset), H5Sclose};
  H5Sselect_hyperslab(fspace, H5S_SELECT_SET, start, NULL, one, NULL);
  Scoped const mspace{H5Screate_simple(1, one, NULL), H5Sclose};
  if (H5Dread(dset, type, mspace, fspace, H5P_DEFAULT, element) < 0) {
    throw Log::Failure("Dataset", "Could not read element {} of {}: {}", index, name, HD5::GetError());
  }
}

void Reclaim(hid_t const type, void *element)
{
  hsize_t const one[1] = {1};
  Scoped const  mspace{H5Screate_simple(1, one, NULL), H5Sclose};
  HD5::CheckedCall(H5Dvlen_reclaim(type, mspace, H5P_DEFAULT, element), "reclaiming variable length data");
}
} // namespace

Dataset::Dataset(std::string const &fname, Mode const mode, std::string const &group)
  : fname_{fname}
  , mode_{mode}
{
  HD5::Init();
  if (mode_ == Mode::Read) {
    if (!std::filesystem::exists(fname_)) { throw ContainerNotFoundError("Dataset", "File does not exist: {}", fname_); }
    if (H5Fis_hdf5(fname_.c_str()) <= 0) { throw ContainerNotFoundError("Dataset", "{} is not an HDF5 container", fname_); }
    file_ = H5Fopen(fname_.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
    if (file_ < 0) { throw ContainerNotFoundError("Dataset", "Could not open {}: {}", fname_, HD5::GetError()); }
    if (!HD5::Exists(file_, group)) {
      H5Fclose(file_);
      throw ContainerNotFoundError("Dataset", "{} has no group {}", fname_, group);
    }
    group_ = H5Gopen(file_, group.c_str(), H5P_DEFAULT);
  } else {
    if (std::filesystem::exists(fname_)) {
      Log::Warn("Dataset", "Replacing existing file {}", fname_);
      std::error_code ec;
      std::filesystem::remove(fname_, ec);
      if (ec) { throw ContainerWriteError("Dataset", "Could not replace {}: {}", fname_, ec.message()); }
    }
    file_ = H5Fcreate(fname_.c_str(), H5F_ACC_EXCL, H5P_DEFAULT, H5P_DEFAULT);
    if (file_ < 0) { throw ContainerWriteError("Dataset", "Could not create {}: {}", fname_, HD5::GetError()); }
    group_ = H5Gcreate(file_, group.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  }
  if (group_ < 0) {
    H5Fclose(file_);
    throw ContainerWriteError("Dataset", "Could not open group {} in {}: {}", group, fname_, HD5::GetError());
  }

  openDatasets.insert(this);
  if (!exitHookRegistered) {
    std::atexit(CloseAtExit);
    exitHookRegistered = true;
  }
  Log::Print("Dataset", "Opened {} for {} id {}", fname_, mode_ == Mode::Read ? "reading" : "writing", file_);
}

Dataset::~Dataset() { close(); }

void Dataset::close()
{
  if (file_ < 0) { return; }
  openDatasets.erase(this);
  if (mode_ == Mode::Create) { H5Fflush(file_, H5F_SCOPE_GLOBAL); }
  H5Gclose(group_);
  H5Fclose(file_);
  Log::Debug("Dataset", "Closed {} id {}", fname_, file_);
  group_ = -1;
  file_ = -1;
}

void Dataset::CloseAll()
{
  auto const open = openDatasets;
  for (auto d : open) {
    d->close();
  }
}

auto Dataset::isOpen() const -> bool { return file_ >= 0; }

auto Dataset::filename() const -> std::string const & { return fname_; }

void Dataset::checkOpen(std::string const &op) const
{
  if (file_ < 0) { throw Log::Failure("Dataset", "Cannot {}, {} is closed", op, fname_); }
}

void Dataset::checkWritable(std::string const &op) const
{
  checkOpen(op);
  if (mode_ != Mode::Create) { throw ContainerWriteError("Dataset", "Cannot {}, {} is read-only", op, fname_); }
}

void Dataset::writeHeader(std::string const &xml)
{
  checkWritable("write header");
  if (HD5::Exists(group_, HD5::Keys::Header)) {
    throw ContainerWriteError("Dataset", "Header already written to {}", fname_);
  }
  try {
    HD5::Writer writer(group_);
    writer.writeString(HD5::Keys::Header, xml);
  } catch (ContainerWriteError const &) {
    throw;
  } catch (Log::Failure const &f) {
    throw ContainerWriteError("Dataset", "{}", f.what());
  }
}

auto Dataset::readHeader() const -> std::string
{
  checkOpen("read header");
  if (!HD5::Exists(group_, HD5::Keys::Header)) { throw Log::Failure("Dataset", "{} has no XML header", fname_); }
  HD5::Reader reader(group_);
  return reader.readString(HD5::Keys::Header);
}

void Dataset::appendAcquisition(Acquisition const &acq)
{
  checkWritable("append acquisition");
  if (acq.data.dimension(0) != acq.head.active_channels || acq.data.dimension(1) != acq.head.number_of_samples ||
      acq.traj.dimension(0) != acq.head.trajectory_dimensions || acq.traj.dimension(1) != acq.head.number_of_samples) {
    throw ContainerWriteError("Dataset", "Scan {} arrays do not match its header", acq.head.scan_counter);
  }
  AcquisitionRecord rec;
  rec.head = acq.head;
  rec.traj.len = acq.traj.size();
  rec.traj.p = const_cast<float *>(acq.traj.data());
  // Complex samples are stored as interleaved real and imaginary parts
  rec.data.len = 2 * acq.data.size();
  rec.data.p = const_cast<float *>(reinterpret_cast<float const *>(acq.data.data()));
  Scoped const type{AcquisitionType(), H5Tclose};
  Append(group_, HD5::Keys::Data, type, &rec);
}

auto Dataset::readAcquisition(Index const index) const -> Acquisition
{
  checkOpen("read acquisition");
  auto const n = nAcquisitions();
  if (index < 0 || index >= n) { throw Log::Failure("Dataset", "Record {} requested from {} with {}", index, fname_, n); }
  AcquisitionRecord rec;
  Scoped const      type{AcquisitionType(), H5Tclose};
  ReadElement(group_, HD5::Keys::Data, type, index, &rec);

  Acquisition acq;
  acq.head = rec.head;
  Index const ns = rec.head.number_of_samples, nc = rec.head.active_channels, nt = rec.head.trajectory_dimensions;
  bool const  consistent = rec.traj.len == static_cast<size_t>(nt * ns) && rec.data.len == static_cast<size_t>(2 * nc * ns);
  if (consistent) {
    acq.traj = Eigen::TensorMap<Re2>(static_cast<float *>(rec.traj.p), nt, ns);
    acq.data = Eigen::TensorMap<Cx2>(static_cast<Cx *>(rec.data.p), nc, ns);
  }
  Reclaim(type, &rec);
  if (!consistent) {
    throw Log::Failure("Dataset", "Record {} in {} has {} trajectory and {} data values for header {}x{}x{}", index, fname_,
                       rec.traj.len, rec.data.len, nt, nc, ns);
  }
  return acq;
}

auto Dataset::nAcquisitions() const -> Index
{
  checkOpen("count acquisitions");
  return Count(group_, HD5::Keys::Data);
}

void Dataset::appendWaveform(Waveform const &wave)
{
  checkWritable("append waveform");
  if (wave.data.dimension(0) != wave.head.channels || wave.data.dimension(1) != wave.head.number_of_samples) {
    throw ContainerWriteError("Dataset", "Waveform {} data does not match its header", wave.head.scan_counter);
  }
  WaveformRecord rec;
  rec.head = wave.head;
  rec.data.len = wave.data.size();
  rec.data.p = const_cast<float *>(wave.data.data());
  Scoped const type{WaveformType(), H5Tclose};
  Append(group_, HD5::Keys::Waveforms, type, &rec);
}

auto Dataset::readWaveform(Index const index) const -> Waveform
{
  checkOpen("read waveform");
  auto const n = nWaveforms();
  if (index < 0 || index >= n) { throw LookupError("Dataset", "Waveform {} requested from {} with {}", index, fname_, n); }
  WaveformRecord rec;
  Scoped const   type{WaveformType(), H5Tclose};
  ReadElement(group_, HD5::Keys::Waveforms, type, index, &rec);

  Waveform   wave;
  Index const ns = rec.head.number_of_samples, nc = rec.head.channels;
  bool const  consistent = rec.data.len == static_cast<size_t>(nc * ns);
  wave.head = rec.head;
  if (consistent) { wave.data = Eigen::TensorMap<Re2>(static_cast<float *>(rec.data.p), nc, ns); }
  Reclaim(type, &rec);
  if (!consistent) {
    throw Log::Failure("Dataset", "Waveform {} in {} has {} values for header {}x{}", index, fname_, rec.data.len, nc, ns);
  }
  return wave;
}

auto Dataset::nWaveforms() const -> Index
{
  checkOpen("count waveforms");
  return Count(group_, HD5::Keys::Waveforms);
}

template <int N> void Dataset::writeImage(std::string const &name, CxN<N> const &image, HD5::DNames<size_t(N)> const &dims)
{
  checkWritable("write image");
  if (!HD5::Exists(group_, HD5::Keys::Images)) {
    Scoped const g{H5Gcreate(group_, HD5::Keys::Images.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT), H5Gclose};
    if (g < 0) { throw ContainerWriteError("Dataset", "Could not create images group: {}", HD5::GetError()); }
  }
  Scoped const images{H5Gopen(group_, HD5::Keys::Images.c_str(), H5P_DEFAULT), H5Gclose};
  if (HD5::Exists(images, name)) { throw ContainerWriteError("Dataset", "Image {} already exists in {}", name, fname_); }
  try {
    HD5::Writer writer(images);
    writer.writeTensor(name, ToArray(image.dimensions()), image.data(), dims);
  } catch (Log::Failure const &f) {
    throw ContainerWriteError("Dataset", "{}", f.what());
  }
}

template void Dataset::writeImage<2>(std::string const &, Cx2 const &, HD5::DNames<2> const &);
template void Dataset::writeImage<4>(std::string const &, Cx4 const &, HD5::DNames<4> const &);

template <int N> auto Dataset::readImage(std::string const &name) const -> std::optional<CxN<N>>
{
  checkOpen("read image");
  if (!HD5::Exists(group_, HD5::Keys::Images)) { return std::nullopt; }
  Scoped const images{H5Gopen(group_, HD5::Keys::Images.c_str(), H5P_DEFAULT), H5Gclose};
  if (!HD5::Exists(images, name)) { return std::nullopt; }
  HD5::Reader reader(images);
  return reader.readTensor<CxN<N>>(name);
}

template auto Dataset::readImage<2>(std::string const &) const -> std::optional<Cx2>;
template auto Dataset::readImage<4>(std::string const &) const -> std::optional<Cx4>;

auto Dataset::images() const -> std::vector<std::string>
{
  checkOpen("list images");
  if (!HD5::Exists(group_, HD5::Keys::Images)) { return {}; }
  Scoped const images{H5Gopen(group_, HD5::Keys::Images.c_str(), H5P_DEFAULT), H5Gclose};
  return HD5::List(images);
}

} // namespace sn
