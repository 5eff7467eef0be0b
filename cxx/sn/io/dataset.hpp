#pragma once

#include "../mrd/stream.hpp"
#include "hd5-core.hpp"

#include <optional>

namespace sn {

/*
 * An ISMRMRD-style container. One HDF5 group holds the XML header, the record stream, the waveform
 * stream and an images sub-group.
 */
struct Dataset final : AcquisitionSource, AcquisitionSink
{
  enum struct Mode
  {
    Read,
    Create
  };

  Dataset(std::string const &fname, Mode const mode, std::string const &group = HD5::Keys::Dataset);
  Dataset(Dataset const &) = delete;
  Dataset &operator=(Dataset const &) = delete;
  ~Dataset();

  void close();
  auto isOpen() const -> bool;
  auto filename() const -> std::string const &;

  void writeHeader(std::string const &xml);
  auto readHeader() const -> std::string;

  void appendAcquisition(Acquisition const &acq) override;
  auto readAcquisition(Index const index) const -> Acquisition override;
  auto nAcquisitions() const -> Index override;

  void appendWaveform(Waveform const &wave);
  auto readWaveform(Index const index) const -> Waveform;
  auto nWaveforms() const -> Index;

  template <int N> void writeImage(std::string const &name, CxN<N> const &image, HD5::DNames<size_t(N)> const &dims);
  template <int N> auto readImage(std::string const &name) const -> std::optional<CxN<N>>;
  auto                  images() const -> std::vector<std::string>;

  static void CloseAll(); //! Closes every container still open, registered with std::atexit

private:
  void checkOpen(std::string const &op) const;
  void checkWritable(std::string const &op) const;

  std::string fname_;
  Mode        mode_;
  HD5::Handle file_ = -1, group_ = -1;
};

} // namespace sn
