#pragma once

#include "acquisition.hpp"

#include <vector>

namespace sn {

struct AcquisitionSource
{
  virtual ~AcquisitionSource() = default;
  virtual auto nAcquisitions() const -> Index = 0;
  virtual auto readAcquisition(Index const index) const -> Acquisition = 0;
};

struct AcquisitionSink
{
  virtual ~AcquisitionSink() = default;
  virtual void appendAcquisition(Acquisition const &acq) = 0;
};

/*
 * An in-memory record stream, for tests and for building streams before they hit a container.
 */
struct AcquisitionStream final : AcquisitionSource, AcquisitionSink
{
  auto nAcquisitions() const -> Index override { return static_cast<Index>(records.size()); }
  auto readAcquisition(Index const index) const -> Acquisition override;
  void appendAcquisition(Acquisition const &acq) override { records.push_back(acq); }

  std::vector<Acquisition> records;
};

} // namespace sn
