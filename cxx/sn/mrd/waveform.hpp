#pragma once

#include "acquisition.hpp"
#include "catalog.hpp"

namespace sn {

struct Dataset;

/*
 * A waveform resolved against the catalogue
 */
struct DynamicEntry
{
  long           id;
  std::string    name;
  Parameters     parameters;
  WaveformHeader head;
  Re2            data; // channel, sample
};

struct WaveformReader
{
  WaveformReader(Dataset const &dataset, WaveformCatalog const &catalog);

  auto size() const -> Index;
  auto read(Index const index) const -> DynamicEntry; // Throws LookupError for a bad index or unknown type
  auto readAll() const -> std::vector<DynamicEntry>;  // Skips and logs entries that cannot be read

private:
  Dataset const         &dataset_;
  WaveformCatalog const &catalog_;
};

} // namespace sn
