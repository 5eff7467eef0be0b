#include "waveform.hpp"

#include "../io/dataset.hpp"
#include "../log/log.hpp"
#include "errors.hpp"

namespace sn {

WaveformReader::WaveformReader(Dataset const &dataset, WaveformCatalog const &catalog)
  : dataset_{dataset}
  , catalog_{catalog}
{
}

auto WaveformReader::size() const -> Index { return dataset_.nWaveforms(); }

auto WaveformReader::read(Index const index) const -> DynamicEntry
{
  auto const n = size();
  if (index < 0 || index >= n) { throw LookupError("Waveform", "Index {} is out of range, there are {} waveforms", index, n); }
  auto       wave = dataset_.readWaveform(index);
  auto const it = catalog_.find(wave.head.waveform_id);
  if (it == catalog_.end()) {
    throw LookupError("Waveform", "Waveform {} has type {} which is not in the catalogue", index, wave.head.waveform_id);
  }
  return DynamicEntry{.id = it->first,
                      .name = it->second.name,
                      .parameters = it->second.parameters,
                      .head = wave.head,
                      .data = std::move(wave.data)};
}

auto WaveformReader::readAll() const -> std::vector<DynamicEntry>
{
  std::vector<DynamicEntry> entries;
  Index                     n = 0;
  try {
    n = size();
  } catch (Log::Failure const &f) {
    Log::Warn("Waveform", "Could not count waveforms: {}", f.what());
    return entries;
  }
  for (Index ii = 0; ii < n; ii++) {
    try {
      entries.push_back(read(ii));
    } catch (Log::Failure const &f) {
      Log::Warn("Waveform", "Skipping waveform {}: {}", ii, f.what());
    }
  }
  Log::Print("Waveform", "Read {} of {} waveforms", entries.size(), n);
  return entries;
}

} // namespace sn
