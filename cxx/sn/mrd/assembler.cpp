#include "assembler.hpp"

#include "../log/log.hpp"
#include "errors.hpp"

namespace sn {

auto ToString(AssemblyState const s) -> std::string
{
  switch (s) {
  case AssemblyState::AwaitingFirstShot: return "AwaitingFirstShot";
  case AssemblyState::Accumulating: return "Accumulating";
  case AssemblyState::FrameComplete: return "FrameComplete";
  case AssemblyState::Exhausted: return "Exhausted";
  }
  return "Unknown";
}

template <typename G>
FrameAssembler<G>::FrameAssembler(AcquisitionSource const &source, HeaderConfig const &cfg)
  : source_{source}
  , geometry_{cfg}
  , frame_{geometry_.blank()}
  , state_{AssemblyState::AwaitingFirstShot}
  , cursor_{0}
  , shot_{0}
  , frames_{0}
{
}

template <typename G> auto FrameAssembler<G>::next() -> std::optional<Frame>
{
  if (state_ == AssemblyState::Exhausted) { return std::nullopt; }
  if (state_ == AssemblyState::FrameComplete) { state_ = AssemblyState::AwaitingFirstShot; }

  Index const n = source_.nAcquisitions();
  try {
    while (cursor_ < n) {
      auto const  acq = source_.readAcquisition(cursor_++);
      auto const &h = acq.head;
      if (state_ == AssemblyState::AwaitingFirstShot) {
        if (!OpensRepetition(h.flags)) {
          throw FlagSequenceError(h.scan_counter, fmt::format("expected FIRST_IN_REPETITION, found [{}]",
                                                              fmt::join(FlagNames(h.flags), ", ")));
        }
        state_ = AssemblyState::Accumulating;
        shot_ = 0;
        frame_.repetition = h.repetition;
      } else if (OpensRepetition(h.flags)) {
        throw FlagSequenceError(h.scan_counter,
                                fmt::format("repetition {} opened before repetition {} closed", h.repetition, frame_.repetition));
      }

      geometry_.insert(acq, shot_, frame_);
      shot_++;

      if (ClosesRepetition(h.flags)) {
        geometry_.finish(frame_, shot_);
        Frame out = std::move(frame_);
        frame_ = geometry_.blank();
        state_ = AssemblyState::FrameComplete;
        frames_++;
        return out;
      }
    }
  } catch (Log::Failure const &) {
    state_ = AssemblyState::Exhausted;
    throw;
  }

  if (state_ == AssemblyState::Accumulating) {
    state_ = AssemblyState::Exhausted;
    throw TruncatedStreamError("Frame", "Stream ended after {} records with repetition {} still open at shot {}", cursor_,
                               frame_.repetition, shot_);
  }
  Log::Debug("Frame", "Stream finished after {} records and {} frames", cursor_, frames_);
  state_ = AssemblyState::Exhausted;
  return std::nullopt;
}

template <typename G> auto FrameAssembler<G>::state() const -> AssemblyState { return state_; }

template <typename G> auto FrameAssembler<G>::position() const -> Index { return cursor_; }

template <typename G> auto FrameAssembler<G>::frames() const -> Index { return frames_; }

template struct FrameAssembler<Cartesian<2>>;
template struct FrameAssembler<Cartesian<3>>;
template struct FrameAssembler<NonCartesian>;

} // namespace sn
