#include "sn/mrd/assembler.hpp"
#include "sn/mrd/emitter.hpp"
#include "sn/mrd/errors.hpp"
#include "sn/tensors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace sn;
using namespace Catch;

namespace {
auto Config(Index const shots, Index const samples, Index const coils, float const time, float const TR) -> HeaderConfig
{
  HeaderConfig cfg;
  cfg.matrix = Sz3{16, 16, 1};
  cfg.coils = coils;
  cfg.shots = shots;
  cfg.samples = samples;
  cfg.TR = TR;
  cfg.dwell = 0.01f;
  cfg.maxSimTime = time;
  return cfg;
}

// Every sample of shot s in repetition r holds r + i * s so frames can be told apart
auto Labelled(HeaderConfig const &cfg) -> ShotSource
{
  return [cfg](Index const rep) {
    ShotBlock b;
    b.ks.resize(cfg.coils, cfg.samples, cfg.shots);
    b.traj.resize(cfg.nDims(), cfg.samples, cfg.shots);
    b.traj.setZero();
    for (Index is = 0; is < cfg.shots; is++) {
      b.ks.chip<2>(is).setConstant(Cx(rep, is));
    }
    return b;
  };
}

auto Stream(HeaderConfig const &cfg) -> AcquisitionStream
{
  AcquisitionStream stream;
  Emit(stream, cfg, Labelled(cfg));
  return stream;
}
} // namespace

TEST_CASE("Assembler", "[frame]")
{
  SECTION("Single frame")
  {
    auto const cfg = Config(4, 8, 2, 1000.f, 250.f);
    auto const stream = Stream(cfg);
    REQUIRE(stream.nAcquisitions() == 4);

    NonCartesianAssembler assembler(stream, cfg);
    CHECK(assembler.state() == AssemblyState::AwaitingFirstShot);
    auto const frame = assembler.next();
    REQUIRE(frame);
    CHECK(frame->ks.dimension(0) == 2);
    CHECK(frame->ks.dimension(1) == 8);
    CHECK(frame->ks.dimension(2) == 4);
    CHECK(frame->traj.dimension(0) == 2);
    CHECK(frame->repetition == 0);
    CHECK(frame->ks(1, 7, 3) == Cx(0.f, 3.f));
    CHECK(assembler.state() == AssemblyState::FrameComplete);
    CHECK(assembler.position() == 4);
    CHECK(!assembler.next());
    CHECK(assembler.state() == AssemblyState::Exhausted);
    CHECK(ToString(assembler.state()) == "Exhausted");
    CHECK(!assembler.next());
    CHECK(assembler.frames() == 1);
  }

  SECTION("Frames follow repetitions")
  {
    auto const cfg = Config(3, 4, 1, 1200.f, 100.f);
    auto const stream = Stream(cfg);
    Index      lasts = 0;
    for (auto const &acq : stream.records) {
      if (acq.isSet(Flag::LastInRepetition)) { lasts++; }
    }
    REQUIRE(lasts == 4);

    NonCartesianAssembler assembler(stream, cfg);
    Index                 n = 0;
    while (auto const frame = assembler.next()) {
      CHECK(frame->repetition == n);
      CHECK(frame->ks(0, 0, 2) == Cx(n, 2.f));
      n++;
    }
    CHECK(n == lasts);
    CHECK(assembler.position() == stream.nAcquisitions());
  }

  SECTION("Cartesian")
  {
    HeaderConfig cfg;
    cfg.matrix = Sz3{10, 10, 10};
    cfg.coils = 2;
    cfg.shots = 1;
    cfg.samples = 1;
    cfg.sampling = Sampling::Cartesian;

    Acquisition acq;
    acq.resize(1, 2, 3);
    acq.traj.setConstant(5.f);
    acq.data(0, 0) = Cx(1.f, 2.f);
    acq.data(1, 0) = Cx(3.f, 4.f);
    acq.set(Flag::FirstInRepetition);
    acq.set(Flag::LastInRepetition);
    AcquisitionStream stream;
    stream.appendAcquisition(acq);

    CartesianAssembler3 assembler(stream, cfg);
    auto const          frame = assembler.next();
    REQUIRE(frame);
    CHECK(frame->ks.dimension(0) == 2);
    CHECK(frame->ks.dimension(3) == 10);
    CHECK(frame->mask(5, 5, 5));
    CHECK(Count(frame->mask) == 1);
    CHECK(frame->ks(0, 5, 5, 5) == Cx(1.f, 2.f));
    CHECK(frame->ks(1, 5, 5, 5) == Cx(3.f, 4.f));
    CHECK(frame->ks(0, 4, 5, 5) == Cx(0.f));

    acq.traj(0, 0) = 5.5f;
    stream.records[0] = acq;
    CartesianAssembler3 offGrid(stream, cfg);
    CHECK_THROWS_AS(offGrid.next(), Log::Failure);
    CHECK(offGrid.state() == AssemblyState::Exhausted);
  }

  SECTION("Cartesian 2D")
  {
    HeaderConfig cfg;
    cfg.matrix = Sz3{8, 8, 1};
    cfg.coils = 1;
    cfg.shots = 8;
    cfg.samples = 8;
    cfg.TR = 10.f;
    cfg.maxSimTime = 160.f;
    cfg.sampling = Sampling::Cartesian;

    AcquisitionStream stream;
    Emit(stream, cfg, [&cfg](Index const) {
      ShotBlock b;
      b.ks.resize(cfg.coils, cfg.samples, cfg.shots);
      b.ks.setConstant(Cx(1.f));
      b.traj.resize(2, cfg.samples, cfg.shots);
      for (Index is = 0; is < cfg.shots; is++) {
        for (Index ir = 0; ir < cfg.samples; ir++) {
          b.traj(0, ir, is) = ir;
          b.traj(1, ir, is) = is;
        }
      }
      return b;
    });
    CartesianAssembler2 assembler(stream, cfg);
    Index               n = 0;
    while (auto const frame = assembler.next()) {
      CHECK(Count(frame->mask) == 64);
      n++;
    }
    CHECK(n == 2);
    cfg.matrix = Sz3{8, 8, 8};
    CHECK_THROWS_AS(CartesianAssembler2(stream, cfg), Log::Failure);
  }

  SECTION("Missing first flag")
  {
    auto const cfg = Config(4, 8, 2, 2000.f, 250.f);
    auto       stream = Stream(cfg);
    REQUIRE(stream.nAcquisitions() == 8);
    stream.records[4].clear(Flag::FirstInRepetition);

    NonCartesianAssembler assembler(stream, cfg);
    REQUIRE(assembler.next());
    try {
      assembler.next();
      FAIL("Expected a flag sequence error");
    } catch (FlagSequenceError const &e) {
      CHECK(e.scanCounter() == 4);
    }
    CHECK(assembler.state() == AssemblyState::Exhausted);
    CHECK(!assembler.next());
  }

  SECTION("Nested first flag")
  {
    auto const cfg = Config(4, 8, 2, 1000.f, 250.f);
    auto       stream = Stream(cfg);
    stream.records[2].set(Flag::FirstInRepetition);
    NonCartesianAssembler assembler(stream, cfg);
    try {
      assembler.next();
      FAIL("Expected a flag sequence error");
    } catch (FlagSequenceError const &e) {
      CHECK(e.scanCounter() == 2);
    }
  }

  SECTION("Shot out of order")
  {
    auto const cfg = Config(4, 8, 2, 1000.f, 250.f);
    auto       stream = Stream(cfg);
    std::swap(stream.records[1], stream.records[2]);
    NonCartesianAssembler assembler(stream, cfg);
    CHECK_THROWS_AS(assembler.next(), FlagSequenceError);
  }

  SECTION("Truncated")
  {
    auto const cfg = Config(4, 8, 2, 2000.f, 250.f);
    auto       stream = Stream(cfg);
    stream.records.pop_back();
    NonCartesianAssembler assembler(stream, cfg);
    REQUIRE(assembler.next());
    CHECK_THROWS_AS(assembler.next(), TruncatedStreamError);
    CHECK(assembler.state() == AssemblyState::Exhausted);
  }

  SECTION("Empty")
  {
    auto const        cfg = Config(4, 8, 2, 1000.f, 250.f);
    AcquisitionStream stream;
    NonCartesianAssembler assembler(stream, cfg);
    CHECK(!assembler.next());
    CHECK(assembler.frames() == 0);
  }
}
