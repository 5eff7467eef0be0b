#include "sn/mrd/emitter.hpp"
#include "sn/mrd/errors.hpp"
#include "sn/mrd/loader.hpp"
#include "sn/sampler.hpp"
#include "sn/tensors.hpp"

#include <filesystem>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace sn;
using namespace Catch;

TEST_CASE("Round trip", "[roundtrip]")
{
  std::filesystem::path const fname("test-roundtrip.h5");

  HeaderConfig cfg;
  cfg.matrix = Sz3{8, 8, 1};
  cfg.fov = Eigen::Array3f(240.f, 240.f, 3.f);
  cfg.coils = 3;
  cfg.shots = 4;
  cfg.samples = 16;
  cfg.TR = 20.f;
  cfg.TE = 10.f;
  cfg.FA = 10.f;
  cfg.gmax = 40.f;
  cfg.smax = 150.f;
  cfg.dwell = 0.004f;
  cfg.maxSimTime = 250.f;
  cfg.seed = 11;

  SECTION("Non-Cartesian with sideband")
  {
    auto const traj = SpiralShots(cfg);
    Sideband   extra;
    extra.catalog[5] = WaveformType{.name = "resp", .parameters = {{"rate", 0.25}}};
    Waveform w;
    w.resize(3, 1);
    w.head.waveform_id = 5;
    w.data.setConstant(2.f);
    extra.waveforms.push_back(w);
    Cx4 maps(cfg.coils, 8, 8, 1);
    maps.setConstant(Cx(1.f));
    extra.smaps = maps;

    auto const summary = EmitFile(fname, cfg, Sampler(cfg, traj), extra);
    CHECK(summary.repetitions == 3);
    CHECK(!summary.exact);

    AcquisitionStream ref;
    Emit(ref, cfg, Sampler(cfg, traj));

    Loader loader(fname);
    CHECK(loader.config() == cfg);
    CHECK(loader.nFrames() == 3);
    CHECK(loader.nAcquisitions() == 12);
    CHECK(loader.nWaveforms() == 1);
    CHECK(Same(loader.catalog(), extra.catalog));

    auto  assembler = loader.noncartesian();
    Index n = 0;
    while (auto const frame = assembler.next()) {
      for (Index is = 0; is < cfg.shots; is++) {
        auto const &acq = ref.records[n * cfg.shots + is];
        Cx2 const   shot = frame->ks.chip<2>(is);
        Re2 const   kt = frame->traj.chip<2>(is);
        CHECK(Norm(shot - acq.data) == Approx(0.f).margin(1.e-6));
        CHECK(Sum((kt - acq.traj).abs()) == Approx(0.f).margin(1.e-6));
      }
      n++;
    }
    CHECK(n == loader.nFrames());

    auto const smaps = loader.smaps();
    REQUIRE(smaps);
    CHECK(Norm(*smaps - maps) == Approx(0.f).margin(1.e-6));
    CHECK(!loader.coilCovariance());

    auto const dyn = loader.allDynamic();
    REQUIRE(dyn.size() == 1);
    CHECK(dyn[0].name == "resp");
    CHECK(std::get<double>(dyn[0].parameters.at("rate")) == Approx(0.25));
    CHECK(Sum(dyn[0].data) == Approx(6.f));
    CHECK(loader.dynamic(0).head.waveform_id == 5);
    CHECK_THROWS_AS(loader.dynamic(1), LookupError);
  }

  SECTION("Cartesian")
  {
    cfg.sampling = Sampling::Cartesian;
    cfg.samples = 8;
    cfg.shots = 8;
    cfg.maxSimTime = 480.f;
    auto const traj = Trajectory(cfg);
    EmitFile(fname, cfg, Sampler(cfg, traj));

    Loader loader(fname);
    CHECK(loader.config().sampling == Sampling::Cartesian);
    CHECK(loader.nFrames() == 3);
    CHECK(loader.catalog().empty());
    CHECK(loader.allDynamic().empty());
    CHECK(loader.images().empty());

    auto  assembler = loader.cartesian<2>();
    Index n = 0;
    while (auto const frame = assembler.next()) {
      CHECK(Count(frame->mask) == 64);
      CHECK(Norm(frame->ks) > 0.f);
      n++;
    }
    CHECK(n == 3);
  }

  SECTION("Overwrite")
  {
    auto const traj = SpiralShots(cfg);
    EmitFile(fname, cfg, Sampler(cfg, traj));
    auto shorter = cfg;
    shorter.maxSimTime = 80.f;
    EmitFile(fname, shorter, Sampler(shorter, traj));
    Loader loader(fname);
    CHECK(loader.nAcquisitions() == 4);
    CHECK(loader.config().maxSimTime == Approx(80.f));
    loader.close();
    CHECK_THROWS_AS(loader.nAcquisitions(), Log::Failure);
  }

  SECTION("Missing")
  {
    CHECK_THROWS_AS(Loader("no-such-container.h5"), ContainerNotFoundError);
  }

  std::filesystem::remove(fname);
}
