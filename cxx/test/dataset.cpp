#include "sn/io/dataset.hpp"
#include "sn/mrd/errors.hpp"
#include "sn/tensors.hpp"

#include <filesystem>
#include <fstream>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace sn;
using namespace Catch;

namespace {
auto Record(uint32_t const scan, Index const samples, Index const channels) -> Acquisition
{
  Acquisition acq;
  acq.resize(samples, channels, 2);
  acq.head.scan_counter = scan;
  acq.head.kspace_encode_step_1 = scan % 4;
  acq.head.sample_time_us = 10.f;
  for (Index is = 0; is < samples; is++) {
    acq.traj(0, is) = is;
    acq.traj(1, is) = -float(scan);
    for (Index ic = 0; ic < channels; ic++) {
      acq.data(ic, is) = Cx(scan + is, -ic);
    }
  }
  if (scan == 0) { acq.set(Flag::FirstInRepetition); }
  return acq;
}
} // namespace

TEST_CASE("Dataset", "[io]")
{
  std::filesystem::path const fname("test-dataset.h5");
  std::filesystem::remove_all(fname);

  SECTION("Records and waveforms")
  {
    {
      Dataset ds(fname, Dataset::Mode::Create);
      ds.writeHeader("<ismrmrdHeader/>");
      CHECK_THROWS_AS(ds.writeHeader("<ismrmrdHeader/>"), ContainerWriteError);
      for (uint32_t ii = 0; ii < 5; ii++) {
        ds.appendAcquisition(Record(ii, 16, 3));
      }
      Waveform w;
      w.resize(10, 2);
      w.head.waveform_id = 3;
      w.head.scan_counter = 2;
      w.data.setConstant(1.5f);
      ds.appendWaveform(w);
      CHECK(ds.nAcquisitions() == 5);
      CHECK(ds.nWaveforms() == 1);
    }
    REQUIRE(std::filesystem::exists(fname));

    Dataset ds(fname, Dataset::Mode::Read);
    CHECK(ds.readHeader() == "<ismrmrdHeader/>");
    REQUIRE(ds.nAcquisitions() == 5);
    auto const ref = Record(3, 16, 3);
    auto const acq = ds.readAcquisition(3);
    CHECK(acq.head.scan_counter == 3);
    CHECK(acq.head.kspace_encode_step_1 == 3);
    CHECK(acq.head.sample_time_us == Approx(10.f));
    CHECK(acq.samples() == 16);
    CHECK(acq.channels() == 3);
    CHECK(Norm(acq.data - ref.data) == Approx(0.f).margin(1.e-6));
    CHECK(Sum(acq.traj - ref.traj) == Approx(0.f).margin(1.e-6));
    CHECK(ds.readAcquisition(0).isSet(Flag::FirstInRepetition));
    CHECK_THROWS_AS(ds.readAcquisition(5), Log::Failure);

    REQUIRE(ds.nWaveforms() == 1);
    auto const w = ds.readWaveform(0);
    CHECK(w.head.waveform_id == 3);
    CHECK(w.head.scan_counter == 2);
    CHECK(w.data.dimension(0) == 2);
    CHECK(w.data.dimension(1) == 10);
    CHECK(Sum(w.data) == Approx(30.f));
    CHECK_THROWS_AS(ds.readWaveform(1), LookupError);

    CHECK_THROWS_AS(ds.appendAcquisition(acq), ContainerWriteError);
  }

  SECTION("Images")
  {
    Cx4 maps(2, 4, 4, 1);
    maps.setConstant(Cx(0.5f, 0.5f));
    {
      Dataset ds(fname, Dataset::Mode::Create);
      ds.writeHeader("<ismrmrdHeader/>");
      ds.writeImage("smaps", maps, HD5::Dims::SENSE);
    }
    Dataset ds(fname, Dataset::Mode::Read);
    CHECK(ds.images() == std::vector<std::string>{"smaps"});
    auto const check = ds.readImage<4>("smaps");
    REQUIRE(check);
    CHECK(check->dimension(0) == 2);
    CHECK(Norm(*check - maps) == Approx(0.f).margin(1.e-6));
    CHECK(!ds.readImage<2>("coil_cov"));
    CHECK(ds.nWaveforms() == 0);
  }

  SECTION("Create replaces")
  {
    {
      Dataset ds(fname, Dataset::Mode::Create);
      ds.writeHeader("<first/>");
      ds.appendAcquisition(Record(0, 4, 1));
    }
    {
      Dataset ds(fname, Dataset::Mode::Create);
      ds.writeHeader("<second/>");
    }
    Dataset ds(fname, Dataset::Mode::Read);
    CHECK(ds.readHeader() == "<second/>");
    CHECK(ds.nAcquisitions() == 0);
  }

  SECTION("Not found")
  {
    CHECK_THROWS_AS(Dataset("does-not-exist.h5", Dataset::Mode::Read), ContainerNotFoundError);
    {
      std::ofstream f(fname);
      f << "not hdf5";
    }
    CHECK_THROWS_AS(Dataset(fname, Dataset::Mode::Read), ContainerNotFoundError);
  }

  SECTION("Close")
  {
    Dataset ds(fname, Dataset::Mode::Create);
    CHECK(ds.isOpen());
    ds.close();
    CHECK(!ds.isOpen());
    CHECK_NOTHROW(ds.close());
    CHECK_THROWS_AS(ds.nAcquisitions(), Log::Failure);
  }

  SECTION("Close all")
  {
    Dataset a(fname, Dataset::Mode::Create);
    Dataset b("test-dataset-b.h5", Dataset::Mode::Create);
    Dataset::CloseAll();
    CHECK(!a.isOpen());
    CHECK(!b.isOpen());
    CHECK_NOTHROW(a.close());
    CHECK_THROWS_AS(b.nAcquisitions(), Log::Failure);
    std::filesystem::remove("test-dataset-b.h5");
  }

  SECTION("Replace fails")
  {
    // A non-empty directory cannot be removed as a file, even with elevated permissions
    std::filesystem::create_directory(fname);
    {
      std::ofstream f(fname / "keep");
      f << "keep";
    }
    CHECK_THROWS_AS(Dataset(fname, Dataset::Mode::Create), ContainerWriteError);
    CHECK(std::filesystem::exists(fname / "keep"));
  }

  std::filesystem::remove_all(fname);
}
