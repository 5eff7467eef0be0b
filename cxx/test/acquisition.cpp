#include "sn/mrd/acquisition.hpp"
#include "sn/mrd/stream.hpp"
#include "sn/log/log.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace sn;

TEST_CASE("Flags", "[acq]")
{
  CHECK(Bit(Flag::FirstInEncodeStep1) == 1);
  CHECK(Bit(Flag::LastInEncodeStep1) == 2);
  CHECK(Bit(Flag::FirstInRepetition) == 1 << 12);
  CHECK(Bit(Flag::LastInRepetition) == 1 << 13);
  CHECK(Bit(Flag::LastInMeasurement) == 1 << 24);

  Acquisition acq;
  acq.set(Flag::FirstInRepetition);
  acq.set(Flag::FirstInMeasurement);
  CHECK(acq.isSet(Flag::FirstInRepetition));
  CHECK(!acq.isSet(Flag::LastInRepetition));
  CHECK(OpensRepetition(acq.head.flags));
  CHECK(!ClosesRepetition(acq.head.flags));
  CHECK(acq.flagNames() == std::vector<std::string>{"FIRST_IN_REPETITION", "FIRST_IN_MEASUREMENT"});

  acq.clear(Flag::FirstInRepetition);
  CHECK(OpensRepetition(acq.head.flags)); // First in measurement also opens
  acq.clear(Flag::FirstInMeasurement);
  CHECK(acq.head.flags == 0);

  acq.set(Flag::LastInMeasurement);
  CHECK(ClosesRepetition(acq.head.flags));
}

TEST_CASE("Acquisition", "[acq]")
{
  SECTION("Resize")
  {
    Acquisition acq;
    acq.resize(64, 4, 3);
    CHECK(acq.samples() == 64);
    CHECK(acq.channels() == 4);
    CHECK(acq.traj.dimension(0) == 3);
    CHECK(acq.head.number_of_samples == 64);
    CHECK(acq.head.active_channels == 4);
    CHECK(acq.head.trajectory_dimensions == 3);
    CHECK(acq.data(3, 63) == Cx(0.f));
    CHECK_THROWS_AS(acq.resize(70000, 1, 2), Log::Failure);
  }

  SECTION("Stream")
  {
    AcquisitionStream stream;
    Acquisition       acq;
    acq.resize(8, 1, 2);
    for (uint32_t ii = 0; ii < 3; ii++) {
      acq.head.scan_counter = ii;
      stream.appendAcquisition(acq);
    }
    CHECK(stream.nAcquisitions() == 3);
    CHECK(stream.readAcquisition(2).head.scan_counter == 2);
    CHECK_THROWS_AS(stream.readAcquisition(3), Log::Failure);
    CHECK_THROWS_AS(stream.readAcquisition(-1), Log::Failure);
  }
}
