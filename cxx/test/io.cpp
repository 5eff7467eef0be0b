#include "sn/io/reader.hpp"
#include "sn/io/writer.hpp"
#include "sn/log/log.hpp"
#include "sn/tensors.hpp"

#include <filesystem>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace sn;
using namespace Catch;

TEST_CASE("IO", "[io]")
{
  Index const nC = 2, nS = 16, nT = 4, nF = 3;
  Cx5         ks(nC, nS, nT, 1, nF);
  ks.setConstant(Cx(1.f, -1.f));
  Re4 traj(2, nS, nT, nF);
  traj.setConstant(0.25f);

  SECTION("Frames file")
  {
    std::filesystem::path const fname("test-io.h5");
    { // Use destructor to ensure it is written
      HD5::Writer writer("test-io.tmp");
      CHECK_NOTHROW(writer.writeString(HD5::Keys::Header, "<ismrmrdHeader/>"));
      CHECK_NOTHROW(writer.writeTensor(HD5::Keys::Data, ToArray(ks.dimensions()), ks.data(), HD5::Dims::Noncartesian));
      CHECK_NOTHROW(writer.writeTensor(HD5::Keys::Trajectory, ToArray(traj.dimensions()), traj.data(), HD5::Dims::Trajectory));
      CHECK(writer.exists(HD5::Keys::Data));
    }
    REQUIRE(std::filesystem::exists(fname));

    HD5::Reader reader(fname);
    CHECK(reader.exists(HD5::Keys::Trajectory));
    CHECK(reader.list() == std::vector<std::string>{HD5::Keys::Data, HD5::Keys::Trajectory, HD5::Keys::Header});
    CHECK(reader.readString(HD5::Keys::Header) == "<ismrmrdHeader/>");
    CHECK(reader.order(HD5::Keys::Data) == 5);
    CHECK(reader.dimensions(HD5::Keys::Data) == std::vector<Index>{nC, nS, nT, 1, nF});
    CHECK(reader.readDNames<5>(HD5::Keys::Data) == HD5::Dims::Noncartesian);

    auto const checkKs = reader.readTensor<Cx5>(HD5::Keys::Data);
    CHECK(Norm(checkKs - ks) == Approx(0.f).margin(1.e-9));
    auto const checkTraj = reader.readTensor<Re4>(HD5::Keys::Trajectory);
    CHECK(Sum(checkTraj) == Approx(0.25f * traj.size()));
    CHECK_THROWS_AS(reader.readTensor<Cx4>(HD5::Keys::Data), Log::Failure);
    CHECK_THROWS_AS(reader.readDNames<4>(HD5::Keys::Data), Log::Failure);
    std::filesystem::remove(fname);
  }

  SECTION("Zero dimension")
  {
    HD5::Writer writer("test-zero.h5");
    Cx5 const   empty(nC, 0, nT, 1, nF);
    CHECK_THROWS_AS(writer.writeTensor(HD5::Keys::Data, ToArray(empty.dimensions()), empty.data(), HD5::Dims::Noncartesian),
                    Log::Failure);
    std::filesystem::remove("test-zero.h5");
  }

  SECTION("Missing")
  {
    CHECK_THROWS_AS(HD5::Reader("no-such-file.h5"), Log::Failure);
  }
}
