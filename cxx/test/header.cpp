#include "sn/mrd/errors.hpp"
#include "sn/mrd/header.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace sn;
using namespace Catch;

namespace {
auto Config() -> HeaderConfig
{
  HeaderConfig cfg;
  cfg.matrix = Sz3{64, 48, 1};
  cfg.fov = Eigen::Array3f(192.f, 144.f, 3.f);
  cfg.coils = 8;
  cfg.shots = 16;
  cfg.samples = 512;
  cfg.field = 7.f;
  cfg.TR = 50.f;
  cfg.TE = 25.f;
  cfg.FA = 12.f;
  cfg.gmax = 40.f;
  cfg.smax = 180.f;
  cfg.dwell = 0.005f;
  cfg.maxSimTime = 3200.f;
  cfg.seed = 42;
  return cfg;
}

std::string const Minimal = R"(<?xml version="1.0"?>
<ismrmrdHeader xmlns="http://www.ismrm.org/ISMRMRD">
  <acquisitionSystemInformation><receiverChannels>4</receiverChannels></acquisitionSystemInformation>
  <encoding>
    <encodedSpace><matrixSize><x>32</x><y>32</y></matrixSize></encodedSpace>
    <encodingLimits>
      <kspace_encoding_step_0><maximum>128</maximum></kspace_encoding_step_0>
      <kspace_encoding_step_1><maximum>8</maximum></kspace_encoding_step_1>
    </encodingLimits>
    <trajectory>cartesian</trajectory>
  </encoding>
  <sequenceParameters><TR>100</TR><TE>30</TE><flipAngle_deg>90</flipAngle_deg></sequenceParameters>
  <userParameters>
    <userParameterDouble><name>gmax</name><value>40</value></userParameterDouble>
    <userParameterDouble><name>smax</name><value>200</value></userParameterDouble>
    <userParameterDouble><name>dwell_time_ms</name><value>0.01</value></userParameterDouble>
    <userParameterDouble><name>max_sim_time</name><value>1600</value></userParameterDouble>
    <userParameterDouble><name>rng_seed</name><value>7</value></userParameterDouble>
  </userParameters>
</ismrmrdHeader>)";
} // namespace

TEST_CASE("Header", "[header]")
{
  SECTION("Round trip")
  {
    auto const cfg = Config();
    auto const xml = SerializeHeader(cfg);
    CHECK(xml.find("ismrmrdHeader") != std::string::npos);
    auto const check = ParseHeader(xml);
    CHECK(check == cfg);
    CHECK(check.nDims() == 2);
  }

  SECTION("Round trip Cartesian 3D")
  {
    auto cfg = Config();
    cfg.matrix = Sz3{16, 16, 16};
    cfg.sampling = Sampling::Cartesian;
    auto const check = ParseHeader(SerializeHeader(cfg));
    CHECK(check.sampling == Sampling::Cartesian);
    CHECK(check.nDims() == 3);
    CHECK(check == cfg);
  }

  SECTION("Defaults and aliases")
  {
    auto const cfg = ParseHeader(Minimal);
    CHECK(cfg.coils == 4);
    CHECK(cfg.matrix[2] == 1);
    CHECK(cfg.fov[0] == Approx(32.f));
    CHECK(cfg.samples == 128);
    CHECK(cfg.shots == 8);
    CHECK(cfg.field == Approx(3.f));
    CHECK(cfg.sampling == Sampling::Cartesian);
    CHECK(cfg.maxSimTime == Approx(1600.f));
    CHECK(cfg.seed == 7);
  }

  SECTION("Missing field")
  {
    auto xml = Minimal;
    auto const start = xml.find("<sequenceParameters>");
    auto const end = xml.find("</sequenceParameters>") + std::string("</sequenceParameters>").size();
    xml.erase(start, end - start);
    CHECK_THROWS_AS(ParseHeader(xml), MalformedHeaderError);
  }

  SECTION("Missing user parameter")
  {
    auto xml = Minimal;
    auto const start = xml.find("<userParameterDouble><name>smax");
    xml.erase(start, xml.find("</userParameterDouble>", start) + 22 - start);
    CHECK_THROWS_AS(ParseHeader(xml), MalformedHeaderError);
  }

  SECTION("Bad number")
  {
    auto xml = Minimal;
    xml.replace(xml.find("<TR>100</TR>"), 12, "<TR>fast</TR>");
    CHECK_THROWS_AS(ParseHeader(xml), MalformedHeaderError);
  }

  SECTION("Not XML")
  {
    CHECK_THROWS_AS(ParseHeader("this is not a header"), MalformedHeaderError);
    CHECK_THROWS_AS(ParseHeader("<somethingElse/>"), MalformedHeaderError);
  }

  SECTION("Zero TR")
  {
    auto xml = Minimal;
    xml.replace(xml.find("<TR>100</TR>"), 12, "<TR>0</TR>");
    CHECK_THROWS_AS(ParseHeader(xml), MalformedHeaderError);
  }

  SECTION("Zero coils")
  {
    auto xml = Minimal;
    xml.replace(xml.find("<receiverChannels>4"), 19, "<receiverChannels>0");
    CHECK_THROWS_AS(ParseHeader(xml), MalformedHeaderError);
  }
}
