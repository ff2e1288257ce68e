/**
 * @file test_laser.cpp
 * @brief PPCL55x driver tests against a scripted instrument
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "common/protocol.hpp"
#include "devices/ppcl_laser.hpp"
#include "fake_transport.hpp"

using namespace ppcl;
using ppcl::test::FakeTransport;
using ppcl::test::parse_request;
using ppcl::test::Request;

namespace
{

std::vector<Request> requests(const FakeTransport& fake)
{
  std::vector<Request> out;
  for (const auto& frame : fake.written())
  {
    out.push_back(parse_request(frame));
  }
  return out;
}

FakeTransport::Responder fail_register(uint8_t reg, Status status)
{
  return [reg, status](const Frame& request, int) -> std::optional<std::vector<uint8_t>> {
    return FakeTransport::reply(request[1], 0, request[1] == reg ? status : Status::NoError);
  };
}

void check_power_cycle(const std::vector<Request>& seen, bool expect_fcf2)
{
  size_t i = 0;
  REQUIRE(seen.size() > i);
  CHECK(seen[i].write);
  CHECK(seen[i].reg == Protocol::Reg::RESENA);
  CHECK(seen[i].payload == Protocol::Resena::DISABLE);
  ++i;

  REQUIRE(seen.size() > i);
  CHECK(seen[i].reg == Protocol::Reg::FCF1);
  CHECK(seen[i].payload == 193);
  ++i;

  if (expect_fcf2)
  {
    REQUIRE(seen.size() > i);
    CHECK(seen[i].reg == Protocol::Reg::FCF2);
    CHECK(seen[i].payload == 4144);
    ++i;
  }

  REQUIRE(seen.size() > i);
  CHECK(seen[i].write);
  CHECK(seen[i].reg == Protocol::Reg::RESENA);
  CHECK(seen[i].payload == Protocol::Resena::SENA);
  ++i;

  REQUIRE(seen.size() == i + Protocol::READY_POLL_COUNT);
  for (; i < seen.size(); ++i)
  {
    CHECK_FALSE(seen[i].write);
    CHECK(seen[i].reg == Protocol::Reg::NOP);
  }
}

}  // namespace

/* ========================================================================= */
/* Connection                                                                */
/* ========================================================================= */

TEST_CASE("Operations need a connection")
{
  FakeTransport fake;
  PpclLaser laser(fake);

  CHECK_FALSE(laser.is_connected());

  auto channel = laser.set_channel(1);
  REQUIRE_FALSE(channel.ok());
  CHECK(channel.error() == Error::NOT_CONNECTED);

  auto power = laser.on();
  REQUIRE_FALSE(power.ok());
  CHECK(power.error() == Error::NOT_CONNECTED);
  CHECK_FALSE(laser.is_on());

  CHECK(fake.written().empty());
}

TEST_CASE("Connect and disconnect")
{
  FakeTransport fake;
  PpclLaser laser(fake);

  REQUIRE(laser.connect("/dev/ttyFAKE", 9600).ok());
  CHECK(laser.is_connected());
  CHECK(laser.link_state().baud_rate == 9600);
  CHECK_FALSE(laser.is_on());

  REQUIRE(laser.on().ok());
  CHECK(laser.is_on());

  auto first = laser.disconnect();
  REQUIRE(first.ok());
  CHECK_FALSE(laser.is_connected());
  CHECK_FALSE(laser.is_on());

  auto second = laser.disconnect();
  REQUIRE(second.ok());
  CHECK(fake.closes() == 1);
}

TEST_CASE("Inverted limits are refused")
{
  FakeTransport fake;
  LaserConfig config;
  config.min_wavelength_nm = 1570.0;
  config.max_wavelength_nm = 1515.0;
  PpclLaser laser(fake, config);

  auto result = laser.connect("/dev/ttyFAKE", 9600);
  REQUIRE_FALSE(result.ok());
  CHECK(result.error() == Error::INVALID_CONFIG);
  CHECK(fake.open_bauds().empty());
}

/* ========================================================================= */
/* Power                                                                     */
/* ========================================================================= */

TEST_CASE("On and off")
{
  FakeTransport fake;
  PpclLaser laser(fake);
  REQUIRE(laser.connect("/dev/ttyFAKE", 9600).ok());
  fake.clear_log();

  SUBCASE("On enables and polls for ready")
  {
    auto result = laser.on();
    REQUIRE(result.ok());
    CHECK(result.value() == Status::NoError);
    CHECK(laser.is_on());

    auto seen = requests(fake);
    REQUIRE(seen.size() == 1 + Protocol::READY_POLL_COUNT);
    CHECK(seen[0].write);
    CHECK(seen[0].reg == Protocol::Reg::RESENA);
    CHECK(seen[0].payload == Protocol::Resena::SENA);
    for (size_t i = 1; i < seen.size(); ++i)
    {
      CHECK_FALSE(seen[i].write);
      CHECK(seen[i].reg == Protocol::Reg::NOP);
    }
  }

  SUBCASE("Off disables")
  {
    REQUIRE(laser.on().ok());
    fake.clear_log();

    auto result = laser.off();
    REQUIRE(result.ok());
    CHECK(result.value() == Status::NoError);
    CHECK_FALSE(laser.is_on());

    auto seen = requests(fake);
    REQUIRE(seen.size() == 1);
    CHECK(seen[0].reg == Protocol::Reg::RESENA);
    CHECK(seen[0].payload == Protocol::Resena::DISABLE);
  }

  SUBCASE("Rejected enable still polls for ready")
  {
    fake.set_responder(fail_register(Protocol::Reg::RESENA, Status::ExecutionError));

    auto result = laser.on();
    REQUIRE(result.ok());
    CHECK(result.value() == Status::ExecutionError);
    CHECK_FALSE(laser.is_on());

    auto seen = requests(fake);
    REQUIRE(seen.size() == 1 + Protocol::READY_POLL_COUNT);
    CHECK(seen[0].reg == Protocol::Reg::RESENA);
    CHECK(seen[0].payload == Protocol::Resena::SENA);
    for (size_t i = 1; i < seen.size(); ++i)
    {
      CHECK(seen[i].reg == Protocol::Reg::NOP);
    }
  }
}

/* ========================================================================= */
/* Wavelength                                                                */
/* ========================================================================= */

TEST_CASE("Wavelength limits")
{
  FakeTransport fake;
  PpclLaser laser(fake);
  REQUIRE(laser.connect("/dev/ttyFAKE", 9600).ok());
  fake.clear_log();

  for (double wl : {1514.99, 1570.01, 0.0, -1550.0, std::nan("")})
  {
    auto result = laser.set_wavelength(wl);
    REQUIRE_FALSE(result.ok());
    CHECK(result.error() == Error::RANGE_ERROR);
  }
  CHECK(fake.written().empty());

  CHECK(laser.set_wavelength(1515.0).ok());
  CHECK(laser.set_wavelength(1570.0).ok());
}

TEST_CASE("Wavelength while off")
{
  FakeTransport fake;
  PpclLaser laser(fake);
  REQUIRE(laser.connect("/dev/ttyFAKE", 9600).ok());
  fake.clear_log();

  SUBCASE("Writes both registers without power cycling")
  {
    auto result = laser.set_wavelength(1550.0);
    REQUIRE(result.ok());
    CHECK(result.value() == Status::NoError);

    auto seen = requests(fake);
    REQUIRE(seen.size() == 2);
    CHECK(seen[0].reg == Protocol::Reg::FCF1);
    CHECK(seen[0].payload == 193);
    CHECK(seen[1].reg == Protocol::Reg::FCF2);
    CHECK(seen[1].payload == 4144);
    CHECK_FALSE(laser.is_on());
  }

  SUBCASE("Rejected Fcf1 stops before Fcf2")
  {
    fake.set_responder(fail_register(Protocol::Reg::FCF1, Status::ExecutionError));

    auto result = laser.set_wavelength(1550.0);
    REQUIRE(result.ok());
    CHECK(result.value() == Status::ExecutionError);
    CHECK(fake.written().size() == 1);
  }
}

TEST_CASE("Wavelength while on")
{
  FakeTransport fake;
  PpclLaser laser(fake);
  REQUIRE(laser.connect("/dev/ttyFAKE", 9600).ok());
  REQUIRE(laser.on().ok());
  fake.clear_log();

  SUBCASE("Power is cycled around the frequency writes")
  {
    auto result = laser.set_wavelength(1550.0);
    REQUIRE(result.ok());
    CHECK(result.value() == Status::NoError);
    CHECK(laser.is_on());
    check_power_cycle(requests(fake), true);
  }

  SUBCASE("Rejected Fcf2 still restores power")
  {
    fake.set_responder(fail_register(Protocol::Reg::FCF2, Status::ExecutionError));

    auto result = laser.set_wavelength(1550.0);
    REQUIRE(result.ok());
    CHECK(result.value() == Status::ExecutionError);
    CHECK(laser.is_on());
    check_power_cycle(requests(fake), true);
  }

  SUBCASE("Fcf2 timeout still restores power")
  {
    laser.set_timeout_ms(30);
    fake.set_responder([](const Frame& request, int) -> std::optional<std::vector<uint8_t>> {
      if (request[1] == Protocol::Reg::FCF2)
      {
        return std::nullopt;
      }
      return FakeTransport::reply(request[1], 0);
    });

    auto result = laser.set_wavelength(1550.0);
    REQUIRE_FALSE(result.ok());
    CHECK(result.error() == Error::TIMEOUT);
    CHECK(laser.is_on());
    check_power_cycle(requests(fake), true);
  }

  SUBCASE("Rejected disable still writes the frequency")
  {
    fake.set_responder([](const Frame& request, int) -> std::optional<std::vector<uint8_t>> {
      const Request req = parse_request(request);
      const bool disable = req.write && req.reg == Protocol::Reg::RESENA && req.payload == Protocol::Resena::DISABLE;
      return FakeTransport::reply(request[1], 0, disable ? Status::ExecutionError : Status::NoError);
    });

    auto result = laser.set_wavelength(1550.0);
    REQUIRE(result.ok());
    CHECK(result.value() == Status::NoError);
    CHECK(laser.is_on());
    check_power_cycle(requests(fake), true);
  }

  SUBCASE("Rejected Fcf1 skips Fcf2 and restores power")
  {
    fake.set_responder(fail_register(Protocol::Reg::FCF1, Status::CommandProcessingError));

    auto result = laser.set_wavelength(1550.0);
    REQUIRE(result.ok());
    CHECK(result.value() == Status::CommandProcessingError);
    CHECK(laser.is_on());
    check_power_cycle(requests(fake), false);
  }
}

/* ========================================================================= */
/* Power level, channel, mode                                                */
/* ========================================================================= */

TEST_CASE("Power level")
{
  FakeTransport fake;
  PpclLaser laser(fake);
  REQUIRE(laser.connect("/dev/ttyFAKE", 9600).ok());
  fake.clear_log();

  SUBCASE("Scaled to hundredths of a dBm")
  {
    REQUIRE(laser.set_power(10.0).ok());
    REQUIRE(laser.set_power(7.01).ok());
    REQUIRE(laser.set_power(13.5).ok());

    auto seen = requests(fake);
    REQUIRE(seen.size() == 3);
    CHECK(seen[0].reg == Protocol::Reg::POWER);
    CHECK(seen[0].payload == 1000);
    CHECK(seen[1].payload == 701);
    CHECK(seen[2].payload == 1350);
  }

  SUBCASE("Outside the configured limits")
  {
    for (double dbm : {5.99, 13.51, std::nan("")})
    {
      auto result = laser.set_power(dbm);
      REQUIRE_FALSE(result.ok());
      CHECK(result.error() == Error::RANGE_ERROR);
    }
    CHECK(fake.written().empty());
  }

  SUBCASE("Negative levels are two's complement")
  {
    FakeTransport wide_fake;
    LaserConfig config;
    config.min_power_dbm = -10.0;
    PpclLaser wide(wide_fake, config);
    REQUIRE(wide.connect("/dev/ttyFAKE", 9600).ok());
    wide_fake.clear_log();

    REQUIRE(wide.set_power(-1.5).ok());
    auto seen = requests(wide_fake);
    REQUIRE(seen.size() == 1);
    CHECK(seen[0].payload == 0xFF6A);
  }
}

TEST_CASE("Channel and mode")
{
  FakeTransport fake;
  PpclLaser laser(fake);
  REQUIRE(laser.connect("/dev/ttyFAKE", 9600).ok());
  fake.clear_log();

  REQUIRE(laser.set_channel().ok());
  REQUIRE(laser.set_mode(Protocol::Mode::CLEAN).ok());

  // Unknown modes go to the instrument as-is.
  fake.set_responder(fail_register(Protocol::Reg::MODE, Status::ExecutionError));
  auto unknown = laser.set_mode(7);
  REQUIRE(unknown.ok());
  CHECK(unknown.value() == Status::ExecutionError);

  auto seen = requests(fake);
  REQUIRE(seen.size() == 3);
  CHECK(seen[0].reg == Protocol::Reg::CHANNEL);
  CHECK(seen[0].payload == 1);
  CHECK(seen[1].reg == Protocol::Reg::MODE);
  CHECK(seen[1].payload == 2);
  CHECK(seen[2].reg == Protocol::Reg::MODE);
  CHECK(seen[2].payload == 7);
}

/* ========================================================================= */
/* Responses                                                                 */
/* ========================================================================= */

TEST_CASE("Register read-back")
{
  FakeTransport fake;
  PpclLaser laser(fake);
  REQUIRE(laser.connect("/dev/ttyFAKE", 9600).ok());

  fake.set_responder([](const Frame& request, int) -> std::optional<std::vector<uint8_t>> {
    return FakeTransport::reply(request[1], request[1] == Protocol::Reg::POWER ? 1234 : 0);
  });

  auto power = laser.read_register(Protocol::Reg::POWER);
  REQUIRE(power.ok());
  CHECK(power.value().status == Status::NoError);
  CHECK(power.value().payload == 1234);

  auto seen = requests(fake);
  REQUIRE_FALSE(seen.empty());
  CHECK_FALSE(seen.back().write);
  CHECK(seen.back().reg == Protocol::Reg::POWER);
}

TEST_CASE("Extended addressing reply")
{
  FakeTransport fake;
  PpclLaser laser(fake);
  REQUIRE(laser.connect("/dev/ttyFAKE", 9600).ok());

  fake.set_responder(fail_register(Protocol::Reg::MFGR, Status::ExtendedAddressing));

  auto result = laser.read_register(Protocol::Reg::MFGR);
  REQUIRE_FALSE(result.ok());
  CHECK(result.error() == Error::EXTENDED_ADDRESSING_UNSUPPORTED);
}

TEST_CASE("Failed transaction does not block the next one")
{
  FakeTransport fake;
  PpclLaser laser(fake);
  REQUIRE(laser.connect("/dev/ttyFAKE", 9600).ok());
  laser.set_timeout_ms(30);

  fake.set_responder(FakeTransport::silent_responder());
  auto lost = laser.set_channel(1);
  REQUIRE_FALSE(lost.ok());
  CHECK(lost.error() == Error::TIMEOUT);

  fake.set_responder([](const Frame& request, int) -> std::optional<std::vector<uint8_t>> {
    auto bytes = FakeTransport::reply(request[1], 0);
    bytes[2] ^= 0x40;
    return bytes;
  });
  auto corrupted = laser.set_channel(1);
  REQUIRE_FALSE(corrupted.ok());
  CHECK(corrupted.error() == Error::CHECKSUM_MISMATCH);

  fake.set_responder(FakeTransport::echo_responder());
  auto recovered = laser.set_channel(1);
  REQUIRE(recovered.ok());
  CHECK(recovered.value() == Status::NoError);
}

/* ========================================================================= */
/* Concurrency                                                               */
/* ========================================================================= */

TEST_CASE("Concurrent callers share the link")
{
  constexpr int N = 16;

  FakeTransport fake;
  PpclLaser laser(fake);
  REQUIRE(laser.connect("/dev/ttyFAKE", 9600).ok());
  fake.clear_log();

  std::vector<Result<Status>> results(N, Result<Status>::failure(Error::NOT_CONNECTED));
  std::vector<std::thread> threads;
  for (int i = 0; i < N; ++i)
  {
    threads.emplace_back([&laser, &results, i] {
      results[i] = laser.set_channel(static_cast<uint16_t>(i + 1));
    });
  }
  for (auto& t : threads)
  {
    t.join();
  }

  for (const auto& result : results)
  {
    REQUIRE(result.ok());
    CHECK(result.value() == Status::NoError);
  }

  auto frames = fake.written();
  REQUIRE(frames.size() == N);
  std::set<uint16_t> channels;
  for (const auto& frame : frames)
  {
    REQUIRE(ItlaFrame::decode(frame).ok());
    const Request req = parse_request(frame);
    CHECK(req.reg == Protocol::Reg::CHANNEL);
    channels.insert(req.payload);
  }
  CHECK(channels.size() == N);
  CHECK(*channels.begin() == 1);
  CHECK(*channels.rbegin() == N);
  CHECK(fake.overlaps() == 0);
  CHECK(fake.malformed_writes() == 0);
}

TEST_CASE("Wavelength changes from several threads serialize without overlap")
{
  FakeTransport fake;
  PpclLaser laser(fake);
  REQUIRE(laser.connect("/dev/ttyFAKE", 9600).ok());
  fake.clear_log();

  const double wavelengths[] = {1530.0, 1540.0, 1550.0, 1560.0};
  std::vector<std::thread> threads;
  for (double wl : wavelengths)
  {
    threads.emplace_back([&laser, wl] {
      auto result = laser.set_wavelength(wl);
      CHECK(result.ok());
    });
  }
  for (auto& t : threads)
  {
    t.join();
  }

  // Pairs from different callers may interleave; every frame still lands whole.
  std::multiset<uint16_t> expected_thz, expected_tenths, seen_thz, seen_tenths;
  for (double wl : wavelengths)
  {
    const auto regs = units::wavelength_to_frequency_registers(wl);
    expected_thz.insert(regs.thz);
    expected_tenths.insert(regs.ghz_tenths);
  }
  for (const auto& frame : fake.written())
  {
    REQUIRE(ItlaFrame::decode(frame).ok());
    const Request req = parse_request(frame);
    CHECK(req.write);
    if (req.reg == Protocol::Reg::FCF1)
    {
      seen_thz.insert(req.payload);
    }
    else
    {
      CHECK(req.reg == Protocol::Reg::FCF2);
      seen_tenths.insert(req.payload);
    }
  }

  CHECK(fake.written().size() == 8);
  CHECK(seen_thz == expected_thz);
  CHECK(seen_tenths == expected_tenths);
  CHECK(fake.overlaps() == 0);
  CHECK(fake.malformed_writes() == 0);
}

TEST_CASE("Log callback can be swapped while commands run")
{
  FakeTransport fake;
  PpclLaser laser(fake);
  REQUIRE(laser.connect("/dev/ttyFAKE", 9600).ok());
  fake.clear_log();

  std::atomic<int> first_lines{0};
  std::atomic<int> second_lines{0};
  laser.set_log_callback([&first_lines](const std::string&) { ++first_lines; });

  std::thread worker([&laser] {
    for (int i = 0; i < 200; ++i)
    {
      auto result = laser.set_power(99.0);
      CHECK_FALSE(result.ok());
    }
  });
  for (int i = 0; i < 100; ++i)
  {
    if (i % 2 == 0)
    {
      laser.set_log_callback([&second_lines](const std::string&) { ++second_lines; });
    }
    else
    {
      laser.set_log_callback([&first_lines](const std::string&) { ++first_lines; });
    }
  }
  worker.join();

  const int before = second_lines.load();
  laser.set_log_callback([&second_lines](const std::string&) { ++second_lines; });
  CHECK_FALSE(laser.set_power(99.0).ok());
  CHECK(second_lines.load() == before + 1);
  CHECK(first_lines.load() + second_lines.load() == 201);
  CHECK(fake.written().empty());

  laser.set_log_callback(nullptr);
}
