#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include "luci_servo_cpp/byte_utils.hpp"
#include "luci_servo_cpp/serial_log_reader.hpp"

using namespace luci_servo_cpp;

namespace
{

std::vector<uint8_t> bytes(const std::string & s)
{
  return std::vector<uint8_t>(s.begin(), s.end());
}

}  // namespace

TEST(LineAssembler, SplitsOnNewlineAndStripsCarriageReturn)
{
  LineAssembler a;
  const auto lines = a.push(bytes("boot ok\r\nservo 1 ready\r\n"));
  const std::vector<std::string> expected{"boot ok", "servo 1 ready"};
  EXPECT_EQ(lines, expected);
}

TEST(LineAssembler, KeepsPartialLineAcrossChunks)
{
  LineAssembler a;
  EXPECT_TRUE(a.push(bytes("uart0 ba")).empty());
  EXPECT_TRUE(a.push(bytes("ud=57142")).empty());
  const auto lines = a.push(bytes("\n"));
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "uart0 baud=57142");
}

TEST(LineAssembler, SkipsEmptyAndWhitespaceLines)
{
  LineAssembler a;
  const auto lines = a.push(bytes("\n\r\n   \r\n  x  \n"));
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "x");
}

TEST(LineAssembler, DropsUndecodableBytes)
{
  LineAssembler a;
  std::vector<uint8_t> raw{'o', 'k', 0xFF, 0xC3, 0xA9, 0x80, '!', '\n'};
  const auto lines = a.push(raw);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "ok\xC3\xA9!");
}

TEST(LineAssembler, FlushEmitsPendingFragment)
{
  LineAssembler a;
  EXPECT_TRUE(a.push(bytes("no newline")).empty());
  const auto lines = a.flush();
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "no newline");
  EXPECT_TRUE(a.flush().empty());
}

TEST(LineAssembler, SplitsOverlongLines)
{
  LineAssembler a(8);
  const auto lines = a.push(bytes("0123456789abcdef"));
  const std::vector<std::string> expected{"01234567", "89abcdef"};
  EXPECT_EQ(lines, expected);
}

TEST(Utf8Sanitize, RejectsOverlongAndSurrogates)
{
  const std::vector<uint8_t> overlong{0xC0, 0xAF, 'a'};
  EXPECT_EQ(utf8_sanitize(overlong), "a");
  const std::vector<uint8_t> surrogate{0xED, 0xA0, 0x80, 'b'};
  EXPECT_EQ(utf8_sanitize(surrogate), "b");
  const std::vector<uint8_t> truncated{'c', 0xE2, 0x82};
  EXPECT_EQ(utf8_sanitize(truncated), "c");
  const std::vector<uint8_t> euro{0xE2, 0x82, 0xAC};
  EXPECT_EQ(utf8_sanitize(euro), "\xE2\x82\xAC");
}

TEST(SerialLogReader, OpenFailureIsReported)
{
  SerialLogReader reader("/dev/luci_servo_no_such_port", 57600, 20);
  EXPECT_FALSE(reader.start());
  EXPECT_FALSE(reader.is_running());
  EXPECT_FALSE(reader.last_error().empty());
  EXPECT_FALSE(reader.send_line("help"));
}

TEST(SerialLogReader, ReadsLinesAndSendsCommands)
{
  const int master = posix_openpt(O_RDWR | O_NOCTTY);
  ASSERT_GE(master, 0);
  ASSERT_EQ(grantpt(master), 0);
  ASSERT_EQ(unlockpt(master), 0);
  const std::string slave = ptsname(master);

  std::mutex m;
  std::condition_variable cv;
  std::vector<std::string> received;

  SerialLogReader reader(slave, 57600, 20);
  reader.set_callback(
    [&](const std::string & line) {
      std::lock_guard<std::mutex> lk(m);
      received.push_back(line);
      cv.notify_all();
    });
  ASSERT_TRUE(reader.start());
  EXPECT_TRUE(reader.is_running());

  const std::string log = "motor 3 online\r\nbad\xFF byte\r\n";
  ASSERT_EQ(::write(master, log.data(), log.size()), static_cast<ssize_t>(log.size()));
  {
    std::unique_lock<std::mutex> lk(m);
    ASSERT_TRUE(cv.wait_for(lk, std::chrono::seconds(2), [&]() {return received.size() >= 2;}));
  }
  EXPECT_EQ(received[0], "motor 3 online");
  EXPECT_EQ(received[1], "bad byte");

  ASSERT_TRUE(reader.send_line("status"));
  ASSERT_TRUE(reader.send_interrupt());

  std::string echoed;
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
  while (echoed.size() < 8 && std::chrono::steady_clock::now() < deadline) {
    pollfd pfd{master, POLLIN, 0};
    if (poll(&pfd, 1, 50) > 0) {
      char buf[64];
      const auto n = ::read(master, buf, sizeof(buf));
      if (n > 0) {
        echoed.append(buf, static_cast<size_t>(n));
      }
    }
  }
  EXPECT_EQ(echoed, std::string("status\n\x03"));

  reader.stop();
  EXPECT_FALSE(reader.is_running());
  ::close(master);
}
