#include "luci_servo_cpp/serial_port.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include "rclcpp/rclcpp.hpp"

using namespace std;


namespace luci_servo_cpp
{

speed_t baud_to_speed(int baudrate, bool & supported)
{
  supported = true;
  switch (baudrate) {
    case 9600: return B9600;
    case 19200: return B19200;
    case 38400: return B38400;
    case 57600: return B57600;
    case 115200: return B115200;
    case 230400: return B230400;
    case 460800: return B460800;
    case 500000: return B500000;
    case 576000: return B576000;
    case 921600: return B921600;
    case 1000000: return B1000000;
    case 2000000: return B2000000;
    default:
      supported = false;
      return B57600;
  }
}

int open_serial_port(const string & device, int baudrate, double timeout_sec, string & error)
{
  int fd = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) {
    error = "open " + device + ": " + strerror(errno);
    return -1;
  }

  // 배타적 접근: 다른 프로세스의 open 차단
  if (ioctl(fd, TIOCEXCL) < 0) {
    error = "TIOCEXCL " + device + ": " + strerror(errno);
    ::close(fd);
    return -1;
  }

  // O_NONBLOCK 해제, blocking 모드로 전환
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
  }

  termios tty{};
  if (tcgetattr(fd, &tty) != 0) {
    error = "tcgetattr " + device + ": " + strerror(errno);
    ::close(fd);
    return -1;
  }

  cfmakeraw(&tty);

  bool supported = true;
  const speed_t speed = baud_to_speed(baudrate, supported);
  if (!supported) {
    RCLCPP_WARN(
      rclcpp::get_logger("luci_servo_cpp.serial"),
      "baud rate %d not supported by termios, fallback to 57600", baudrate);
  }
  cfsetispeed(&tty, speed);
  cfsetospeed(&tty, speed);

  // 8N1
  tty.c_cflag &= ~(PARENB | CSTOPB | CSIZE);
  tty.c_cflag |= CS8;
  tty.c_cflag |= (CLOCAL | CREAD);
  tty.c_cflag &= ~CRTSCTS;
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = static_cast<cc_t>(max(1, static_cast<int>(timeout_sec * 10.0)));

  if (tcsetattr(fd, TCSANOW, &tty) != 0) {
    error = "tcsetattr " + device + ": " + strerror(errno);
    ::close(fd);
    return -1;
  }

  tcflush(fd, TCIOFLUSH);
  return fd;
}

}  // namespace luci_servo_cpp
