#include "fliprpc/serial_port.hpp"

#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>

#include "fliprpc/error.hpp"

namespace fliprpc {

namespace {

speed_t to_speed(int baud) {
  switch (baud) {
    case 9600:
      return B9600;
    case 19200:
      return B19200;
    case 38400:
      return B38400;
    case 57600:
      return B57600;
    case 115200:
      return B115200;
    case 230400:
      return B230400;
    case 460800:
      return B460800;
    case 921600:
      return B921600;
    default:
      break;
  }
  throw Error(ErrorKind::InvalidArgument,
              "unsupported baud rate " + std::to_string(baud));
}

}  // namespace

SerialPort::SerialPort(int fd) : FdStream(fd) {}

std::unique_ptr<SerialPort> SerialPort::open(const std::string& path, int baud,
                                             bool verbose) {
  speed_t speed = to_speed(baud);

  int fd = ::open(path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) {
    throw Error(ErrorKind::Io,
                "failed to open " + path + ": " + strerror(errno));
  }

  // Owns the fd from here so every error path closes it.
  std::unique_ptr<SerialPort> port(new SerialPort(fd));

  struct termios tty;
  memset(&tty, 0, sizeof(tty));

  if (tcgetattr(fd, &tty) != 0) {
    throw Error(ErrorKind::Io,
                std::string("tcgetattr failed: ") + strerror(errno));
  }

  cfsetospeed(&tty, speed);
  cfsetispeed(&tty, speed);

  // 8N1, no flow control
  tty.c_cflag = (tty.c_cflag & ~CSIZE) | CS8;
  tty.c_cflag &= ~(PARENB | PARODD | CSTOPB);
  tty.c_cflag &= ~CRTSCTS;
  tty.c_cflag |= CLOCAL | CREAD;

  // Raw mode
  tty.c_iflag &=
      ~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL | IXON);
  tty.c_oflag &= ~OPOST;
  tty.c_lflag &= ~(ECHO | ECHONL | ICANON | ISIG | IEXTEN);

  // Reads are driven by poll()
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;

  if (tcsetattr(fd, TCSANOW, &tty) != 0) {
    throw Error(ErrorKind::Io,
                std::string("tcsetattr failed: ") + strerror(errno));
  }

  if (verbose) {
    std::cerr << "Opened " << path << " at " << baud << " baud\n";
  }

  return port;
}

}  // namespace fliprpc
