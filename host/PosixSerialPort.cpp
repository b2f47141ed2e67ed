#include "PosixSerialPort.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

#include "utils/Log.h"

// Maps a numeric baud rate onto the termios constant. 0 if unsupported.
static speed_t baudConstant(uint32_t baud) {
  switch (baud) {
    case 9600:   return B9600;
    case 19200:  return B19200;
    case 38400:  return B38400;
    case 57600:  return B57600;
    case 115200: return B115200;
    case 230400: return B230400;
    default:     return 0;
  }
}

PosixSerialPort::~PosixSerialPort() {
  close();
}

bool PosixSerialPort::open(const char* path, uint32_t baud) {
  close();

  const speed_t speed = baudConstant(baud);
  if (speed == 0) {
    LOG_ERROR("unsupported baud rate %lu", (unsigned long)baud);
    return false;
  }

  _fd = ::open(path, O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (_fd < 0) {
    LOG_ERROR("open %s: %s", path, strerror(errno));
    return false;
  }

  struct termios tio;
  if (tcgetattr(_fd, &tio) != 0) {
    LOG_ERROR("tcgetattr %s: %s", path, strerror(errno));
    close();
    return false;
  }

  cfmakeraw(&tio);
  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~CSTOPB;
  tio.c_cflag &= ~CRTSCTS;
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;
  cfsetispeed(&tio, speed);
  cfsetospeed(&tio, speed);

  if (tcsetattr(_fd, TCSANOW, &tio) != 0) {
    LOG_ERROR("tcsetattr %s: %s", path, strerror(errno));
    close();
    return false;
  }

  LOG_DEBUG("opened %s at %lu baud", path, (unsigned long)baud);
  return true;
}

void PosixSerialPort::close() {
  if (_fd >= 0) {
    ::close(_fd);
    _fd = -1;
  }
}

void PosixSerialPort::flushInput() {
  if (_fd >= 0) tcflush(_fd, TCIFLUSH);
}

int PosixSerialPort::available() {
  if (_fd < 0) return 0;

  int n = 0;
  if (ioctl(_fd, FIONREAD, &n) != 0) return 0;
  return n;
}

int PosixSerialPort::read() {
  if (_fd < 0) return -1;

  uint8_t c = 0;
  const ssize_t n = ::read(_fd, &c, 1);
  if (n != 1) return -1;
  return c;
}

size_t PosixSerialPort::write(const uint8_t* data, size_t len) {
  if (_fd < 0) return 0;

  size_t done = 0;
  while (done < len) {
    const ssize_t n = ::write(_fd, data + done, len - done);
    if (n > 0) {
      done += (size_t)n;
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EINTR)) {
      // Output buffer full; wait for the driver to drain it
      tcdrain(_fd);
      continue;
    }

    LOG_ERROR("serial write: %s", n < 0 ? strerror(errno) : "no progress");
    break;
  }
  return done;
}
