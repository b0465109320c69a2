#include "zealdump/io/serial_port.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <optional>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace zealdump {

namespace {

std::optional<speed_t> speedFor(uint32_t baudRate) {
    switch (baudRate) {
        case 1200:    return B1200;
        case 2400:    return B2400;
        case 4800:    return B4800;
        case 9600:    return B9600;
        case 19200:   return B19200;
        case 38400:   return B38400;
        case 57600:   return B57600;
        case 115200:  return B115200;
        case 230400:  return B230400;
#ifdef B460800
        case 460800:  return B460800;
#endif
#ifdef B921600
        case 921600:  return B921600;
#endif
        default:      return std::nullopt;
    }
}

std::string openFailure(const std::string& device, const char* what, int err) {
    return "SerialPort: " + std::string(what) + " " + device + ": " + std::strerror(err);
}

}  // namespace

bool SerialPort::isSupportedBaudRate(uint32_t baudRate) {
    return speedFor(baudRate).has_value();
}

SerialPort::SerialPort(SerialConfig config)
    : config_(std::move(config)) {
    if (!isSupportedBaudRate(config_.baudRate)) {
        throw std::runtime_error("SerialPort: unsupported baud rate " +
                                 std::to_string(config_.baudRate));
    }

    // Without O_NONBLOCK the open waits for carrier until CLOCAL is set
    fd_ = ::open(config_.device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    if (fd_ < 0) {
        throw std::runtime_error(openFailure(config_.device, "cannot open", errno));
    }

    try {
        configureLine();
    } catch (const std::exception&) {
        ::close(fd_);
        fd_ = -1;
        throw;
    }
}

SerialPort::~SerialPort() {
    close();
}

void SerialPort::configureLine() {
    termios tio{};
    if (::tcgetattr(fd_, &tio) != 0) {
        throw std::runtime_error(openFailure(config_.device, "not a serial device:", errno));
    }

    ::cfmakeraw(&tio);
    tio.c_cflag |= CLOCAL | CREAD;
    tio.c_cflag &= ~CSTOPB;
    // poll() provides the timeout; reads return whatever is buffered
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;

    speed_t speed = *speedFor(config_.baudRate);
    if (::cfsetispeed(&tio, speed) != 0 || ::cfsetospeed(&tio, speed) != 0) {
        throw std::runtime_error(openFailure(config_.device, "cannot set baud rate on", errno));
    }

    if (::tcsetattr(fd_, TCSANOW, &tio) != 0) {
        throw std::runtime_error(openFailure(config_.device, "cannot configure", errno));
    }

    int flags = ::fcntl(fd_, F_GETFL);
    if (flags < 0 || ::fcntl(fd_, F_SETFL, flags & ~O_NONBLOCK) != 0) {
        throw std::runtime_error(openFailure(config_.device, "cannot set blocking mode on", errno));
    }
}

void SerialPort::close() {
    if (fd_ < 0) {
        return;
    }
    if (::close(fd_) != 0) {
        std::cerr << "[SerialPort] WARNING: close " << config_.device
                  << " failed: " << std::strerror(errno) << "\n";
    }
    fd_ = -1;
}

void SerialPort::recordError(const char* what, int err) {
    lastError_ = std::string(what) + ": " + std::strerror(err);
}

bool SerialPort::writeByte(uint8_t value) {
    if (fd_ < 0) {
        lastError_ = "port is closed";
        return false;
    }

    while (true) {
        ssize_t n = ::write(fd_, &value, 1);
        if (n == 1) {
            return true;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0) {
            recordError("write", errno);
        } else {
            lastError_ = "write accepted no data";
        }
        return false;
    }
}

ReadResult SerialPort::read(std::span<uint8_t> buffer) {
    if (fd_ < 0) {
        return {0, true};
    }
    if (buffer.empty()) {
        return {0, false};
    }

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;

    int ready;
    do {
        ready = ::poll(&pfd, 1, static_cast<int>(config_.readTimeout.count()));
    } while (ready < 0 && errno == EINTR);

    if (ready < 0) {
        recordError("poll", errno);
        return {0, true};
    }
    if (ready == 0) {
        return {0, false};  // Timed out
    }
    if (!(pfd.revents & POLLIN)) {
        // POLLHUP / POLLERR / POLLNVAL with nothing left to read
        lastError_ = "device hung up";
        return {0, true};
    }

    while (true) {
        ssize_t n = ::read(fd_, buffer.data(), buffer.size());
        if (n > 0) {
            return {static_cast<size_t>(n), false};
        }
        if (n == 0) {
            lastError_ = "end of stream";
            return {0, true};
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return {0, false};
        }
        recordError("read", errno);
        return {0, true};
    }
}

}  // namespace zealdump
