#include "transport/serial.hpp"
#include <iostream>
#include <cstring>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>

namespace ppcl {

bool SerialPort::to_speed(int baud, speed_t& speed)
{
    switch (baud) {
        case 4800: speed = B4800; return true;
        case 9600: speed = B9600; return true;
        case 19200: speed = B19200; return true;
        case 38400: speed = B38400; return true;
        case 57600: speed = B57600; return true;
        case 115200: speed = B115200; return true;
        case 230400: speed = B230400; return true;
        default: return false;
    }
}

Result<bool> SerialPort::open(const std::string& port, int baud)
{
    if (open_) {
        close();
    }

    speed_t speed;
    if (!to_speed(baud, speed)) {
        std::cerr << "Unsupported baud rate " << baud << " for " << port << "\n";
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    port_ = port;

    fd_ = ::open(port_.c_str(), O_RDWR | O_NOCTTY);
    if (fd_ < 0)
    {
        std::cerr << "Error opening " << port << ": " << strerror(errno) << "\n";
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    if (tcgetattr(fd_, &original_tty_) != 0)
    {
        std::cerr << "Error getting port attributes: " << strerror(errno) << "\n";
        ::close(fd_);
        fd_ = -1;
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    struct termios tty = original_tty_;

    cfsetispeed(&tty, speed);
    cfsetospeed(&tty, speed);
    cfmakeraw(&tty);
    set_8N1(tty);

    // Reads return immediately with whatever is buffered.
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;

    if (tcsetattr(fd_, TCSANOW, &tty) != 0)
    {
        std::cerr << "Error setting port attributes: " << strerror(errno) << "\n";
        ::close(fd_);
        fd_ = -1;
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    tcflush(fd_, TCIOFLUSH);
    baud_ = baud;
    open_ = true;
    return Result<bool>::success(true);
}

Result<bool> SerialPort::close()
{
    if (fd_ >= 0)
    {
        tcsetattr(fd_, TCSANOW, &original_tty_);
        ::close(fd_);
        fd_ = -1;
        open_ = false;
        return Result<bool>::success(true);
    }
    return Result<bool>::success(false);
}

bool SerialPort::is_open() const
{
    return open_;
}

Result<bool> SerialPort::flush_input()
{
    if (fd_ < 0)
        return Result<bool>::failure(Error::NOT_CONNECTED);

    if (tcflush(fd_, TCIFLUSH) != 0) {
        std::cerr << "Error flushing " << port_ << ": " << strerror(errno) << "\n";
        return Result<bool>::failure(Error::PORT_ERROR);
    }
    return Result<bool>::success(true);
}

Result<size_t> SerialPort::write(const uint8_t* data, size_t len)
{
    if (fd_ < 0)
        return Result<size_t>::failure(Error::NOT_CONNECTED);

    ssize_t written = ::write(fd_, data, len);
    if (written < 0) {
        std::cerr << "Error writing " << port_ << ": " << strerror(errno) << "\n";
        return Result<size_t>::failure(Error::WRITE_ERROR);
    }

    tcdrain(fd_);
    return Result<size_t>::success(static_cast<size_t>(written));
}

Result<std::vector<uint8_t>> SerialPort::read_available()
{
    if (fd_ < 0)
        return Result<std::vector<uint8_t>>::failure(Error::NOT_CONNECTED);

    int waiting = 0;
    if (ioctl(fd_, FIONREAD, &waiting) < 0) {
        std::cerr << "Error polling " << port_ << ": " << strerror(errno) << "\n";
        return Result<std::vector<uint8_t>>::failure(Error::PORT_ERROR);
    }

    std::vector<uint8_t> buffer;
    if (waiting <= 0)
        return Result<std::vector<uint8_t>>::success(std::move(buffer));

    buffer.resize(static_cast<size_t>(waiting));
    ssize_t n = ::read(fd_, buffer.data(), buffer.size());
    if (n < 0) {
        if (errno == EAGAIN || errno == EINTR) {
            buffer.clear();
            return Result<std::vector<uint8_t>>::success(std::move(buffer));
        }
        std::cerr << "Error reading " << port_ << ": " << strerror(errno) << "\n";
        return Result<std::vector<uint8_t>>::failure(Error::PORT_ERROR);
    }

    buffer.resize(static_cast<size_t>(n));
    return Result<std::vector<uint8_t>>::success(std::move(buffer));
}

std::string SerialPort::get_port() const
{
    return port_;
}

int SerialPort::get_baud() const
{
    return baud_;
}

void SerialPort::set_8N1(termios& tty)
{
    tty.c_cflag = (tty.c_cflag & ~CSIZE) | CS8;
    tty.c_cflag &= ~(PARENB | PARODD);
    tty.c_cflag &= ~CSTOPB;
    tty.c_cflag &= ~CRTSCTS;
    tty.c_cflag |= CREAD | CLOCAL;
}

} // namespace ppcl
