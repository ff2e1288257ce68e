#pragma once

#include <string>
#include <vector>
#include <termios.h>

#include "transport/transport.hpp"

namespace ppcl {

class SerialPort : public Transport
{
public:

    SerialPort() : fd_(-1), baud_(0), open_(false) {}
    ~SerialPort() override
    {
        close();
    }

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    Result<bool> open(const std::string& port, int baud) override;
    Result<bool> close() override;
    bool is_open() const override;

    Result<bool> flush_input() override;
    Result<size_t> write(const uint8_t* data, size_t len) override;
    Result<std::vector<uint8_t>> read_available() override;

    std::string get_port() const;
    int get_baud() const;

    static bool to_speed(int baud, speed_t& speed);

private:

    int fd_;
    std::string port_;
    int baud_;
    struct termios original_tty_;
    bool open_;

    void set_8N1(termios& tty);
};

} // namespace ppcl
