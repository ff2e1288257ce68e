#pragma once

#include <utility>
#include <variant>

namespace ppcl {

enum class Error
{
    TIMEOUT,
    CHECKSUM_MISMATCH,
    BAUD_NEGOTIATION_FAILED,
    EXTENDED_ADDRESSING_UNSUPPORTED,
    INVALID_RESPONSE,
    RANGE_ERROR,
    INVALID_CONFIG,
    NOT_CONNECTED,
    PORT_ERROR,
    WRITE_ERROR
};

const char* error_name(Error error);

template<typename T>
class Result
{
public:
    bool ok() const
    {
        return std::holds_alternative<T>(data_);
    }

    const T& value() const
    {
        return std::get<T>(data_);
    }

    const T* value_if() const
    {
        return std::get_if<T>(&data_);
    }

    Error error() const
    {
        return std::get<Error>(data_);
    }

    static Result success(T value)
    {
        return Result(std::move(value));
    }

    static Result failure(Error error)
    {
        return Result(error);
    }

private:
    std::variant<T, Error> data_;

    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(Error error) : data_(error) {}
};

} // namespace ppcl
