#pragma once

#include <cerrno>
#include <cstring>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace finbot
{
    enum class ErrorCode : std::uint8_t
    {
        kOk = 0,
        kInvalidArgument = 1,
        kNotFound = 2,
        kCorruption = 4,
        kIoError = 5,
        kFailedPrecondition = 6,
        kUnavailable = 7,
        kNotSupported = 8,
        kInternal = 9,
    };

    const char *ErrorCodeName(ErrorCode code) noexcept;

    struct [[nodiscard]] Status
    {
        ErrorCode code{ErrorCode::kOk};
        std::string msg{};

        bool ok() const noexcept { return code == ErrorCode::kOk; }

        static Status Ok() { return {}; }

        static Status FromErrno(ErrorCode code, std::string_view what)
        {
            Status s;
            s.code = code;
            s.msg = std::string(what) + ": " + std::string(std::strerror(errno));
            return s;
        }

        static Status InvalidArgument(std::string msg)
        {
            return {ErrorCode::kInvalidArgument, std::move(msg)};
        }

        static Status NotFound(std::string msg)
        {
            return {ErrorCode::kNotFound, std::move(msg)};
        }

        static Status Corruption(std::string msg)
        {
            return {ErrorCode::kCorruption, std::move(msg)};
        }

        static Status IoError(std::string msg)
        {
            return {ErrorCode::kIoError, std::move(msg)};
        }

        static Status FailedPrecondition(std::string msg)
        {
            return {ErrorCode::kFailedPrecondition, std::move(msg)};
        }

        static Status Unavailable(std::string msg)
        {
            return {ErrorCode::kUnavailable, std::move(msg)};
        }

        static Status NotSupported(std::string msg)
        {
            return {ErrorCode::kNotSupported, std::move(msg)};
        }

        static Status Internal(std::string msg)
        {
            return {ErrorCode::kInternal, std::move(msg)};
        }

        std::string ToString() const;
    };

    template <typename T>
    class [[nodiscard]] Result
    {
    public:
        Result() : status_(Status::Internal("uninitialized result")) {}
        Result(Status s) : status_(std::move(s)) {}
        Result(T value) : status_(Status::Ok()), value_(std::move(value)) {}

        bool ok() const { return status_.ok() && value_.has_value(); }
        const Status &status() const { return status_; }

        T &value()
        {
            return *value_;
        }

        const T &value() const
        {
            return *value_;
        }

        T &&move_value()
        {
            return std::move(*value_);
        }

    private:
        Status status_{};
        std::optional<T> value_{};
    };
} // namespace finbot
