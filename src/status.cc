#include <finbot/status.h>

namespace finbot
{
    const char *ErrorCodeName(ErrorCode code) noexcept
    {
        switch (code)
        {
        case ErrorCode::kOk:
            return "OK";
        case ErrorCode::kInvalidArgument:
            return "InvalidArgument";
        case ErrorCode::kNotFound:
            return "NotFound";
        case ErrorCode::kCorruption:
            return "Corruption";
        case ErrorCode::kIoError:
            return "IoError";
        case ErrorCode::kFailedPrecondition:
            return "FailedPrecondition";
        case ErrorCode::kUnavailable:
            return "Unavailable";
        case ErrorCode::kNotSupported:
            return "NotSupported";
        case ErrorCode::kInternal:
            return "Internal";
        }
        return "Unknown";
    }

    std::string Status::ToString() const
    {
        if (ok())
            return "OK";
        std::string s = ErrorCodeName(code);
        if (!msg.empty())
        {
            s += ": ";
            s += msg;
        }
        return s;
    }
} // namespace finbot
