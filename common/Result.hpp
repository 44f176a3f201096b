#pragma once

#include <optional>
#include <string>
#include <utility>

namespace lanwatch::common
{
    enum class ErrorCode
    {
        None,
        NotFound,
        InvalidArgument,
        InvalidState,
        Privilege,
        Resolution,
        Command,
        Timeout
    };

    inline const char *ToString(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::None:
            return "none";
        case ErrorCode::NotFound:
            return "not_found";
        case ErrorCode::InvalidArgument:
            return "invalid_argument";
        case ErrorCode::InvalidState:
            return "invalid_state";
        case ErrorCode::Privilege:
            return "privilege";
        case ErrorCode::Resolution:
            return "resolution";
        case ErrorCode::Command:
            return "command";
        case ErrorCode::Timeout:
            return "timeout";
        }
        return "unknown";
    }

    struct Empty
    {
    };

    // Tagged success/failure returned across the service boundary.
    template <typename T = Empty>
    struct Result
    {
        bool success = false;
        ErrorCode code = ErrorCode::None;
        std::string error;
        std::optional<T> data;

        static Result Ok(T value = T{})
        {
            Result r;
            r.success = true;
            r.data = std::move(value);
            return r;
        }

        static Result Fail(ErrorCode code, std::string message)
        {
            Result r;
            r.code = code;
            r.error = std::move(message);
            return r;
        }

        explicit operator bool() const { return success; }
    };

    using Status = Result<Empty>;
}
