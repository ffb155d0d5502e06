#pragma once

#include <string>
#include <utility>
#include <variant>

namespace lan_watch::common
{
    enum class FailureKind
    {
        Timeout,
        Unreachable,
        ProbeError,
        AuthFailed,
        ConnectTimeout,
        ParseError,
        ApiUnauthorized,
        ApiUnreachable,
        ApiError
    };

    inline const char *ToString(FailureKind kind)
    {
        switch (kind)
        {
        case FailureKind::Timeout:
            return "Timeout";
        case FailureKind::Unreachable:
            return "Unreachable";
        case FailureKind::ProbeError:
            return "ProbeError";
        case FailureKind::AuthFailed:
            return "AuthFailed";
        case FailureKind::ConnectTimeout:
            return "ConnectTimeout";
        case FailureKind::ParseError:
            return "ParseError";
        case FailureKind::ApiUnauthorized:
            return "ApiUnauthorized";
        case FailureKind::ApiUnreachable:
            return "ApiUnreachable";
        case FailureKind::ApiError:
            return "ApiError";
        }
        return "Unknown";
    }

    struct ProbeFailure
    {
        FailureKind kind;
        std::string message;
    };

    // Either a value or a failure, never both.
    template <typename T>
    class ProbeResult
    {
    public:
        static ProbeResult Success(T value)
        {
            return ProbeResult(std::variant<T, ProbeFailure>(std::in_place_index<0>, std::move(value)));
        }

        static ProbeResult Failure(FailureKind kind, std::string message)
        {
            return ProbeResult(std::variant<T, ProbeFailure>(std::in_place_index<1>, ProbeFailure{kind, std::move(message)}));
        }

        bool IsSuccess() const { return m_value.index() == 0; }
        explicit operator bool() const { return IsSuccess(); }

        const T &Value() const { return std::get<0>(m_value); }
        T &Value() { return std::get<0>(m_value); }

        const ProbeFailure &Error() const { return std::get<1>(m_value); }
        FailureKind Kind() const { return Error().kind; }

    private:
        explicit ProbeResult(std::variant<T, ProbeFailure> value) : m_value(std::move(value)) {}

        std::variant<T, ProbeFailure> m_value;
    };
}
