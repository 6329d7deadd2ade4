#pragma once

#include <QString>

#include <optional>
#include <utility>
#include <variant>

namespace planner {
namespace core {

struct Error
{
    enum class Kind
    {
        Validation,
        TransientNetwork,
        RemoteRejected,
        Storage,
    };

    Kind kind = Kind::Storage;
    int statusCode = 0;
    QString message;

    static Error validation(QString message);
    static Error transientNetwork(QString message);
    static Error remoteRejected(int statusCode, QString message);
    static Error storage(QString message);

    bool isRetryable() const;
};

QString errorKindName(Error::Kind kind);

// Value or Error. Public operations of the engine return this instead of throwing.
template <typename T>
class Result
{
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result fail(Error error) { return Result(std::move(error)); }

    bool isOk() const { return std::holds_alternative<T>(m_state); }
    explicit operator bool() const { return isOk(); }

    const T &value() const { return std::get<T>(m_state); }
    T &value() { return std::get<T>(m_state); }
    T valueOr(T fallback) const { return isOk() ? value() : std::move(fallback); }

    const Error &error() const { return std::get<Error>(m_state); }

private:
    explicit Result(T value)
        : m_state(std::move(value))
    {
    }
    explicit Result(Error error)
        : m_state(std::move(error))
    {
    }

    std::variant<T, Error> m_state;
};

} // namespace core
} // namespace planner
