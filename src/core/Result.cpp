#include "planner/core/Result.hpp"

namespace planner {
namespace core {

Error Error::validation(QString message)
{
    return Error{Kind::Validation, 0, std::move(message)};
}

Error Error::transientNetwork(QString message)
{
    return Error{Kind::TransientNetwork, 0, std::move(message)};
}

Error Error::remoteRejected(int statusCode, QString message)
{
    return Error{Kind::RemoteRejected, statusCode, std::move(message)};
}

Error Error::storage(QString message)
{
    return Error{Kind::Storage, 0, std::move(message)};
}

bool Error::isRetryable() const
{
    return kind == Kind::TransientNetwork || kind == Kind::RemoteRejected;
}

QString errorKindName(Error::Kind kind)
{
    switch (kind) {
    case Error::Kind::Validation:
        return QStringLiteral("validation");
    case Error::Kind::TransientNetwork:
        return QStringLiteral("network");
    case Error::Kind::RemoteRejected:
        return QStringLiteral("rejected");
    case Error::Kind::Storage:
    default:
        return QStringLiteral("storage");
    }
}

} // namespace core
} // namespace planner
