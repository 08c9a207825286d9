#include "SessionState.hpp"

namespace pwa {

QString SessionState::defaultSink() const
{
    QMutexLocker lock(&mutex_);
    return defaultSink_;
}

bool SessionState::userInitiated() const
{
    QMutexLocker lock(&mutex_);
    return userInitiated_;
}

void SessionState::markUserInitiated()
{
    QMutexLocker lock(&mutex_);
    userInitiated_ = true;
}

SessionState::SinkChange SessionState::adoptDefaultSink(const QString& sink)
{
    QMutexLocker lock(&mutex_);
    SinkChange change;
    change.previousSink = defaultSink_;
    change.userInitiated = userInitiated_;
    defaultSink_ = sink;
    userInitiated_ = false;
    return change;
}

} // namespace pwa
