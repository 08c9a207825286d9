#pragma once

#include <QMutex>
#include <QString>

namespace pwa {

/// Default-sink bookkeeping shared by the detection paths.
///
/// Holds the name of the node currently treated as default output and the
/// one-shot "user initiated" flag. All access goes through the mutex;
/// adoptDefaultSink() reads, replaces and clears in one critical section.
class SessionState {
public:
    struct SinkChange {
        QString previousSink;   // empty on first observation
        bool userInitiated = false;
    };

    QString defaultSink() const;
    bool userInitiated() const;

    void markUserInitiated();

    /// Make `sink` the default, clear the user flag, and return what was
    /// recorded before.
    SinkChange adoptDefaultSink(const QString& sink);

private:
    mutable QMutex mutex_;
    QString defaultSink_;
    bool userInitiated_ = false;
};

} // namespace pwa
