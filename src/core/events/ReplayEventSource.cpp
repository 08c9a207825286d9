#include "ReplayEventSource.hpp"
#include <QJsonDocument>

namespace pwa {

ReplayEventSource::ReplayEventSource(QObject* parent)
    : IEventSource(parent)
{
}

ReplayEventSource::~ReplayEventSource() = default;

void ReplayEventSource::start()
{
    running_ = true;
    emit started();
}

void ReplayEventSource::stop()
{
    running_ = false;
}

bool ReplayEventSource::isRunning() const
{
    return running_;
}

void ReplayEventSource::feedBatch(const QByteArray& batch)
{
    emit batchReceived(batch);
}

void ReplayEventSource::feedRecords(const QJsonArray& records)
{
    emit batchReceived(QJsonDocument(records).toJson(QJsonDocument::Compact));
}

void ReplayEventSource::simulateExit(const QString& reason)
{
    running_ = false;
    emit finished(reason);
}

} // namespace pwa
