#include "PauseBatch.hpp"

namespace pwa {

int PauseReport::failures() const
{
    int n = 0;
    for (const auto& r : results) {
        if (!r.ok)
            ++n;
    }
    return n;
}

void PauseBatch::expectResults(int count)
{
    expected_ = count;
    if (report_.results.size() >= expected_)
        complete();
}

void PauseBatch::addResult(const PlayerPauseResult& result)
{
    if (finished_)
        return;
    report_.results.append(result);
    if (expected_ >= 0 && report_.results.size() >= expected_)
        complete();
}

void PauseBatch::fail(const QString& error)
{
    if (finished_)
        return;
    report_.connectionError = true;
    report_.error = error;
    complete();
}

void PauseBatch::complete()
{
    if (finished_)
        return;
    finished_ = true;
    QMetaObject::invokeMethod(this, [this]() {
        emit finished(report_);
    }, Qt::QueuedConnection);
}

} // namespace pwa
