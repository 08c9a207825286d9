#include "JsonBatchFramer.hpp"
#include <boost/log/trivial.hpp>

namespace pwa {

JsonBatchFramer::JsonBatchFramer(QObject* parent)
    : QObject(parent)
{
}

void JsonBatchFramer::reset()
{
    state_ = State::BetweenBatches;
    current_.clear();
    depth_ = 0;
    failed_ = false;
}

void JsonBatchFramer::onData(const QByteArray& data)
{
    if (failed_)
        return;

    for (char c : data) {
        switch (state_) {
        case State::BetweenBatches:
            if (c == ' ' || c == '\n' || c == '\r' || c == '\t')
                break;
            if (c != '[') {
                failed_ = true;
                BOOST_LOG_TRIVIAL(warning) << "[JsonBatchFramer] unexpected byte 0x" << std::hex
                                           << (static_cast<unsigned>(c) & 0xffu)
                                           << " outside of a batch";
                emit framingError(QStringLiteral("unexpected '%1' between batches")
                                      .arg(QLatin1Char(c)));
                return;
            }
            current_.append(c);
            depth_ = 1;
            state_ = State::InBatch;
            break;

        case State::InBatch:
            current_.append(c);
            if (c == '"') {
                state_ = State::InString;
            } else if (c == '[' || c == '{') {
                ++depth_;
            } else if (c == ']' || c == '}') {
                if (--depth_ == 0) {
                    QByteArray batch;
                    batch.swap(current_);
                    state_ = State::BetweenBatches;
                    BOOST_LOG_TRIVIAL(trace) << "[JsonBatchFramer] framed batch of "
                                             << batch.size() << " bytes";
                    emit batchFramed(batch);
                }
            }
            break;

        case State::InString:
            current_.append(c);
            if (c == '\\')
                state_ = State::InEscape;
            else if (c == '"')
                state_ = State::InBatch;
            break;

        case State::InEscape:
            current_.append(c);
            state_ = State::InString;
            break;
        }
    }
}

} // namespace pwa
