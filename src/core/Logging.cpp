#include "core/Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <string>

namespace pwa {

bool applyLogLevel(const QString& level)
{
    namespace logging = boost::log;

    const std::string name = level.toLower().toStdString();
    logging::trivial::severity_level severity;
    if (!logging::trivial::from_string(name.c_str(), name.size(), severity)) {
        return false;
    }

    logging::core::get()->set_filter(logging::trivial::severity >= severity);
    return true;
}

} // namespace pwa
