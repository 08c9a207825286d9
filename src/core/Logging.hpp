#pragma once

#include <QString>

namespace pwa {

/// Install a Boost.Log severity filter. Accepts trace, debug, info,
/// warning, error and fatal; returns false (and changes nothing) otherwise.
bool applyLogLevel(const QString& level);

} // namespace pwa
