#pragma once

#include <string>

namespace chronicle::common {

/// Install the process-wide async logger: colored console plus file sink.
/// Unknown level names fall back to info.
void configure_logging(const std::string& level, const std::string& file);

}  // namespace chronicle::common
