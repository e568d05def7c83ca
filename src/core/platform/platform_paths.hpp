#pragma once

#include <string>

namespace platform {

// Per-user config directory for wavscribe, empty if it cannot be determined.
std::string config_dir();

} // namespace platform
