#pragma once

#include <string>

namespace platform {

// Per-user directories, empty if neither XDG nor HOME is set.
std::string config_dir();
std::string data_dir();

} // namespace platform
