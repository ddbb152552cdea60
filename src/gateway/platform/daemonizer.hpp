#pragma once

namespace platform {

// Detach from the controlling terminal with a double fork. Parents exit; the
// grandchild returns true. Returns false if the first fork fails.
bool daemonize();

} // namespace platform
