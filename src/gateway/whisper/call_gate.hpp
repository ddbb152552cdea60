#pragma once

#include <mutex>

// Admits one logical call at a time onto the shared backend connection.
// The pass covers the whole ensure/write/read sequence and releases on destruction.
class CallGate {
public:
    using Pass = std::unique_lock<std::mutex>;

    Pass enter() { return Pass(mutex_); }

private:
    std::mutex mutex_;
};
