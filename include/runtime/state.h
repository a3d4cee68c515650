#pragma once

#include <atomic>

namespace segdl {

// Set from the SIGINT/SIGTERM handler; only async-signal-safe operations here.
extern std::atomic<bool> g_interrupt_flag;

inline bool interrupt_requested() { return g_interrupt_flag.load(); }
inline void request_interrupt() { g_interrupt_flag.store(true); }
inline void reset_interrupt() { g_interrupt_flag.store(false); }

}  // namespace segdl
