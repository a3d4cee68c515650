#include "runtime/state.h"

namespace segdl {

std::atomic<bool> g_interrupt_flag{false};

}  // namespace segdl
