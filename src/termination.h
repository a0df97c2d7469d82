#pragma once

#include <atomic>

namespace blext {

// SIGINT/SIGTERM set the cancellation flag so in-flight downloads stop and staged cache
// entries are discarded. A second signal exits immediately with 128 + signal.
void termination_handler_install();

std::atomic_bool const &termination_requested();

}  // namespace blext
