#pragma once
#include <mailnorm/global.hpp>

namespace mailnorm {

// Process-wide setup of the MIME library. Call once before parsing anything.
expected<void> initialize();
expected<void> finalize();

}  // namespace mailnorm
