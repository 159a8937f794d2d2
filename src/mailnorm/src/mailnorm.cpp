#include "mailnorm/mailnorm.hpp"

#include <gmime/gmime.h>

namespace mailnorm {

expected<void> initialize() {
    ::g_mime_init();
    log_debug("GMIME init called");
    return {};
}

expected<void> finalize() {
    ::g_mime_shutdown();
    log_debug("GMIME shutdown called");
    return {};
}

}  // namespace mailnorm
