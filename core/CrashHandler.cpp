#include "CrashHandler.hpp"

#include "core/Log.hpp"
#include <backward.hpp>

namespace CrashHandler {

// Kept alive for the lifetime of the process.
static backward::SignalHandling *s_SignalHandler = nullptr;

bool Install() {
  if (!s_SignalHandler) {
    s_SignalHandler = new backward::SignalHandling();
    if (!s_SignalHandler->loaded()) {
      LOG_WARN("Crash handler could not install signal handlers");
    }
  }
  return s_SignalHandler->loaded();
}

} // namespace CrashHandler
