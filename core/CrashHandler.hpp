#pragma once

// Prints a symbolized stack trace on fatal signals (SIGSEGV, SIGABRT, ...).
namespace CrashHandler {

// Returns true when the signal handlers were armed.
bool Install();

} // namespace CrashHandler
