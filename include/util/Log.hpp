#pragma once

#include <string>

namespace reeldrop {
namespace log {

// Whole-line writers, safe to call from the event loop and worker threads at once.
// info goes to stdout, warn and error to stderr.
void info(const std::string& message);
void warn(const std::string& message);
void error(const std::string& message);

} // namespace log
} // namespace reeldrop
