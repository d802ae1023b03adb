#include "util/Log.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace reeldrop {
namespace log {

namespace {
    std::mutex& outputMutex() {
        static std::mutex mutex;
        return mutex;
    }

    void write(std::ostream& out, const char* level, const std::string& message) {
        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&in_time_t, &tm);

        std::ostringstream line;
        line << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " " << level << " " << message << "\n";

        std::lock_guard<std::mutex> lock(outputMutex());
        out << line.str() << std::flush;
    }
}

void info(const std::string& message) {
    write(std::cout, "INFO ", message);
}

void warn(const std::string& message) {
    write(std::cerr, "WARN ", message);
}

void error(const std::string& message) {
    write(std::cerr, "ERROR", message);
}

} // namespace log
} // namespace reeldrop
