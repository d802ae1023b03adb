#include "core/FileTask.hpp"
#include <filesystem>

namespace reeldrop {

FileTask::FileTask(const std::string& sourcePath)
    : path(sourcePath), title(std::filesystem::path(sourcePath).stem().string()) {}

} // namespace reeldrop
