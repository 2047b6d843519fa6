#include "sink.hpp"
#include <filesystem>
#include "../core/logger/logger.hpp"

namespace Spoor {
namespace Storage {

bool prepare_output_path(const std::string& path) {
    std::filesystem::path target(path);
    if (!target.has_parent_path())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        Spoor::Core::Logger::error("Failed to create output directory " + target.parent_path().string()
                                   + ": " + ec.message());
        return false;
    }
    return true;
}

}  // namespace Storage
}  // namespace Spoor
