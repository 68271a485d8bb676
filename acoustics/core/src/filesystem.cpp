#include <acoustics/core/filesystem.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace acoustics::core {

namespace fs = std::filesystem;

bool FileSystem::exists(const std::string& path) {
    if (path.empty()) return false;
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::string FileSystem::read_text(const std::string& path) {
    std::ifstream file(path);
    if (!file) return {};

    return std::string(
        std::istreambuf_iterator<char>(file),
        std::istreambuf_iterator<char>()
    );
}

bool FileSystem::write_text(const std::string& path, const std::string& text) {
    fs::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) return false;
    }

    std::ofstream file(target);
    if (!file) return false;
    file << text;
    return file.good();
}

} // namespace acoustics::core
