#pragma once

#include <string>

namespace acoustics::core {

struct FileSystem {
    // True for an existing regular file
    static bool exists(const std::string& path);
    static std::string read_text(const std::string& path);
    // Creates missing parent directories
    static bool write_text(const std::string& path, const std::string& text);
};

} // namespace acoustics::core
