#include "patchmark/io/file_system.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace patchmark {

auto FileSystem::read_text(const std::string& path) -> std::optional<std::string> {
    if (path == "-") {
        return read_stream(std::cin);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    auto text = read_stream(file);
    if (file.bad()) {
        return std::nullopt;
    }
    return text;
}

auto FileSystem::file_exists(const std::string& path) -> bool {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

auto FileSystem::read_stream(std::istream& in) -> std::string {
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

} // namespace patchmark
