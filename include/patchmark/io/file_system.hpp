#pragma once

#include "patchmark/interfaces.hpp"
#include <iosfwd>
#include <optional>
#include <string>

namespace patchmark {

class FileSystem : public IFileSystem {
public:
    auto read_text(const std::string& path) -> std::optional<std::string> override;
    auto file_exists(const std::string& path) -> bool override;

private:
    auto read_stream(std::istream& in) -> std::string;
};

} // namespace patchmark
