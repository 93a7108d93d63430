#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace patchmark {

class StringUtils {
public:
    // Split on '\n', dropping a trailing '\r' per line. A final line
    // terminator does not produce an extra empty line.
    static auto split_lines(std::string_view text) -> std::vector<std::string>;

    // Join with '\n', no trailing terminator
    static auto join_lines(const std::vector<std::string>& lines) -> std::string;

    // Strip leading and trailing whitespace
    static auto trim(std::string_view text) -> std::string;

    static auto to_lowercase(std::string_view text) -> std::string;
};

} // namespace patchmark
