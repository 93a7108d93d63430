#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace patchmark {

// Forward declarations
struct ChangedFile;

// Abstract interfaces for dependency injection
class ITokenEstimator {
public:
    virtual ~ITokenEstimator() = default;
    // Must be deterministic and non-decreasing in text length
    virtual auto estimate(const std::string& text) const -> size_t = 0;
};

class IDiffParser {
public:
    virtual ~IDiffParser() = default;
    virtual auto parse_diff(const std::string& diff_text) -> std::vector<ChangedFile> = 0;
};

class IGenerationBackend {
public:
    virtual ~IGenerationBackend() = default;
    // Returns the raw response text for one batch; may throw on transport errors
    virtual auto request_review(const std::string& patches) -> std::string = 0;
};

class ICommentPoster {
public:
    virtual ~ICommentPoster() = default;
    // false (or an exception) means the host refused the anchor
    virtual auto post_line_comment(const std::string& filename, int line, const std::string& body)
        -> bool = 0;
    virtual auto post_pull_request_comment(const std::string& body) -> bool = 0;
};

class IPacer {
public:
    virtual ~IPacer() = default;
    virtual auto wait(std::chrono::milliseconds duration) -> void = 0;
};

class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    // "-" reads standard input
    virtual auto read_text(const std::string& path) -> std::optional<std::string> = 0;
    virtual auto file_exists(const std::string& path) -> bool = 0;
};

} // namespace patchmark
