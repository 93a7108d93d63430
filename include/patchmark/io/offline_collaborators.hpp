#pragma once

#include "patchmark/interfaces.hpp"
#include <iosfwd>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace patchmark {

// Replays a recorded generation response for every batch. Without a
// recording it answers with an empty response.
class RecordedBackend : public IGenerationBackend {
public:
    explicit RecordedBackend(std::optional<std::string> recorded_response);
    auto request_review(const std::string& patches) -> std::string override;

    auto request_count() const -> size_t { return request_count_; }

private:
    std::optional<std::string> recorded_response_;
    size_t request_count_{};
};

// Prints every comment it is asked to post and accepts it. Lines listed in
// refused_lines are rejected, which mimics a host refusing an anchor.
class ConsolePoster : public ICommentPoster {
public:
    explicit ConsolePoster(std::ostream& out, std::set<std::pair<std::string, int>> refused_lines = {});

    auto post_line_comment(const std::string& filename, int line, const std::string& body)
        -> bool override;
    auto post_pull_request_comment(const std::string& body) -> bool override;

private:
    std::ostream& out_;
    std::set<std::pair<std::string, int>> refused_lines_;
};

class ThreadPacer : public IPacer {
public:
    auto wait(std::chrono::milliseconds duration) -> void override;
};

} // namespace patchmark
