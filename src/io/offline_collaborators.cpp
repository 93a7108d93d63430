#include "patchmark/io/offline_collaborators.hpp"
#include <ostream>
#include <thread>

namespace patchmark {

RecordedBackend::RecordedBackend(std::optional<std::string> recorded_response)
    : recorded_response_(std::move(recorded_response)) {}

auto RecordedBackend::request_review([[maybe_unused]] const std::string& patches) -> std::string {
    ++request_count_;
    return recorded_response_.value_or("");
}

ConsolePoster::ConsolePoster(std::ostream& out, std::set<std::pair<std::string, int>> refused_lines)
    : out_(out), refused_lines_(std::move(refused_lines)) {}

auto ConsolePoster::post_line_comment(const std::string& filename, int line, const std::string& body)
    -> bool {
    if (refused_lines_.contains({filename, line})) {
        return false;
    }
    out_ << "--- comment on " << filename << ":" << line << " ---\n" << body << "\n";
    return true;
}

auto ConsolePoster::post_pull_request_comment(const std::string& body) -> bool {
    out_ << "--- comment on pull request ---\n" << body << "\n";
    return true;
}

auto ThreadPacer::wait(std::chrono::milliseconds duration) -> void {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

} // namespace patchmark
