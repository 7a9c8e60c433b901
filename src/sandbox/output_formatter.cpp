#include "sandbox/output_formatter.hpp"

#include <algorithm>
#include <sstream>

namespace ilbox::sandbox {
namespace {

constexpr const char* kAttachmentName = "output.txt";
constexpr const char* kTruncationMarker = "\n... [truncated, full output attached]";

// Never cut a UTF-8 sequence in half.
std::size_t Utf8Boundary(const std::string& text, std::size_t pos) {
    pos = std::min(pos, text.size());
    while (pos > 0 && pos < text.size() &&
           (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) {
        --pos;
    }
    return pos;
}

}  // namespace

OutputFormatter::OutputFormatter(std::size_t inline_limit, std::size_t preview_chars, std::size_t log_tail_chars)
    : inline_limit_(inline_limit)
    , preview_chars_(std::min(preview_chars, inline_limit))
    , log_tail_chars_(log_tail_chars) {}

FormattedOutput OutputFormatter::Format(const std::string& raw) const {
    FormattedOutput formatted{};
    if (raw.size() <= inline_limit_) {
        formatted.is_inline = true;
        formatted.text = raw;
        if (raw.size() == inline_limit_) {
            formatted.note = "output reached the inline limit";
        }
        return formatted;
    }
    formatted.is_inline = false;
    formatted.text = raw.substr(0, Utf8Boundary(raw, preview_chars_)) + kTruncationMarker;
    formatted.attachment = raw;
    formatted.attachment_name = kAttachmentName;
    formatted.note = "Output too long (" + std::to_string(raw.size()) + " bytes); full output attached.";
    return formatted;
}

std::string OutputFormatter::Render(const ExecutionResult& result) const {
    std::ostringstream text;
    if (!result.output.empty()) {
        text << result.output;
    }
    if (!result.error.empty()) {
        if (!result.output.empty()) {
            text << "\n--- stderr ---\n";
        }
        text << result.error;
    }
    if (result.output.empty() && result.error.empty() && !result.timed_out) {
        text << "(no output, exit code " << result.exit_code << ")";
    }
    if (result.truncated) {
        text << "\n[output truncated]";
    }
    if (result.timed_out) {
        text << "\n[execution timed out after " << result.elapsed.count() / 1000
             << "s. If this was the first run, the image may still be pulling; "
                "try pre-pulling or increasing the timeout.]";
    } else if (result.resource_exceeded) {
        text << "\n[killed: memory or process limit exceeded, exit code " << result.exit_code << "]";
    }
    return text.str();
}

std::string OutputFormatter::LogTail(const std::string& log) const {
    if (log.size() <= log_tail_chars_) {
        return log;
    }
    auto start = log.size() - log_tail_chars_;
    while (start < log.size() && (static_cast<unsigned char>(log[start]) & 0xC0) == 0x80) {
        ++start;
    }
    return log.substr(start);
}

}  // namespace ilbox::sandbox
