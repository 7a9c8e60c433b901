#pragma once

#include <cstddef>
#include <string>

#include "sandbox/sandbox_types.hpp"

namespace ilbox::sandbox {

struct FormattedOutput {
    bool is_inline = true;
    // Inline text, or the truncated preview when an attachment is produced.
    std::string text;
    std::string attachment;
    std::string attachment_name;
    std::string note;
};

class OutputFormatter {
public:
    OutputFormatter(std::size_t inline_limit = 1900,
                    std::size_t preview_chars = 1800,
                    std::size_t log_tail_chars = 1800);

    FormattedOutput Format(const std::string& raw) const;

    // stdout, stderr, and a status line for timeouts, kills and truncation.
    std::string Render(const ExecutionResult& result) const;

    // Last log_tail_chars characters of an install log, for progress display.
    std::string LogTail(const std::string& log) const;

    std::size_t InlineLimit() const { return inline_limit_; }

private:
    std::size_t inline_limit_;
    std::size_t preview_chars_;
    std::size_t log_tail_chars_;
};

}  // namespace ilbox::sandbox
