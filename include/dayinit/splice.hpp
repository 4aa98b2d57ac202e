#pragma once

#include "error.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dayinit {

    struct text_lines {
        std::vector<std::string> lines{};
        // false when the last line is not newline-terminated
        bool trailing_newline{true};
    };

    struct splice_result {
        // 1-based index of the anchor line
        std::size_t anchor_line{};
        std::size_t line_count{};
    };

    // throws scaffold_error: file_not_found, io_failure
    std::string read_text_file(const std::filesystem::path& path);

    // throws scaffold_error: file_not_found, io_failure
    text_lines read_text_lines(const std::filesystem::path& path);

    // 0-based index of the first line containing `anchor` as a literal substring
    std::optional<std::size_t> find_anchor(const std::vector<std::string>& lines, std::string_view anchor);

    /*
     * Returns lines[0..k] ++ [new_line] ++ lines[k+1..] where k is the first line containing `anchor`.
     * Throws scaffold_error(anchor_not_found) when no line matches.
     */
    std::vector<std::string> splice_after(
            const std::vector<std::string>& lines, std::string_view anchor, std::string_view new_line);

    // Writes to a sibling temporary file and renames it over `path`; throws scaffold_error(io_failure)
    void write_text_lines_atomic(const std::filesystem::path& path, const text_lines& text);

    /*
     * Inserts `new_line` after the first line of `path` containing `anchor`, replacing the file atomically.
     * With `dry_run` the file is read and searched but never written.
     * The file is left untouched on any failure.
     */
    splice_result splice_file(
            const std::filesystem::path& path,
            std::string_view anchor,
            std::string_view new_line,
            bool dry_run = false);

}  // namespace dayinit
