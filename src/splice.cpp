#include "dayinit/splice.hpp"

#include "dayinit/format.hpp"
#include "dayinit/utils.hpp"

extern "C" {
#include <fcntl.h>
#include <unistd.h>
}

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
using namespace dayinit::literals;

namespace dayinit {

    namespace detail {

        struct temp_file_guard {
            fs::path path{};
            bool committed{false};

            explicit temp_file_guard(fs::path p) : path{std::move(p)} {}

            temp_file_guard(const temp_file_guard&) = delete;
            temp_file_guard& operator=(const temp_file_guard&) = delete;

            ~temp_file_guard() {
                if (committed) {
                    return;
                }
                std::error_code ec{};
                fs::remove(path, ec);
            }
        };

        static fs::path make_temp_sibling(const fs::path& path) {
            auto name = ".{}.dayinit-{}.tmp"_format(path.filename().string(), static_cast<long>(::getpid()));
            return path.parent_path() / name;
        }

        static void sync_to_disk(const fs::path& path) {
            int fd = ::open(path.c_str(), O_RDONLY);
            if (fd < 0) {
                throw scaffold_error{error_kind::io_failure, "failed to open {} for sync"_format(path.string())};
            }
            auto synced = ::fsync(fd) == 0;
            auto closed = ::close(fd) == 0;
            if (!synced || !closed) {
                throw scaffold_error{error_kind::io_failure, "failed to sync {}"_format(path.string())};
            }
        }

        static text_lines split_lines(std::string_view content) {
            text_lines text{};
            if (content.empty()) {
                return text;
            }

            text.trailing_newline = content.back() == '\n';
            if (text.trailing_newline) {
                content.remove_suffix(1U);
            }

            size_t start = 0U;
            while (true) {
                auto end = content.find('\n', start);
                if (end == std::string_view::npos) {
                    text.lines.emplace_back(content.substr(start));
                    break;
                }
                text.lines.emplace_back(content.substr(start, end - start));
                start = end + 1U;
            }
            return text;
        }

    }  // namespace detail

    std::string read_text_file(const fs::path& path) {
        std::error_code ec{};
        auto status = fs::status(path, ec);
        if (ec || !fs::exists(status)) {
            throw scaffold_error{error_kind::file_not_found, "no such file: {}"_format(path.string())};
        }
        if (!fs::is_regular_file(status)) {
            throw scaffold_error{error_kind::file_not_found, "not a regular file: {}"_format(path.string())};
        }

        std::ifstream in{path, std::ios::binary};
        if (!in) {
            throw scaffold_error{error_kind::io_failure, "failed to open {}"_format(path.string())};
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw scaffold_error{error_kind::io_failure, "failed to read {}"_format(path.string())};
        }
        return ss.str();
    }

    text_lines read_text_lines(const fs::path& path) {
        return detail::split_lines(read_text_file(path));
    }

    std::optional<std::size_t> find_anchor(const std::vector<std::string>& lines, std::string_view anchor) {
        auto it = std::ranges::find_if(
                lines, [anchor](const std::string& line) { return line.find(anchor) != std::string::npos; });
        if (it == lines.end()) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(std::distance(lines.begin(), it));
    }

    std::vector<std::string> splice_after(
            const std::vector<std::string>& lines, std::string_view anchor, std::string_view new_line) {
        auto index = find_anchor(lines, anchor);
        if (!index) {
            throw scaffold_error{error_kind::anchor_not_found, "no line contains '{}'"_format(anchor)};
        }

        std::vector<std::string> out{};
        out.reserve(lines.size() + 1U);
        out.insert(out.end(), lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(*index + 1U));
        out.emplace_back(new_line);
        out.insert(out.end(), lines.begin() + static_cast<std::ptrdiff_t>(*index + 1U), lines.end());
        return out;
    }

    void write_text_lines_atomic(const fs::path& path, const text_lines& text) {
        detail::temp_file_guard temp{detail::make_temp_sibling(path)};

        {
            std::ofstream out{temp.path, std::ios::binary | std::ios::trunc};
            if (!out) {
                throw scaffold_error{error_kind::io_failure, "failed to open {}"_format(temp.path.string())};
            }
            for (size_t i = 0U; i < text.lines.size(); ++i) {
                out << text.lines[i];
                if (i + 1U < text.lines.size() || text.trailing_newline) {
                    out << '\n';
                }
            }
            out.flush();
            if (!out) {
                throw scaffold_error{error_kind::io_failure, "failed to write {}"_format(temp.path.string())};
            }
        }

        // data must reach the disk before the rename makes it visible
        detail::sync_to_disk(temp.path);

        std::error_code ec{};
        if (fs::exists(path, ec) && !ec) {
            auto perms = fs::status(path, ec).permissions();
            if (!ec) {
                fs::permissions(temp.path, perms, ec);
            }
            if (ec) {
                throw scaffold_error{
                        error_kind::io_failure,
                        "failed to carry permissions of {}: {}"_format(path.string(), ec.message())};
            }
        }

        fs::rename(temp.path, path, ec);
        if (ec) {
            throw scaffold_error{error_kind::io_failure, "failed to replace {}: {}"_format(path.string(), ec.message())};
        }
        temp.committed = true;
    }

    splice_result splice_file(const fs::path& path, std::string_view anchor, std::string_view new_line, bool dry_run) {
        auto text = read_text_lines(path);

        auto index = find_anchor(text.lines, anchor);
        if (!index) {
            throw scaffold_error{error_kind::anchor_not_found, "no line in {} contains '{}'"_format(path.string(), anchor)};
        }
        debug_log("anchor '", anchor, "' found at line ", *index + 1U, " of ", path.string());

        splice_result result{};
        result.anchor_line = *index + 1U;

        if (dry_run) {
            result.line_count = text.lines.size() + 1U;
            return result;
        }

        text.lines = splice_after(text.lines, anchor, new_line);
        result.line_count = text.lines.size();
        write_text_lines_atomic(path, text);
        return result;
    }

}  // namespace dayinit
