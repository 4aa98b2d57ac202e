#include "dayinit/scaffold.hpp"

#include "dayinit/error.hpp"
#include "dayinit/format.hpp"
#include "dayinit/registry.hpp"
#include "dayinit/splice.hpp"
#include "dayinit/utils.hpp"

#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
using namespace dayinit::literals;

namespace dayinit {

    namespace detail {

        static bool path_exists(const fs::path& path) {
            std::error_code ec{};
            auto exists = fs::exists(path, ec);
            if (ec) {
                throw scaffold_error{error_kind::io_failure, "failed to stat {}: {}"_format(path.string(), ec.message())};
            }
            return exists;
        }

        static void ensure_directory(const fs::path& dir) {
            std::error_code ec{};
            fs::create_directories(dir, ec);
            if (ec) {
                throw scaffold_error{
                        error_kind::io_failure, "failed to create directory {}: {}"_format(dir.string(), ec.message())};
            }
        }

        static void require_regular_file(const fs::path& path) {
            std::error_code ec{};
            if (!fs::is_regular_file(path, ec) || ec) {
                throw scaffold_error{error_kind::file_not_found, "no such file: {}"_format(path.string())};
            }
        }

        static void record(scaffold_report& report, file_action action, fs::path path) {
            report.steps.push_back(scaffold_step{action, std::move(path), std::nullopt});
        }

        static void touch_step(scaffold_report& report, const fs::path& path, bool dry_run) {
            if (dry_run) {
                record(report, path_exists(path) ? file_action::kept : file_action::created, path);
                return;
            }
            record(report, touch_file(path) ? file_action::created : file_action::kept, path);
        }

    }  // namespace detail

    day_paths make_day_paths(const startup_config& cfg, int day) {
        auto input_dir = input_root(cfg);
        auto src_dir = source_root(cfg);

        day_paths paths{};
        paths.input = input_dir / "day_{}.txt"_format(day);
        paths.example_input = input_dir / "day_{}_example.txt"_format(day);
        paths.empty_input = input_dir / empty_input_name;
        paths.template_source = template_path(cfg);
        paths.day_source = src_dir / "day_{}{}"_format(day, cfg.source_extension);
        paths.dispatch = dispatch_path(cfg);
        return paths;
    }

    bool touch_file(const fs::path& path) {
        if (detail::path_exists(path)) {
            std::error_code ec{};
            if (fs::is_directory(path, ec)) {
                throw scaffold_error{error_kind::io_failure, "cannot touch directory {}"_format(path.string())};
            }
            return false;
        }

        std::ofstream out{path, std::ios::binary | std::ios::app};
        if (!out) {
            throw scaffold_error{error_kind::io_failure, "failed to create {}"_format(path.string())};
        }
        return true;
    }

    bool copy_template(const fs::path& from, const fs::path& to) {
        detail::require_regular_file(from);
        auto existed = detail::path_exists(to);

        std::error_code ec{};
        fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw scaffold_error{
                    error_kind::io_failure,
                    "failed to copy {} to {}: {}"_format(from.string(), to.string(), ec.message())};
        }
        return existed;
    }

    scaffold_report scaffold_day(const startup_config& cfg, int day) {
        if (day <= 0) {
            throw scaffold_error{error_kind::invalid_argument, "invalid day: {} (expected a positive integer)"_format(day)};
        }

        auto paths = make_day_paths(cfg, day);

        scaffold_report report{};
        report.day = day;
        report.dry_run = cfg.dry_run;
        report.anchor = cfg.anchor_override ? *cfg.anchor_override : anchor_text(day);
        report.entry = entry_text(cfg.entry_indent, day);

        debug_log("scaffolding day ", day, " (anchor '", report.anchor, "')");

        if (!cfg.dry_run) {
            detail::ensure_directory(input_root(cfg));
        }

        detail::touch_step(report, paths.input, cfg.dry_run);
        detail::touch_step(report, paths.example_input, cfg.dry_run);
        if (cfg.create_empty_input) {
            detail::touch_step(report, paths.empty_input, cfg.dry_run);
        }

        bool overwrote{false};
        if (cfg.dry_run) {
            detail::require_regular_file(paths.template_source);
            overwrote = detail::path_exists(paths.day_source);
        }
        else {
            overwrote = copy_template(paths.template_source, paths.day_source);
        }
        report.steps.push_back(scaffold_step{
                overwrote ? file_action::overwritten : file_action::copied, paths.day_source, paths.template_source});

        auto spliced = splice_file(paths.dispatch, report.anchor, report.entry, cfg.dry_run);
        report.anchor_line = spliced.anchor_line;
        report.dispatch_line_count = spliced.line_count;
        detail::record(report, file_action::registered, paths.dispatch);

        return report;
    }

    std::vector<int> list_registered_days(const startup_config& cfg) {
        return registered_days(read_text_lines(dispatch_path(cfg)).lines);
    }

    int next_unregistered_day(const startup_config& cfg) {
        return next_day(read_text_lines(dispatch_path(cfg)).lines);
    }

}  // namespace dayinit
