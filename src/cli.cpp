#include "dayinit/cli.hpp"

#include "dayinit/error.hpp"
#include "dayinit/format.hpp"
#include "dayinit/registry.hpp"
#include "dayinit/scaffold.hpp"
#include "dayinit/settings.hpp"
#include "dayinit/splice.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
using namespace dayinit::literals;

namespace dayinit::cli {

    namespace detail {

        using namespace std::string_view_literals;

        static void print_config(const startup_config& cfg, std::ostream& os) {
            os << "root=" << cfg.root.string() << '\n';
            os << "input_dir=" << input_root(cfg).string() << '\n';
            os << "src_dir=" << source_root(cfg).string() << '\n';
            os << "template=" << template_path(cfg).string() << '\n';
            os << "dispatch=" << dispatch_path(cfg).string() << '\n';
            os << "source_extension=" << cfg.source_extension << '\n';
            os << "entry_indent=\"" << cfg.entry_indent << "\"\n";
            os << "create_empty_input=" << (cfg.create_empty_input ? "true" : "false") << '\n';
            if (auto settings = find_settings_file(cfg)) {
                os << "config=" << settings->string() << '\n';
            }
            else {
                os << "config=<none>\n";
            }
        }

        static void print_report(const scaffold_report& report, const startup_config& cfg, std::ostream& os) {
            if (cfg.quiet) {
                return;
            }

            auto prefix = report.dry_run ? "[dry-run] "sv : ""sv;
            for (const auto& step : report.steps) {
                switch (step.action) {
                    case file_action::created:
                    case file_action::kept:
                        os << prefix << to_string(step.action) << ' ' << step.path.string() << '\n';
                        break;
                    case file_action::copied:
                    case file_action::overwritten:
                        os << prefix << to_string(step.action) << ' '
                           << (step.source ? step.source->string() : std::string{"<template>"}) << " -> "
                           << step.path.string() << '\n';
                        break;
                    case file_action::registered:
                        os << prefix << "registered day " << report.day << " in " << step.path.string()
                           << " after line " << report.anchor_line << '\n';
                        break;
                }
            }

            if (cfg.verbose) {
                os << "anchor=\"" << report.anchor << "\"\n";
                os << "entry=\"" << report.entry << "\"\n";
                os << "dispatch_lines=" << report.dispatch_line_count << '\n';
            }
        }

        static void print_days(const std::vector<int>& days, const startup_config& cfg, std::ostream& os) {
            for (auto day : days) {
                os << day << '\n';
            }
            if (cfg.verbose) {
                std::vector<std::string> labels{};
                labels.reserve(days.size());
                for (auto day : days) {
                    labels.push_back(std::to_string(day));
                }
                os << "registered: " << utils::join_with_separator(labels, ", "sv) << '\n';
            }
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"dayinit: scaffold input files, source file and dispatch entry for a puzzle day"};

        bool show_version = false;
        std::string day_arg{};
        std::string root_arg{cfg.root.string()};
        std::string input_dir_arg{};
        std::string src_dir_arg{};
        std::string template_arg{};
        std::string dispatch_arg{};
        std::string ext_arg{};
        std::string config_arg{};
        std::string after_arg{};

        app.add_option("day", day_arg, "Day to scaffold (positive integer)");
        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--root", root_arg, "Puzzle repository root");
        app.add_option("--input-dir", input_dir_arg, "Input directory (relative to --root)");
        app.add_option("--src-dir", src_dir_arg, "Source directory (relative to --root)");
        app.add_option("--template", template_arg, "Template source (relative to --src-dir)");
        app.add_option("--dispatch", dispatch_arg, "Dispatch file (relative to --src-dir)");
        app.add_option("--ext", ext_arg, "Extension of generated day sources");
        app.add_option("--config", config_arg, "JSON settings file (default: <root>/dayinit.json)");
        app.add_option("--after", after_arg, "Insert after the first line containing this text instead of 'day <N-1>'");
        app.add_flag("--no-empty-input", "Do not create <input-dir>/empty.txt");
        app.add_flag("--next", cfg.next_day, "Scaffold one past the highest registered day");
        app.add_flag("--list", cfg.list_days, "Print registered days and exit");
        app.add_flag("-n,--dry-run", cfg.dry_run, "Report what would change without writing");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--write-config", cfg.write_config, "Write the resolved layout to the settings file and exit");
        app.add_flag("-q,--quiet", cfg.quiet, "Suppress non-essential output");
        app.add_flag("-v,--verbose", cfg.verbose, "Enable verbose output");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "dayinit 0.1.0\n";
            return std::optional<int>{0};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        cfg.root = root_arg;
        if (!config_arg.empty()) {
            cfg.config_file = fs::path{config_arg};
        }

        // settings file first, explicit flags override it; --write-config may target a file not yet created
        if (auto settings = find_settings_file(cfg)) {
            std::error_code ec{};
            auto missing = !fs::exists(*settings, ec) && !ec;
            if (!(cfg.write_config && missing)) {
                debug_log("loading settings from ", settings->string());
                apply_settings_file(*settings, cfg);
            }
        }

        if (app.get_option("--input-dir")->count() > 0U) {
            cfg.input_dir = input_dir_arg;
        }
        if (app.get_option("--src-dir")->count() > 0U) {
            cfg.src_dir = src_dir_arg;
        }
        if (app.get_option("--template")->count() > 0U) {
            cfg.template_file = template_arg;
        }
        if (app.get_option("--dispatch")->count() > 0U) {
            cfg.dispatch_file = dispatch_arg;
        }
        if (app.get_option("--ext")->count() > 0U) {
            cfg.source_extension = ext_arg;
        }
        if (app.get_option("--after")->count() > 0U) {
            if (after_arg.empty()) {
                std::cerr << "--after requires non-empty text\n";
                return std::optional<int>{2};
            }
            cfg.anchor_override = after_arg;
        }
        if (app.get_option("--no-empty-input")->count() > 0U) {
            cfg.create_empty_input = false;
        }

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        if (cfg.write_config) {
            auto path = cfg.config_file ? *cfg.config_file : (cfg.root / default_settings_file).lexically_normal();
            write_settings_file(cfg, path);
            if (!cfg.quiet) {
                std::cout << "wrote " << path.string() << '\n';
            }
            return std::optional<int>{0};
        }

        auto has_day = app.get_option("day")->count() > 0U;
        auto modes = static_cast<int>(has_day) + static_cast<int>(cfg.next_day) + static_cast<int>(cfg.list_days);
        if (modes == 0) {
            std::cerr << "missing day (or --next / --list)\n";
            std::cerr << app.help();
            return std::optional<int>{2};
        }
        if (modes > 1) {
            std::cerr << "day, --next and --list are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (has_day) {
            int day{};
            if (!try_parse_day(day_arg, day)) {
                std::cerr << "invalid day: " << day_arg << " (expected a positive integer)\n";
                return std::optional<int>{2};
            }
            cfg.day = day;
        }

        return std::nullopt;
    }

    int run(const startup_config& cfg, std::ostream& out) {
        if (cfg.list_days) {
            detail::print_days(list_registered_days(cfg), cfg, out);
            return 0;
        }

        auto day = cfg.day;
        if (cfg.next_day) {
            day = next_unregistered_day(cfg);
            if (cfg.verbose) {
                out << "next day is " << *day << '\n';
            }
        }
        if (!day) {
            throw scaffold_error{error_kind::invalid_argument, "no day to scaffold"};
        }

        auto report = scaffold_day(cfg, *day);
        detail::print_report(report, cfg, out);
        return 0;
    }

}  // namespace dayinit::cli
