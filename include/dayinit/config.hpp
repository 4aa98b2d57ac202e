#pragma once

#include "utils.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace dayinit {

    using namespace std::string_view_literals;

    /*
     * dayinit Startup Config Options
     *
     * Layout
     * - root: Puzzle repository root; relative input/src dirs resolve against it.
     * - input_dir: Directory holding day_<N>.txt and day_<N>_example.txt.
     * - src_dir: Directory holding the template, the dispatch file and day sources.
     * - template_file: Source copied to day_<N><source_extension> (relative to src_dir).
     * - dispatch_file: File listing every registered day (relative to src_dir).
     * - source_extension: Extension of generated day sources.
     * - entry_indent: Leading whitespace of an inserted "day <N>" line.
     * - create_empty_input: Also ensure <input_dir>/empty.txt, the runner's fallback input.
     *
     * Settings file
     * - config_file: Explicit JSON settings path; otherwise <root>/dayinit.json when present.
     *
     * Run
     * - day: Day to scaffold.
     * - anchor_override: Literal text to insert after instead of "day <N-1>".
     * - next_day: Scaffold one past the highest registered day.
     * - list_days: Print registered days and exit.
     * - dry_run: Validate and report without touching the filesystem.
     * - quiet/verbose: Coarse output verbosity knobs.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved startup config and exit.
     * - write_config: Persist the resolved layout to the settings file and exit.
     */

    inline constexpr auto default_settings_file = "dayinit.json"sv;
    inline constexpr auto empty_input_name = "empty.txt"sv;

    struct startup_config {
        std::filesystem::path root{"."};
        std::filesystem::path input_dir{"input"};
        std::filesystem::path src_dir{"src"};
        std::filesystem::path template_file{"template.rs"};
        std::filesystem::path dispatch_file{"main.rs"};
        std::string source_extension{".rs"};
        std::string entry_indent{"    "};
        bool create_empty_input{true};

        std::optional<std::filesystem::path> config_file{};

        std::optional<int> day{};
        std::optional<std::string> anchor_override{};
        bool next_day{false};
        bool list_days{false};
        bool dry_run{false};
        bool quiet{false};
        bool verbose{false};

        bool print_config{false};
        bool write_config{false};
    };

    // Accepts a plain positive decimal integer, nothing else
    inline constexpr bool try_parse_day(std::string_view text, int& out) {
        auto parsed = utils::parse_integer<int>(utils::trim_view(text));
        if (!parsed || *parsed <= 0) {
            return false;
        }
        out = *parsed;
        return true;
    }

    inline std::filesystem::path input_root(const startup_config& cfg) {
        return (cfg.root / cfg.input_dir).lexically_normal();
    }

    inline std::filesystem::path source_root(const startup_config& cfg) {
        return (cfg.root / cfg.src_dir).lexically_normal();
    }

    inline std::filesystem::path dispatch_path(const startup_config& cfg) {
        return (source_root(cfg) / cfg.dispatch_file).lexically_normal();
    }

    inline std::filesystem::path template_path(const startup_config& cfg) {
        return (source_root(cfg) / cfg.template_file).lexically_normal();
    }

}  // namespace dayinit
