#pragma once

#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dayinit {

    enum class file_action : uint8_t {
        created,
        kept,
        copied,
        overwritten,
        registered,
    };

    inline constexpr std::string_view to_string(file_action action) {
        switch (action) {
            case file_action::created:
                return "created"sv;
            case file_action::kept:
                return "kept"sv;
            case file_action::copied:
                return "copied"sv;
            case file_action::overwritten:
                return "overwrote"sv;
            case file_action::registered:
                return "registered"sv;
        }
        return "kept"sv;
    }

    struct day_paths {
        std::filesystem::path input{};
        std::filesystem::path example_input{};
        std::filesystem::path empty_input{};
        std::filesystem::path template_source{};
        std::filesystem::path day_source{};
        std::filesystem::path dispatch{};
    };

    day_paths make_day_paths(const startup_config& cfg, int day);

    struct scaffold_step {
        file_action action{file_action::kept};
        std::filesystem::path path{};
        // copy source for copied/overwritten
        std::optional<std::filesystem::path> source{};
    };

    struct scaffold_report {
        int day{};
        bool dry_run{false};
        std::string anchor{};
        std::string entry{};
        // 1-based line of the anchor in the dispatch file
        std::size_t anchor_line{};
        std::size_t dispatch_line_count{};
        std::vector<scaffold_step> steps{};
    };

    // Creates `path` empty when absent; an existing file is left as is. Returns true when created.
    bool touch_file(const std::filesystem::path& path);

    // Byte-for-byte copy that silently overwrites `to`. Returns true when `to` already existed.
    bool copy_template(const std::filesystem::path& from, const std::filesystem::path& to);

    /*
     * Scaffolds `day` under the layout in `cfg`, in order:
     *   touch <input>/day_<N>.txt and <input>/day_<N>_example.txt (and <input>/empty.txt),
     *   copy the template to <src>/day_<N><ext>,
     *   insert "<indent>day <N>" after the first dispatch line containing "day <N-1>" (or cfg.anchor_override).
     * Stops at the first failure; steps already done are not rolled back.
     * With cfg.dry_run nothing is written, but the template, dispatch file and anchor are still checked.
     */
    scaffold_report scaffold_day(const startup_config& cfg, int day);

    // Registered days of the configured dispatch file
    std::vector<int> list_registered_days(const startup_config& cfg);

    // One past the highest day registered in the configured dispatch file
    int next_unregistered_day(const startup_config& cfg);

}  // namespace dayinit
