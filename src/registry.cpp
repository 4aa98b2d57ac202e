#include "dayinit/registry.hpp"

#include "dayinit/error.hpp"
#include "dayinit/format.hpp"
#include "dayinit/utils.hpp"

#include <algorithm>
#include <limits>

using namespace dayinit::literals;

namespace dayinit {

    using namespace std::string_view_literals;

    int registered_day(std::string_view line) {
        constexpr auto keyword = "day"sv;

        auto text = utils::trim_view(line);
        if (!text.starts_with(keyword)) {
            return 0;
        }
        text.remove_prefix(keyword.size());
        if (text.empty() || (text.front() != ' ' && text.front() != '\t')) {
            return 0;
        }

        auto day = utils::parse_integer<int>(utils::trim_view(text));
        if (!day || *day <= 0) {
            return 0;
        }
        return *day;
    }

    std::vector<int> registered_days(const std::vector<std::string>& lines) {
        std::vector<int> days{};
        for (const auto& line : lines) {
            if (auto day = registered_day(line); day > 0) {
                days.push_back(day);
            }
        }
        return days;
    }

    int next_day(const std::vector<std::string>& lines) {
        auto days = registered_days(lines);
        if (days.empty()) {
            return 1;
        }
        auto highest = std::ranges::max(days);
        if (highest == std::numeric_limits<int>::max()) {
            throw scaffold_error{error_kind::invalid_argument, "no day follows day {}"_format(highest)};
        }
        return highest + 1;
    }

    std::string anchor_text(int day) {
        return "day {}"_format(day - 1);
    }

    std::string entry_text(std::string_view indent, int day) {
        return "{}day {}"_format(indent, day);
    }

}  // namespace dayinit
