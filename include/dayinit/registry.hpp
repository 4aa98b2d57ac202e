#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace dayinit {

    // Day number of a registration line ("    day 12" -> 12), or 0 when the line is not one
    int registered_day(std::string_view line);

    // Every "day <N>" registration in file order
    std::vector<int> registered_days(const std::vector<std::string>& lines);

    // Highest registered day + 1, or 1 when nothing is registered; throws scaffold_error(invalid_argument) past INT_MAX
    int next_day(const std::vector<std::string>& lines);

    std::string anchor_text(int day);
    std::string entry_text(std::string_view indent, int day);

}  // namespace dayinit
