//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <sstream>
#include <vector>
#include "Summary.hpp"

std::string stringifyStatus(const ChangeCounters &counters, const std::string &prefix, Color color, RenderMode mode) {
    if(counters.empty()) {
        return "";
    }

    std::stringstream counts;
    counts << "+" << counters.new_count << " ~" << counters.modified_count << " -" << counters.deleted_count;
    return formatColor(prefix, Color::YELLOW, mode) + formatColor(counts.str(), color, mode);
}

std::string composeSummary(const std::string &branch, const Divergence &divergence, const ChangeCounters &index,
                           const ChangeCounters &worktree, RenderMode mode) {
    std::vector<std::string> segments;
    segments.push_back(formatColor(branch, Color::BLUE, mode));
    if(divergence.ahead > 0) {
        segments.push_back(formatColor("↑" + std::to_string(divergence.ahead), Color::GREEN, mode));
    }
    if(divergence.behind > 0) {
        segments.push_back(formatColor("↓" + std::to_string(divergence.behind), Color::RED, mode));
    }
    segments.push_back(stringifyStatus(index, "", Color::GREEN, mode));
    segments.push_back(stringifyStatus(worktree, "| ", Color::RED, mode));

    std::stringstream stream;
    stream << formatColor("[", Color::YELLOW, mode);
    bool first = true;
    for(const auto &segment : segments) {
        if(segment.empty()) {
            continue;
        }
        if(!first) {
            stream << " ";
        }
        stream << segment;
        first = false;
    }
    stream << formatColor("]", Color::YELLOW, mode);
    return stream.str();
}
