//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <string>
#include "Color.hpp"
#include "Divergence.hpp"
#include "Status.hpp"

/// Renders `counters` as "+new ~modified -deleted" after a yellow `prefix`.  Returns an empty string when every
/// counter is zero.
std::string stringifyStatus(const ChangeCounters &counters, const std::string &prefix, Color color, RenderMode mode);

/// Builds the prompt line, without a trailing newline.
///
/// The segments are, in order, the branch, "↑ahead", "↓behind", the staged counts and the unstaged counts prefixed
/// with "| ".  Empty segments are dropped, the rest are separated by a single space and the whole thing is wrapped
/// in brackets, e.g.
///
///     [master ↑1 +2 ~1 -0 | +0 ~3 -1]
std::string composeSummary(const std::string &branch, const Divergence &divergence, const ChangeCounters &index,
                           const ChangeCounters &worktree, RenderMode mode);
