//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <cstddef>

#include <git2/types.h>

struct Divergence {
    size_t ahead = 0;
    size_t behind = 0;
};

/// Counts the commits between HEAD and its upstream (`@{u}`).
///
/// Throws a RepoException when either side can't be resolved, most often because the branch has no upstream.
Divergence computeDivergence(git_repository * repo);
