//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <string>

#include <git2/types.h>

/// Shown in place of a branch name when HEAD is unborn or missing.
extern const char * const NO_BRANCH_NAME;

struct BranchResolution {
    enum class Outcome {RESOLVED, NO_BRANCH, FAILED};

    Outcome outcome = Outcome::NO_BRANCH;
    std::string name;
    int error_code = 0;
    std::string error_message;

    std::string displayName() const;
};

BranchResolution resolveBranch(git_repository * repo);
