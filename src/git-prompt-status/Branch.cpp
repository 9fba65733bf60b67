//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <git2/errors.h>
#include <git2/refs.h>
#include <git2/repository.h>
#include "Branch.hpp"

const char * const NO_BRANCH_NAME = "no branch";

std::string BranchResolution::displayName() const {
    if(outcome == Outcome::RESOLVED) {
        return name;
    }
    return NO_BRANCH_NAME;
}

BranchResolution resolveBranch(git_repository *repo) {
    BranchResolution resolution;
    git_reference * head = NULL;
    auto error = git_repository_head(&head, repo);

    if(error == GIT_EUNBORNBRANCH || error == GIT_ENOTFOUND) {
        resolution.outcome = BranchResolution::Outcome::NO_BRANCH;
        return resolution;
    }

    if(error < 0) {
        resolution.outcome = BranchResolution::Outcome::FAILED;
        resolution.error_code = error;
        auto last_error = git_error_last();
        if(last_error != NULL && last_error->message != NULL) {
            resolution.error_message = last_error->message;
        } else {
            resolution.error_message = "Unable to resolve HEAD";
        }
        return resolution;
    }

    // A detached HEAD is still a reference, its shorthand is just "HEAD".
    auto shorthand = git_reference_shorthand(head);
    if(shorthand != NULL) {
        resolution.outcome = BranchResolution::Outcome::RESOLVED;
        resolution.name = shorthand;
    }

    git_reference_free(head);
    return resolution;
}
