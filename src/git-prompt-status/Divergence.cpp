//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <git2/graph.h>
#include <git2/object.h>
#include <git2/refs.h>
#include <git2/revparse.h>
#include "Divergence.hpp"
#include "RepoException.hpp"

Divergence computeDivergence(git_repository *repo) {
    git_object * head = NULL;
    checkError(git_revparse_single(&head, repo, "HEAD"), "Unable to resolve HEAD");

    git_object * upstream = NULL;
    git_reference * upstream_ref = NULL;
    auto error = git_revparse_ext(&upstream, &upstream_ref, repo, "@{u}");
    if(error < 0) {
        git_object_free(head);
        checkError(error, "Unable to resolve upstream");
    }

    Divergence divergence;
    error = git_graph_ahead_behind(&divergence.ahead, &divergence.behind, repo, git_object_id(head),
                                   git_object_id(upstream));

    git_reference_free(upstream_ref);
    git_object_free(upstream);
    git_object_free(head);

    checkError(error, "Unable to compare HEAD with upstream");
    return divergence;
}
