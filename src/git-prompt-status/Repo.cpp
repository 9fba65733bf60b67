//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <git2/buffer.h>
#include <git2/global.h>
#include <git2/repository.h>
#include <spdlog/spdlog.h>
#include "Branch.hpp"
#include "Repo.hpp"
#include "Status.hpp"
#include "Summary.hpp"

Repo::Repo(const std::string &path) : m_repo(NULL) {
    git_libgit2_init();

    git_buf repo_path_buffer = {0};
    auto error = git_repository_discover(&repo_path_buffer, path.c_str(), 0, NULL);
    if(error == 0) {
        error = git_repository_open(&m_repo, repo_path_buffer.ptr);
    }
    git_buf_dispose(&repo_path_buffer);

    if(error != 0) {
        git_libgit2_shutdown();
        throw RepoException(error, "fatal: not a git repository (or any of the parent directories): " + path);
    }

    if(git_repository_is_bare(m_repo)) {
        git_repository_free(m_repo);
        git_libgit2_shutdown();
        throw RepoException("Cannot report status on bare repository");
    }

    spdlog::debug("Opened repository {}", git_repository_path(m_repo));
}

Repo::~Repo(){
    git_repository_free(m_repo);
    git_libgit2_shutdown();
}

std::string Repo::prompt(RenderMode mode) {
    auto status = Status(m_repo);
    auto index = status.indexCounters();
    auto worktree = status.worktreeCounters();

    auto branch = branchName();
    auto ahead_behind = divergence();

    return composeSummary(branch, ahead_behind, index, worktree, mode);
}

std::string Repo::branchName() {
    auto resolution = resolveBranch(m_repo);
    switch(resolution.outcome) {
        case BranchResolution::Outcome::RESOLVED:
            return resolution.name;
        case BranchResolution::Outcome::NO_BRANCH:
            spdlog::debug("HEAD has no branch");
            return resolution.displayName();
        case BranchResolution::Outcome::FAILED:
            break;
    }
    throw RepoException(resolution.error_code, resolution.error_message);
}

Divergence Repo::divergence() {
    try {
        return computeDivergence(m_repo);
    }
    catch(const RepoException &e) {
        spdlog::debug("No divergence reported: {}", e.what());
    }
    return Divergence();
}

std::string Repo::toString() {
    return git_repository_commondir(m_repo);
}
