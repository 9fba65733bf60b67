//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once


#include <git2/types.h>
#include <string>
#include "Color.hpp"
#include "Divergence.hpp"
#include "RepoException.hpp"

class Repo {
public:
    /// Opens the repository containing `path`, searching parent directories the way git does.  A plain open by path
    /// would only accept the top of the work tree or the `.git` directory itself.
    ///
    /// Throws a RepoException if no repository is found or if it is bare.
    Repo(const std::string &path);
    ~Repo();

    Repo(const Repo &) = delete;
    Repo &operator=(const Repo &) = delete;

    /// The full prompt line for the repository, without a trailing newline.
    std::string prompt(RenderMode mode=RenderMode::PLAIN);

    /// The current branch, or "no branch".  Throws a RepoException when HEAD can't be read for any reason other
    /// than being unborn or missing.
    std::string branchName();

    /// The divergence from upstream, or zeros when there is no upstream to compare against.
    Divergence divergence();

    std::string toString();

private:
    git_repository * m_repo;

};
