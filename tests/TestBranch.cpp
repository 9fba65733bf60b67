//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <catch2/catch.hpp>
#include <Branch.hpp>
#include <Repo.hpp>
#include "RepoBuilder.hpp"
#include "TempDirectory.hpp"
#include "TempRepo.hpp"

TEST_CASE_METHOD(TempRepo, "Test branch of fresh clone") {
    auto resolution = resolveBranch(m_repo);

    REQUIRE(resolution.outcome == BranchResolution::Outcome::RESOLVED);
    REQUIRE(resolution.name == "master");
    REQUIRE(resolution.displayName() == "master");
}

TEST_CASE_METHOD(TempRepo, "Test local branch name") {
    branch("local_branch");

    auto resolution = resolveBranch(m_repo);

    REQUIRE(resolution.outcome == BranchResolution::Outcome::RESOLVED);
    REQUIRE(resolution.displayName() == "local_branch");
}

TEST_CASE_METHOD(TempRepo, "Test detached head uses the reference shorthand") {
    detach();

    auto resolution = resolveBranch(m_repo);

    REQUIRE(resolution.outcome == BranchResolution::Outcome::RESOLVED);
    REQUIRE(resolution.displayName() == "HEAD");
}

TEST_CASE("Test unborn branch has no branch") {
    auto path = TempDirectory::TempDir("unborn_branch");
    auto builder = RepoBuilder(path.string());

    auto resolution = resolveBranch(builder.get());

    REQUIRE(resolution.outcome == BranchResolution::Outcome::NO_BRANCH);
    REQUIRE(resolution.displayName() == "no branch");
}

TEST_CASE("Test repo branch name of unborn branch") {
    auto path = TempDirectory::TempDir("repo_unborn_branch");
    auto builder = RepoBuilder(path.string());

    auto repo = Repo(path.string());

    REQUIRE(repo.branchName() == "no branch");
}

TEST_CASE("Test failed resolution has no branch display name") {
    BranchResolution resolution;
    resolution.outcome = BranchResolution::Outcome::FAILED;
    resolution.error_code = -1;
    resolution.error_message = "broken";

    REQUIRE(resolution.displayName() == "no branch");
}

TEST_CASE_METHOD(TempRepo, "Test corrupt branch reference fails") {
    writeFile(".git/refs/heads/master", "garbage\n");

    auto resolution = resolveBranch(m_repo);

    REQUIRE(resolution.outcome == BranchResolution::Outcome::FAILED);
    REQUIRE(resolution.error_code < 0);
    REQUIRE(resolution.displayName() == "no branch");
}

TEST_CASE_METHOD(TempRepo, "Test repo branch name of corrupt branch reference throws") {
    writeFile(".git/refs/heads/master", "garbage\n");

    auto repo = Repo(m_dir.string());

    REQUIRE_THROWS_AS(repo.branchName(), RepoException);
}
