//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <catch2/catch.hpp>
#include <Divergence.hpp>
#include <Repo.hpp>
#include "RepoBuilder.hpp"
#include "TempDirectory.hpp"
#include "TempRepo.hpp"

TEST_CASE_METHOD(TempRepo, "Test up to date with upstream") {
    auto divergence = computeDivergence(m_repo);

    REQUIRE(divergence.ahead == 0);
    REQUIRE(divergence.behind == 0);
}

TEST_CASE_METHOD(TempRepo, "Test 1 commit ahead") {
    commit();

    auto divergence = computeDivergence(m_repo);

    REQUIRE(divergence.ahead == 1);
    REQUIRE(divergence.behind == 0);
}

TEST_CASE_METHOD(TempRepo, "Test 2 commits behind") {
    resetHard("HEAD~2");

    auto divergence = computeDivergence(m_repo);

    REQUIRE(divergence.ahead == 0);
    REQUIRE(divergence.behind == 2);
}

TEST_CASE_METHOD(TempRepo, "Test diverged from upstream") {
    resetHard("HEAD~1");
    commit();
    commit();
    commit();

    auto divergence = computeDivergence(m_repo);

    REQUIRE(divergence.ahead == 3);
    REQUIRE(divergence.behind == 1);
}

TEST_CASE_METHOD(TempRepo, "Test no upstream throws") {
    branch("local_branch");

    REQUIRE_THROWS_AS(computeDivergence(m_repo), RepoException);
}

TEST_CASE_METHOD(TempRepo, "Test repo divergence without upstream is zero") {
    branch("local_branch");
    commit();

    auto repo = Repo(m_dir.string());
    auto divergence = repo.divergence();

    REQUIRE(divergence.ahead == 0);
    REQUIRE(divergence.behind == 0);
}

TEST_CASE("Test repo divergence of unborn branch is zero") {
    auto path = TempDirectory::TempDir("divergence_unborn_branch");
    auto builder = RepoBuilder(path.string());

    auto repo = Repo(path.string());
    auto divergence = repo.divergence();

    REQUIRE(divergence.ahead == 0);
    REQUIRE(divergence.behind == 0);
}
