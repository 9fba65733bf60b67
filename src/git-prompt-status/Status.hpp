//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <vector>

#include <git2/types.h>
#include <git2/status.h>

/// The parts of a `git_status_entry` the counters care about.
struct StatusRecord {
    unsigned int status;
    bool has_workdir_delta;
};

struct ChangeCounters {
    int new_count = 0;
    int modified_count = 0;
    int deleted_count = 0;

    bool empty() const { return new_count == 0 && modified_count == 0 && deleted_count == 0; }
};

inline bool operator==(const ChangeCounters &lhs, const ChangeCounters &rhs) {
    return lhs.new_count == rhs.new_count && lhs.modified_count == rhs.modified_count &&
           lhs.deleted_count == rhs.deleted_count;
}

/// Counts staged changes.  Each non current record lands in at most one counter, checked in the order new, modified,
/// deleted, renamed, type change.  Renames and type changes count as modified.
ChangeCounters countIndexChanges(const std::vector<StatusRecord> &records);

/// Counts unstaged changes with the same ordering as countIndexChanges(), using the working tree flags.  Records
/// without an index to workdir delta are skipped.
ChangeCounters countWorktreeChanges(const std::vector<StatusRecord> &records);

class Status {
public:
    Status(git_repository * repo);
    ~Status();

    Status(const Status &) = delete;
    Status &operator=(const Status &) = delete;

    std::vector<StatusRecord> records() const;

    ChangeCounters indexCounters() const;

    ChangeCounters worktreeCounters() const;

private:
    git_status_list *m_status;
};
