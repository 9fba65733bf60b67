//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <git2/status.h>
#include "RepoException.hpp"
#include "Status.hpp"

namespace {

struct FlagSet {
    unsigned int new_flag;
    unsigned int modified_flag;
    unsigned int deleted_flag;
    unsigned int renamed_flag;
    unsigned int typechange_flag;
};

const FlagSet index_flags = {GIT_STATUS_INDEX_NEW, GIT_STATUS_INDEX_MODIFIED, GIT_STATUS_INDEX_DELETED,
                             GIT_STATUS_INDEX_RENAMED, GIT_STATUS_INDEX_TYPECHANGE};

const FlagSet worktree_flags = {GIT_STATUS_WT_NEW, GIT_STATUS_WT_MODIFIED, GIT_STATUS_WT_DELETED,
                                GIT_STATUS_WT_RENAMED, GIT_STATUS_WT_TYPECHANGE};

void countRecord(unsigned int status, const FlagSet &flags, ChangeCounters &counters) {
    if(status & flags.new_flag) {
        counters.new_count++;
    } else if(status & flags.modified_flag) {
        counters.modified_count++;
    } else if(status & flags.deleted_flag) {
        counters.deleted_count++;
    } else if(status & (flags.renamed_flag | flags.typechange_flag)) {
        counters.modified_count++;
    }
    // Conflicted and ignored entries fall through uncounted.
}

}

ChangeCounters countIndexChanges(const std::vector<StatusRecord> &records) {
    ChangeCounters counters;
    for(const auto &record : records) {
        if(record.status == GIT_STATUS_CURRENT) {
            continue;
        }
        countRecord(record.status, index_flags, counters);
    }
    return counters;
}

ChangeCounters countWorktreeChanges(const std::vector<StatusRecord> &records) {
    ChangeCounters counters;
    for(const auto &record : records) {
        // An entry can exist purely because of the index side, in which case there is no workdir delta to count.
        if(record.status == GIT_STATUS_CURRENT || !record.has_workdir_delta) {
            continue;
        }
        countRecord(record.status, worktree_flags, counters);
    }
    return counters;
}

Status::Status(git_repository *repo) : m_status(NULL) {
    git_status_options options = GIT_STATUS_OPTIONS_INIT;
    options.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
    options.flags = GIT_STATUS_OPT_INCLUDE_UNTRACKED | GIT_STATUS_OPT_RECURSE_UNTRACKED_DIRS |
                    GIT_STATUS_OPT_EXCLUDE_SUBMODULES;
    checkError(git_status_list_new(&m_status, repo, &options), "Unable to read repository status");
}

Status::~Status() {
    git_status_list_free(m_status);
}

std::vector<StatusRecord> Status::records() const {
    auto num_entries = git_status_list_entrycount(m_status);
    std::vector<StatusRecord> records;
    records.reserve(num_entries);

    for(decltype(num_entries) i=0; i < num_entries; i++) {
        auto entry = git_status_byindex(m_status, i);
        records.push_back({static_cast<unsigned int>(entry->status), entry->index_to_workdir != NULL});
    }
    return records;
}

ChangeCounters Status::indexCounters() const {
    return countIndexChanges(records());
}

ChangeCounters Status::worktreeCounters() const {
    return countWorktreeChanges(records());
}
