//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <spdlog/spdlog.h>
#include "App.hpp"
#include "Repo.hpp"

bool printPrompt(const Options &options, std::ostream &stream) {
    std::string line;
    try {
        auto repo = Repo(options.git_dir);
        line = repo.prompt(options.renderMode());
    }
    catch(const RepoException &e){
        spdlog::debug("{}", e.what());
        return false;
    }

    stream << line << "\n";
    return true;
}
