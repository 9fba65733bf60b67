//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include <algorithm>
#include <stdexcept>
#include "TempDirectory.hpp"
namespace fs = std::filesystem;

fs::path TempDirectory::s_intermediate_dir = fs::temp_directory_path();
fs::path TempDirectory::s_run_dir;

fs::path TempDirectory::TempDir(const fs::path &sub_dir) {
    auto temp_dir = s_run_dir / sub_dir;
    fs::create_directories(temp_dir);
    return temp_dir;
}

void TempDirectory::Increment(const std::string &base) {
    s_run_dir = s_intermediate_dir / (base + std::to_string(nextRunNumber(base)));
    fs::create_directories(s_run_dir);
}

void TempDirectory::SetIntermediateDir(const std::string &intermediate_dir) {
    s_intermediate_dir = fs::temp_directory_path() / intermediate_dir;
    fs::create_directories(s_intermediate_dir);
}

fs::path TempDirectory::GetFullBaseDir() {
    return s_run_dir;
}

int TempDirectory::nextRunNumber(const std::string &base) {
    int largest = 0;
    for(const auto &entry : fs::directory_iterator(s_intermediate_dir)) {
        auto name = entry.path().filename().string();
        if(!entry.is_directory() || name.rfind(base, 0) != 0) {
            continue;
        }
        try {
            largest = std::max(largest, std::stoi(name.substr(base.length())));
        }
        catch(const std::invalid_argument &){
            // Not one of ours, e.g. "base_extra".
        }
    }
    return largest + 1;
}
