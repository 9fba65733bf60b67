//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <git2/errors.h>
#include "RepoException.hpp"

void checkError(int error, const std::string &context) {
    if(error >= 0) {
        return;
    }

    std::string message = context;
    auto last_error = git_error_last();
    if(last_error != NULL && last_error->message != NULL) {
        message += ": ";
        message += last_error->message;
    }
    throw RepoException(error, message);
}
