//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <stdexcept>
#include <string>

/// Any libgit2 failure while gathering the prompt.  The code is the libgit2 error code, or -1 when the failure was
/// detected by this tool rather than reported by libgit2.
class RepoException : public std::runtime_error {
public:
    RepoException(int code, const std::string &message) : std::runtime_error(message), m_code(code) {}
    explicit RepoException(const std::string &message) : RepoException(-1, message) {}

    int code() const { return m_code; }

private:
    int m_code;
};

/// Throws a RepoException if `error` is a libgit2 failure code.  The message is `context` followed by libgit2's last
/// error message, when there is one.
void checkError(int error, const std::string &context);
