//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#pragma once

#include <ostream>
#include "Options.hpp"

/// Writes the prompt line for `options` to `stream`.
///
/// Repository failures are logged at debug level and nothing at all is written, a prompt is better off empty than
/// broken.  Returns whether a line was written.
bool printPrompt(const Options &options, std::ostream &stream);
