#pragma once

#include <tsbase/cli/Options.hpp>

namespace tsbase::cli {

// Handles a parsed command line, usage errors included, and returns the
// process exit code.
int run(const Options& opt);

} // namespace tsbase::cli
