#pragma once

namespace gitsaga::cli {

// argv[0] is the command name itself
using command_fn = int (*)(int argc, char **argv);

} // namespace gitsaga::cli
