#pragma once

namespace quorumsig::cli
{
    /** Parse arguments and run the selected subcommand. Returns the process exit code. */
    int run(int argc, char *argv[]);
}
