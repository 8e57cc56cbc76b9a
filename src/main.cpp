#include "quorumsig/cli.hpp"

int main(int argc, char *argv[])
{
    return quorumsig::cli::run(argc, argv);
}
