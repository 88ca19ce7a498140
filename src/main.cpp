#include "apps/cli/Commands.hpp"

int main(int argc, char** argv) {
    cli::Args args;
    if (!cli::parse_args(argc, argv, args)) {
        cli::print_usage(argv[0]);
        return cli::EXIT_USAGE;
    }
    if (args.help) {
        cli::print_usage(argv[0]);
        return cli::EXIT_OK;
    }
    return cli::run(args);
}
