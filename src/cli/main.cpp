#include "cli.hpp"

int main(int argc, char** argv) {
    depman::cli::Args args;
    if (auto code = depman::cli::parse_args(argc, argv, args)) {
        return *code;
    }
    return depman::cli::run(args);
}
