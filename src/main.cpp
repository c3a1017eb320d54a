//
// Copyright (c) 2024-2025 JLGxy
//

#include "arena_cli.h"

int main(int argc, char **argv) {
    arena::cli::CliHandler handler;
    return handler.run(argc, argv);
}
