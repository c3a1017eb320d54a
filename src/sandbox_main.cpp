//
// Copyright (c) 2024-2025 JLGxy
//

#include "sandbox.h"

// Started by PosixRunner only: request on stdin, result on fd 3.
int main() { return arena::sandbox_main(); }
