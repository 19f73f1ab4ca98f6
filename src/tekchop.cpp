// tekchop.cpp
// MIT License (c) 2026 Pedro

#include "commands/commands.h"

int main(int argc, char** argv) {
    return run_tekchop(argc, argv);
}
