#pragma once

int run_tekanim(int argc, char** argv);
int run_tekchop(int argc, char** argv);
