// BADPATH Check - Command Line Interface
// Copyright (c) 2024 BADPATH Developers
// MIT License

#include <badpath/cli/check.h>

#include <iostream>

int main(int argc, char* argv[]) {
    return badpath::cli::AppMain(argc, argv, std::cout, std::cerr);
}
