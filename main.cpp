#include "keel/Cli.hpp"
#include "keel/Console.hpp"
#include "keel/Errors.hpp"

#include <clocale>
#include <cstdlib>
#include <iostream>
#include <unistd.h>

#ifndef KEEL_LOCALEDIR
#define KEEL_LOCALEDIR "/usr/share/locale"
#endif

int main(const int argc, char **argv) {
    std::setlocale(LC_ALL, "");
    bindtextdomain("keel", KEEL_LOCALEDIR);
    textdomain("keel");

    const bool color = keel::Console::is_terminal(STDOUT_FILENO) && std::getenv("NO_COLOR") == nullptr;
    return keel::run_cli(argc, argv, std::cout, std::cerr, color);
}
