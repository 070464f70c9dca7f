#include <iostream>

#include "console_app.hpp"

int main(int argc, char** argv) {
    return run_console_app(argc, argv, std::cin, std::cout, std::cerr);
}
