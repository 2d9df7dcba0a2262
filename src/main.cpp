#include "config.hpp"
#include "dispatcher.hpp"
#include "process.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) try {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto config = chitin::Config::load();
    chitin::PosixProcessRunner runner;
    chitin::Dispatcher dispatcher(config, runner);

    int rc = dispatcher.handle(args);
    std::cout.flush();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
}
