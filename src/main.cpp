#include <exception>
#include <iostream>

#include "wakeify/app/app.hpp"

int main(int argc, char** argv) {
    wakeify::app::Options options;
    try {
        options = wakeify::app::parse_options(argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        wakeify::app::print_usage(argv[0]);
        return 2;
    }
    return wakeify::app::run(options);
}
