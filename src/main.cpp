#include "frontend/application.hpp"

#include <SDL.h>
#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
    retrohost::Application app;

    try {
        if (!app.initialize(argc, argv)) {
            app.shutdown();
            return 1;
        }

        if (app.is_running()) {
            app.run();
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        app.shutdown();
        return 1;
    }

    app.shutdown();
    return 0;
}
