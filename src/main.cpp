#include "hourglass/cli/app.hpp"

int main(int argc, char** argv) {
    hourglass::cli::App app;
    return app.run(argc, argv);
}
