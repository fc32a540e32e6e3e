#include "dotenv/cli/app.hpp"

int main(int argc, char** argv) {
    dotenv::cli::App app;
    return app.run(argc, argv);
}
