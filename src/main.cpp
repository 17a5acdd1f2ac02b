#include "permsnap/app.hpp"

int main(int argc, char** argv) {
    permsnap::App app;
    return app.run(argc, argv);
}
