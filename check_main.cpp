#include "wfsdl/app.hpp"

int main(int argc, char** argv) {
    wfsdl::CheckApp app;
    return app.run(argc, argv);
}
