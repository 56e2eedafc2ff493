#include "wfsdl/app.hpp"

int main(int argc, char** argv) {
    wfsdl::FetchApp app;
    return app.run(argc, argv);
}
