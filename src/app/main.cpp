#include "pathprobe/application.hpp"

int main(int argc, char* argv[]) {
    pathprobe::Application app;
    return app.run(argc, argv);
}
