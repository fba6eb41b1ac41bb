#include "app/LocalScribeApp.hpp"

#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    localscribe::app::LocalScribeApp app;
    return app.Run(args);
}
