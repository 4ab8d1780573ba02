#include <iostream>
#include <string>
#include <vector>

#include "../game/app/ScxApp.h"
#include "../game/meta/ScoxConfig.h"

int main(int argc, char** argv) {
    Insmv::ScxApp app(Insmv::Meta::scoxHome(), std::cout);
    if (!app.initialize()) {
        return 1;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    return app.run(args);
}
