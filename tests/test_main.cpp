#include <catch2/catch_session.hpp>
#include "../include/Logger.h"

int main(int argc, char* argv[]) {
    // Quiet unless LOG_LEVEL asks for output
    Logger::getInstance().initFromEnvironment(LogLevel::NONE);

    int result = Catch::Session().run(argc, argv);

    Logger::getInstance().close();
    return result;
}
