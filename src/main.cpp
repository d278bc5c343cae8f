#include "stlmeta/Analyzer.hpp"
#include "stlmeta/EnvironmentHandler.hpp"
#include "stlmeta/Logger.hpp"

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    std::string path = argc == 2 ? argv[1] : "";
    if (path.size() < 4 || path.substr(path.size() - 4) != ".stl") {
        std::cerr << "format: stlmeta <filename.stl>" << std::endl;
        return 1;
    }

    try {
        auto& env = stlmeta::EnvironmentHandler::instance();
        env.init();
        stlmeta::Logger::setLevel(env.getLogLevel());

        std::cout << stlmeta::Analyzer::run(path, env.getReportFormat());
    } catch (const std::exception& e) {
        stlmeta::Logger::error(e.what());
        return 1;
    }
    return 0;
}
