#include <iostream>
#include <string>
#include <vector>

#include "app/CodeGraderApp.hpp"

using namespace codegrader;

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto options = app::CodeGraderApp::ParseArguments(args);
    if (!options) {
        std::cerr << app::CodeGraderApp::Usage();
        return 64;
    }
    if (options->showHelp) {
        std::cout << app::CodeGraderApp::Usage();
        return 0;
    }
    if (options->files.empty() && !options->statsOnly) {
        std::cerr << "No input files." << std::endl << app::CodeGraderApp::Usage();
        return 64;
    }

    app::CodeGraderApp grader;
    if (!grader.Init(options->configDir)) {
        return 1;
    }
    int exitCode = grader.Run(*options);
    grader.Shutdown();
    return exitCode;
}
