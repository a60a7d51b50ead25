/**
 * @file CodeGraderApp.hpp
 * @brief Command-line application class for CodeGrader.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "application/GraderServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace codegrader::app {

/**
 * @struct CommandLineOptions
 * @brief Parsed arguments of the codegrader executable.
 */
struct CommandLineOptions {
    std::vector<std::string> files;
    std::optional<std::string> topic;
    std::string studentName = "Anonymous";
    std::optional<std::string> assignmentCode;
    std::optional<std::string> callbackUrl;
    std::optional<std::string> configDir;
    bool statsOnly = false;
    bool showHelp = false;
};

/**
 * @class CodeGraderApp
 * @brief Wires the grading services and runs one batch from the command line.
 */
class CodeGraderApp {
public:
    ~CodeGraderApp();

    /**
     * @brief Parses argv.
     * @return std::nullopt (after printing the reason) on invalid arguments.
     */
    static std::optional<CommandLineOptions> ParseArguments(const std::vector<std::string>& args);

    static std::string Usage();

    /** @brief Loads configuration and builds the composition root. */
    bool Init(const std::optional<std::string>& configDir);

    /** @brief Grades the given files (or prints stats) and writes JSON to stdout. @return exit code. */
    int Run(const CommandLineOptions& options);

    /** @brief Drains background work and stops the reaper. Idempotent. */
    void Shutdown();

private:
    int printStats(const std::optional<std::string>& assignmentCode);

    infrastructure::GraderConfig m_config;
    application::GraderServices m_services;
    bool m_initialized = false;
};

} // namespace codegrader::app
