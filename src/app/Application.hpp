#pragma once

#include "../config/ConversionConfig.hpp"
#include "../processing/CoordinateTypes.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class ConfigManager;

// Command-line front end: reads CSV or text, converts, writes CSV.
class Application
{
public:
    enum ExitCode
    {
        kExitOk = 0,
        kExitInvalidInput = 1,
        kExitIoFailure = 2
    };

    // Results go to out, summaries and errors to err
    Application(int argc, char** argv, std::ostream& out = std::cout, std::ostream& err = std::cerr);
    ~Application();

    int run();

private:
    struct CommandLine
    {
        std::string config_path = "config.toml";
        std::string input_path;
        std::string output_path;
        std::optional<std::string> mode;
        std::optional<std::string> latitude_column;
        std::optional<std::string> longitude_column;
        std::optional<std::string> combined_column;
        std::optional<std::string> latitude;
        std::optional<std::string> longitude;
        std::optional<int> precision;
        bool include_originals = false;
        bool show_dms = false;
        bool verbose = false;
    };

    // Returns an exit code when the program should stop right away (help, bad flags)
    std::optional<int> parseCommandLineArgs();
    bool initializeConfig();
    bool initializeLogging();

    int convertSinglePair();
    int convertBatch();

    bool writeOutput(const coordinates::ConversionReport& report);
    void printSummary(const coordinates::ConversionReport& report) const;
    void flushErrorReports() const;

    int argc_;
    char** argv_;
    std::ostream& out_;
    std::ostream& err_;
    CommandLine cli_;
    ConversionConfig settings_;
    std::unique_ptr<ConfigManager> config_;
};
