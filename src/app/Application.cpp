#include "Application.hpp"

#include "../config/ConfigManager.hpp"
#include "../io/CsvTable.hpp"
#include "../processing/BatchConverter.hpp"
#include "../processing/CoordinateParser.hpp"
#include "../processing/Diagnostics.hpp"
#include "../processing/DmsFormatter.hpp"
#include "../processing/StageRunner.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include <CLI/CLI.hpp>
#include <plog/Log.h>

using coordinates::ColumnSelection;
using coordinates::ConversionReport;

namespace
{

std::string format_decimal(double value, int precision)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string read_all(std::istream& in)
{
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
        throw std::runtime_error("read failure");
    return text;
}

} // namespace

Application::Application(int argc, char** argv, std::ostream& out, std::ostream& err)
    : argc_(argc)
    , argv_(argv)
    , out_(out)
    , err_(err)
{
}

Application::~Application() = default;

int Application::run()
{
    if (auto exit_code = parseCommandLineArgs())
        return *exit_code;

    initializeConfig();

    // Without log files the conversion still runs; the reason is printed on exit
    if (!initializeLogging())
        PLOG_WARNING << "Logging to files is unavailable";

    int result = (cli_.latitude || cli_.longitude) ? convertSinglePair() : convertBatch();
    flushErrorReports();
    return result;
}

std::optional<int> Application::parseCommandLineArgs()
{
    CLI::App app{ "dmsconv - convert DMS coordinates to decimal degrees" };

    app.add_option("-c,--config", cli_.config_path, "Configuration file (default config.toml)");
    app.add_option("-i,--input", cli_.input_path, "Input CSV or text file, '-' or empty for stdin");
    app.add_option("-o,--output", cli_.output_path, "Output CSV file (default stdout)");
    app.add_option("-m,--mode", cli_.mode, "Input layout: columns, combined or text")
        ->check(CLI::IsMember({ "columns", "combined", "text" }));
    app.add_option("--lat-col", cli_.latitude_column, "Latitude column name");
    app.add_option("--lon-col", cli_.longitude_column, "Longitude column name");
    app.add_option("--combined-col", cli_.combined_column, "Column holding both coordinates");
    app.add_option("--lat", cli_.latitude, "Convert a single latitude (with --lon)");
    app.add_option("--lon", cli_.longitude, "Convert a single longitude (with --lat)");
    app.add_option("--precision", cli_.precision, "Decimal places in output")->check(CLI::Range(0, 12));
    app.add_flag("--originals", cli_.include_originals, "Include original text columns in output");
    app.add_flag("--dms", cli_.show_dms, "Echo single pair results in DMS notation");
    app.add_flag("-v,--verbose", cli_.verbose, "Trace pipeline stages to logs/conversion.log");

    try
    {
        app.parse(argc_, argv_);
    }
    catch (const CLI::ParseError& e)
    {
        // --help and --version exit with 0, anything else is a usage error
        return app.exit(e, out_, err_) == 0 ? kExitOk : kExitInvalidInput;
    }

    if (cli_.latitude.has_value() != cli_.longitude.has_value())
    {
        err_ << "Error: --lat and --lon must be given together." << std::endl;
        return kExitInvalidInput;
    }
    return std::nullopt;
}

bool Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>(cli_.config_path);
    settings_.registerWith(*config_);
    bool loaded = config_->load();

    if (cli_.mode)
    {
        if (auto mode = input_mode_from_string(*cli_.mode))
            settings_.mode = *mode;
    }
    if (cli_.latitude_column)
        settings_.latitude_column = *cli_.latitude_column;
    if (cli_.longitude_column)
        settings_.longitude_column = *cli_.longitude_column;
    if (cli_.combined_column)
        settings_.combined_column = *cli_.combined_column;
    if (cli_.precision)
        settings_.precision = *cli_.precision;
    if (cli_.include_originals)
        settings_.include_originals = true;
    if (cli_.verbose)
        settings_.verbose = true;

    processing::diagnostics::set_verbose(settings_.verbose);
    return loaded;
}

bool Application::initializeLogging()
{
    PROFILE_SCOPE_FUNCTION();

    auto level = static_cast<plog::Severity>(settings_.logging_level);
    if (settings_.verbose)
        level = std::max(level, plog::debug);

    if (!utils::LogManager::Initialize(settings_.append_logs, level))
        return false;

    bool ok = utils::LogManager::AddFileLogger<0>({ .filepath = "logs/run.log", .echo_to_stderr = cli_.verbose });
    ok = utils::LogManager::AddFileLogger<processing::diagnostics::kLogInstance>(
             { .filepath = "logs/conversion.log", .level = plog::debug }) &&
         ok;
#if DMSCONV_PROFILING_LEVEL >= 1
    ok = utils::LogManager::AddFileLogger<profiling::kProfilingLogInstance>(
             { .filepath = "logs/profiling.log", .level = plog::debug }) &&
         ok;
#endif

    if (ok)
    {
        PLOG_INFO << "dmsconv started, log level " << plog::severityToString(utils::LogManager::DefaultLevel());
        PLOG_INFO << "Configuration: mode=" << to_string(settings_.mode) << " precision=" << settings_.precision
                  << " originals=" << settings_.include_originals << " verbose=" << settings_.verbose;
    }
    return ok;
}

int Application::convertSinglePair()
{
    processing::CoordinateParser parser;
    auto lat = parser.parse(*cli_.latitude);
    auto lon = parser.parse(*cli_.longitude);

    for (const auto* result : { &lat, &lon })
    {
        if (!result->succeeded())
        {
            err_ << "Error converting input: " << result->error->reason << " (" << result->error->input << ")"
                 << std::endl;
        }
    }
    if (!lat.succeeded() || !lon.succeeded())
        return kExitInvalidInput;

    out_ << "[" << format_decimal(*lat.value, settings_.precision) << ", "
         << format_decimal(*lon.value, settings_.precision) << "]" << std::endl;
    if (cli_.show_dms)
    {
        out_ << processing::format_as_dms(*lat.value, coordinates::Axis::Latitude) << " "
             << processing::format_as_dms(*lon.value, coordinates::Axis::Longitude) << std::endl;
    }
    return kExitOk;
}

int Application::convertBatch()
{
    PROFILE_SCOPE_FUNCTION();

    auto input_stage = processing::run_stage<std::string>("read_input",
                                                          [&]()
                                                          {
                                                              if (cli_.input_path.empty() || cli_.input_path == "-")
                                                                  return read_all(std::cin);
                                                              std::ifstream ifs(cli_.input_path, std::ios::binary);
                                                              if (!ifs)
                                                                  throw std::runtime_error("cannot open " +
                                                                                           cli_.input_path);
                                                              return read_all(ifs);
                                                          });
    if (!input_stage.succeeded)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Input, "Could not read input",
                                          input_stage.error.value_or("unknown"));
        return kExitIoFailure;
    }

    ConversionReport report;
    if (settings_.mode == InputMode::Text)
    {
        auto convert_stage = processing::run_stage<ConversionReport>("convert_text",
                                                                     [&]()
                                                                     {
                                                                         return processing::convert_text(
                                                                             input_stage.result);
                                                                     });
        if (!convert_stage.succeeded)
            return kExitInvalidInput;
        report = std::move(convert_stage.result);
    }
    else
    {
        auto table_stage = processing::run_stage<io::Table>("parse_csv",
                                                            [&]()
                                                            {
                                                                io::Table table;
                                                                std::string error;
                                                                std::istringstream in(input_stage.result);
                                                                if (!io::read_csv(in, table, error))
                                                                    throw std::runtime_error(error);
                                                                return table;
                                                            });
        if (!table_stage.succeeded)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Input, "Input is not valid CSV",
                                              table_stage.error.value_or("unknown"));
            return kExitInvalidInput;
        }

        std::string column_error;
        auto selection = io::resolve_columns(table_stage.result.columns, settings_.selection(), column_error);
        if (!selection)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Input, "Input has no usable columns", column_error);
            return kExitInvalidInput;
        }
        if (selection->mode == ColumnSelection::Mode::CombinedColumn)
            PLOG_INFO << "Combined column: " << selection->combined_column;
        else
            PLOG_INFO << "Latitude column: " << selection->latitude_column
                      << ", longitude column: " << selection->longitude_column;

        auto convert_stage = processing::run_stage<ConversionReport>("convert_rows",
                                                                     [&]()
                                                                     {
                                                                         return processing::convert_rows(
                                                                             table_stage.result.rows, *selection);
                                                                     });
        if (!convert_stage.succeeded)
            return kExitInvalidInput;
        report = std::move(convert_stage.result);
    }

    if (!writeOutput(report))
        return kExitIoFailure;

    printSummary(report);
    return kExitOk;
}

bool Application::writeOutput(const ConversionReport& report)
{
    io::CsvWriteOptions options{ .include_originals = settings_.include_originals, .precision = settings_.precision };

    auto write_stage = processing::run_stage<bool>("write_output",
                                                   [&]()
                                                   {
                                                       if (cli_.output_path.empty() || cli_.output_path == "-")
                                                       {
                                                           io::write_report_csv(out_, report, options);
                                                           out_.flush();
                                                           return static_cast<bool>(out_);
                                                       }
                                                       std::ofstream ofs(cli_.output_path, std::ios::binary);
                                                       if (!ofs)
                                                           throw std::runtime_error("cannot create " +
                                                                                    cli_.output_path);
                                                       io::write_report_csv(ofs, report, options);
                                                       ofs.flush();
                                                       return static_cast<bool>(ofs);
                                                   });

    if (!write_stage.succeeded || !write_stage.result)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Output, "Could not write output",
                                          write_stage.error.value_or(cli_.output_path));
        return false;
    }
    return true;
}

void Application::printSummary(const ConversionReport& report) const
{
    if (report.rows.empty() && report.errors.empty())
    {
        err_ << "No coordinates detected. Please check your input format." << std::endl;
        return;
    }

    err_ << "Conversion complete! " << report.rows.size() << " coordinates converted, " << report.errors.size()
              << " errors";
    if (report.skipped > 0)
        err_ << ", " << report.skipped << " lines without a coordinate pair";
    err_ << "." << std::endl;

    if (settings_.preview_rows > 0 && !report.rows.empty())
    {
        const size_t count = std::min(report.rows.size(), static_cast<size_t>(settings_.preview_rows));
        err_ << "[";
        for (size_t i = 0; i < count; ++i)
        {
            if (i > 0)
                err_ << ", ";
            err_ << "[" << format_decimal(report.rows[i].latitude, settings_.precision) << ", "
                 << format_decimal(report.rows[i].longitude, settings_.precision) << "]";
        }
        err_ << (count < report.rows.size() ? ", ...]" : "]") << std::endl;
    }

    if (!report.errors.empty())
    {
        err_ << "Conversion errors:" << std::endl;
        for (const auto& error : report.errors)
        {
            err_ << "  " << error.message() << std::endl;
            PLOG_WARNING << error.message();
        }
    }
}

void Application::flushErrorReports() const
{
    for (const auto& report : utils::ErrorReporter::TakePendingErrors())
        err_ << report.describe() << std::endl;
}
