#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <fstream>
#include <plog/Log.h>

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
{
}

void ConfigManager::onSection(std::string dotted_path, SectionLoader loader)
{
    loaders_.emplace_back(std::move(dotted_path), std::move(loader));
}

bool ConfigManager::load()
{
    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_DEBUG << "No config at " << config_path_ << ", using defaults";
        last_error_.clear();
        root_ = toml::table{};
        dispatch();
        return true;
    }
    return loadFromStream(ifs, config_path_);
}

bool ConfigManager::loadFromStream(std::istream& in, const std::string& source_name)
{
    last_error_.clear();
    try
    {
        root_ = toml::parse(in, source_name);
    }
    catch (const toml::parse_error& pe)
    {
        const auto& where = pe.source().begin;
        last_error_ = "config parse error: " + std::string(pe.description());
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors, using defaults",
                                            source_name + ":" + std::to_string(where.line) + ":" +
                                                std::to_string(where.column) + ": " + std::string(pe.description()));
        root_ = toml::table{};
        dispatch();
        return false;
    }

    PLOG_INFO << "Loaded config from " << source_name;
    dispatch();
    return true;
}

void ConfigManager::dispatch() const
{
    static const toml::table empty;
    for (const auto& [path, loader] : loaders_)
    {
        const toml::table* section = root_.at_path(path).as_table();
        loader(section ? *section : empty);
    }
}
