#pragma once

#include <functional>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

#include <toml++/toml.h>

// Reads config.toml and passes each section of interest ("conversion",
// "app.debug", ...) to the loader registered for it. A section that is
// missing from the file reaches its loader as an empty table, so loaders
// only ever overwrite defaults.
class ConfigManager
{
public:
    using SectionLoader = std::function<void(const toml::table& section)>;

    explicit ConfigManager(std::string config_path = "config.toml");

    void onSection(std::string dotted_path, SectionLoader loader);

    // A missing file is not an error. A malformed one is reported, and every
    // loader then sees an empty table.
    bool load();
    bool loadFromStream(std::istream& in, const std::string& source_name);

    [[nodiscard]] const toml::table& root() const { return root_; }
    [[nodiscard]] const std::string& path() const { return config_path_; }
    [[nodiscard]] const std::string& lastError() const { return last_error_; }

private:
    void dispatch() const;

    std::string config_path_;
    std::string last_error_;
    toml::table root_;
    std::vector<std::pair<std::string, SectionLoader>> loaders_;
};
