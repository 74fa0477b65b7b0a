#include "ConversionConfig.hpp"
#include "ConfigManager.hpp"

#include <algorithm>
#include <plog/Log.h>
#include <toml++/toml.h>

std::optional<InputMode> input_mode_from_string(std::string_view name)
{
    if (name == "columns")
        return InputMode::Columns;
    if (name == "combined")
        return InputMode::Combined;
    if (name == "text")
        return InputMode::Text;
    return std::nullopt;
}

const char* to_string(InputMode mode)
{
    switch (mode)
    {
    case InputMode::Columns:
        return "columns";
    case InputMode::Combined:
        return "combined";
    case InputMode::Text:
        return "text";
    }
    return "columns";
}

void ConversionConfig::registerWith(ConfigManager& manager)
{
    manager.onSection("global", [this](const toml::table& t) { append_logs = t["append_logs"].value_or(append_logs); });

    manager.onSection("conversion",
                      [this](const toml::table& t)
                      {
                          if (auto name = t["mode"].value<std::string>())
                          {
                              if (auto parsed = input_mode_from_string(*name))
                                  mode = *parsed;
                              else
                                  PLOG_WARNING << "Unknown conversion.mode '" << *name << "', keeping "
                                               << to_string(mode);
                          }
                          latitude_column = t["latitude_column"].value_or(latitude_column);
                          longitude_column = t["longitude_column"].value_or(longitude_column);
                          combined_column = t["combined_column"].value_or(combined_column);
                      });

    manager.onSection("output",
                      [this](const toml::table& t)
                      {
                          include_originals = t["include_originals"].value_or(include_originals);
                          precision = std::clamp(static_cast<int>(t["precision"].value_or<int64_t>(precision)), 0, 12);
                          preview_rows =
                              std::max(0, static_cast<int>(t["preview_rows"].value_or<int64_t>(preview_rows)));
                      });

    manager.onSection("app.debug",
                      [this](const toml::table& t)
                      {
                          verbose = t["verbose"].value_or(verbose);
                          logging_level =
                              std::clamp(static_cast<int>(t["logging_level"].value_or<int64_t>(logging_level)), 0, 6);
                      });
}

coordinates::ColumnSelection ConversionConfig::selection() const
{
    if (mode == InputMode::Combined)
        return coordinates::ColumnSelection::combined(combined_column);
    return coordinates::ColumnSelection::separate(latitude_column, longitude_column);
}
