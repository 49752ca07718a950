// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#include "settings/Settings.h"

#include "exceptions.h"
#include "settings/types/Ratio.h" //For ratio settings.

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <map>
#include <sstream> // ostringstream
#include <stdexcept>
#include <string> //Parsing strings (stod, stoul).

namespace stretch
{

Settings::Settings()
{
    parent_ = nullptr; // Needs to be properly initialised because we check against this if the parent is not set.
}

void Settings::add(const std::string& key, const std::string& value)
{
    if (settings_.find(key) != settings_.end()) // Already exists.
    {
        settings_[key] = value;
    }
    else // New setting.
    {
        settings_.emplace(key, value);
    }
}

template<>
std::string Settings::get<std::string>(const std::string& key) const
{
    // If this settings base has a setting value for it, look that up.
    if (settings_.find(key) != settings_.end())
    {
        return settings_.at(key);
    }

    if (parent_)
    {
        return parent_->get<std::string>(key);
    }

    spdlog::error("Trying to retrieve setting with no value given: {}", key);
    throw exceptions::SettingNotFoundException(key);
}

template<>
double Settings::get<double>(const std::string& key) const
{
    const std::string value = get<std::string>(key);
    try
    {
        size_t parsed_characters = 0;
        const double result = std::stod(value, &parsed_characters);
        if (parsed_characters != value.size())
        {
            throw exceptions::InvalidSettingException(key, fmt::format("trailing characters in '{}'", value));
        }
        return result;
    }
    catch (const std::invalid_argument&)
    {
        throw exceptions::InvalidSettingException(key, fmt::format("'{}' is not a number", value));
    }
    catch (const std::out_of_range&)
    {
        throw exceptions::InvalidSettingException(key, fmt::format("'{}' is out of range", value));
    }
}

template<>
int Settings::get<int>(const std::string& key) const
{
    const std::string value = get<std::string>(key);
    try
    {
        return std::stoi(value);
    }
    catch (const std::logic_error&)
    {
        throw exceptions::InvalidSettingException(key, fmt::format("'{}' is not an integer", value));
    }
}

template<>
size_t Settings::get<size_t>(const std::string& key) const
{
    const int value = get<int>(key);
    if (value < 0)
    {
        throw exceptions::InvalidSettingException(key, "must not be negative");
    }
    return static_cast<size_t>(value);
}

template<>
bool Settings::get<bool>(const std::string& key) const
{
    const std::string& value = get<std::string>(key);
    if (value == "on" || value == "yes" || value == "true" || value == "True")
    {
        return true;
    }
    const int num = atoi(value.c_str());
    return num != 0;
}

template<>
Ratio Settings::get<Ratio>(const std::string& key) const
{
    return Ratio(get<double>(key)); // Ratios are given as fractions of the edge width, not as percentages.
}

std::string Settings::getAllSettingsString() const
{
    // Sorted, so that the string is reproducible.
    const std::map<std::string, std::string> sorted(settings_.begin(), settings_.end());
    std::ostringstream sstream;
    for (const auto& [key, value] : sorted)
    {
        sstream << fmt::format(" -s {}=\"{}\"", key, value);
    }
    return sstream.str();
}

bool Settings::has(const std::string& key) const
{
    if (settings_.find(key) != settings_.end())
    {
        return true;
    }
    return parent_ != nullptr && parent_->has(key);
}

void Settings::setParent(Settings* new_parent)
{
    parent_ = new_parent;
}

} // namespace stretch
