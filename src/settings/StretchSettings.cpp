// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#include "settings/StretchSettings.h"

#include "exceptions.h"
#include "settings/Settings.h"

#include <spdlog/spdlog.h>

#include <string>

namespace stretch
{

namespace
{

void readRatio(const Settings& settings, const std::string& key, Ratio& target)
{
    if (! settings.has(key))
    {
        return;
    }
    const auto value = settings.get<Ratio>(key);
    if (value < 0.0)
    {
        throw exceptions::InvalidSettingException(key, "ratios must not be negative");
    }
    target = value;
}

void readDistance(const Settings& settings, const std::string& key, double& target)
{
    if (! settings.has(key))
    {
        return;
    }
    const auto value = settings.get<double>(key);
    if (value <= 0.0)
    {
        throw exceptions::InvalidSettingException(key, "must be positive");
    }
    target = value;
}

} // namespace

StretchSettings StretchSettings::fromSettings(const Settings& settings)
{
    StretchSettings result;
    if (settings.has("activate_stretch"))
    {
        result.activate_stretch = settings.get<bool>("activate_stretch");
    }
    readRatio(settings, "loop_stretch_ratio", result.loop_stretch_ratio);
    readRatio(settings, "path_stretch_ratio", result.path_stretch_ratio);
    readRatio(settings, "edge_inside_stretch_ratio", result.edge_inside_stretch_ratio);
    readRatio(settings, "edge_outside_stretch_ratio", result.edge_outside_stretch_ratio);
    readRatio(settings, "cross_limit_distance_ratio", result.cross_limit_distance_ratio);
    readRatio(settings, "stretch_lookahead_ratio", result.stretch_lookahead_ratio);
    readDistance(settings, "default_edge_width", result.default_edge_width);
    readDistance(settings, "default_feed_rate", result.default_feed_rate);
    if (settings.has("output_coordinate_precision"))
    {
        result.output_coordinate_precision = settings.get<size_t>("output_coordinate_precision");
    }
    if (settings.has("output_feed_rate_precision"))
    {
        result.output_feed_rate_precision = settings.get<size_t>("output_feed_rate_precision");
    }
    if (settings.has("min_z_change"))
    {
        result.min_z_change = settings.get<double>("min_z_change");
    }

    spdlog::debug(
        "Stretch settings: active {}, loop {}, path {}, edge inside {}, edge outside {}, cross limit {}, lookahead {}",
        result.activate_stretch,
        double(result.loop_stretch_ratio),
        double(result.path_stretch_ratio),
        double(result.edge_inside_stretch_ratio),
        double(result.edge_outside_stretch_ratio),
        double(result.cross_limit_distance_ratio),
        double(result.stretch_lookahead_ratio));
    return result;
}

} // namespace stretch
