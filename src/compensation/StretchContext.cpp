// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#include "compensation/StretchContext.h"

#include "exceptions.h"
#include "settings/StretchSettings.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace stretch
{

StretchContext StretchContext::create(const StretchSettings& settings, const double edge_width)
{
    if (edge_width <= 0.0)
    {
        throw exceptions::InvalidSettingException("edge_width", fmt::format("edge width must be positive, got {}", edge_width));
    }

    StretchContext context;
    context.edge_width = edge_width;
    context.cross_limit_distance = edge_width * settings.cross_limit_distance_ratio;
    context.cross_limit_distance_fraction = context.cross_limit_distance / 3.0;
    context.cross_limit_distance_remainder = context.cross_limit_distance - context.cross_limit_distance_fraction;
    context.stretch_lookahead_distance = edge_width * settings.stretch_lookahead_ratio;
    context.path_maximum_stretch = edge_width * settings.path_stretch_ratio;
    context.loop_maximum_stretch = edge_width * settings.loop_stretch_ratio;
    context.edge_inside_maximum_stretch = edge_width * settings.edge_inside_stretch_ratio;
    context.edge_outside_maximum_stretch = edge_width * settings.edge_outside_stretch_ratio;

    const bool stretches_anything = context.path_maximum_stretch > 0.0 || context.loop_maximum_stretch > 0.0 || context.edge_inside_maximum_stretch > 0.0
                                 || context.edge_outside_maximum_stretch > 0.0;
    if (settings.activate_stretch && stretches_anything && context.stretch_lookahead_distance <= 0.0)
    {
        throw exceptions::InvalidSettingException("stretch_lookahead_ratio", "must be positive when stretching is active");
    }

    spdlog::debug(
        "Stretch distances for edge width {}mm: cross limit {}mm, lookahead {}mm, maximum stretch path {}mm, loop {}mm, inside edge {}mm, outside edge {}mm",
        edge_width,
        context.cross_limit_distance,
        context.stretch_lookahead_distance,
        context.path_maximum_stretch,
        context.loop_maximum_stretch,
        context.edge_inside_maximum_stretch,
        context.edge_outside_maximum_stretch);
    return context;
}

double StretchContext::maximumStretch(const FeatureKind kind) const
{
    switch (kind)
    {
    case FeatureKind::PATH:
        return path_maximum_stretch;
    case FeatureKind::LOOP:
        return loop_maximum_stretch;
    case FeatureKind::INNER_EDGE:
        return edge_inside_maximum_stretch;
    case FeatureKind::OUTER_EDGE:
        return edge_outside_maximum_stretch;
    }
    return 0.0;
}

} // namespace stretch
