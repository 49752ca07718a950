// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#include "compensation/FeatureState.h"

#include "gcode/GCodeLine.h"

namespace stretch
{

std::string_view toString(const FeatureKind kind)
{
    switch (kind)
    {
    case FeatureKind::PATH:
        return "path";
    case FeatureKind::LOOP:
        return "loop";
    case FeatureKind::INNER_EDGE:
        return "inner edge";
    case FeatureKind::OUTER_EDGE:
        return "outer edge";
    }
    return "unknown";
}

FeatureState FeatureState::next(const GCodeLine& line) const
{
    FeatureState result = *this;
    const auto to_path = [&result]()
    {
        result.kind = FeatureKind::PATH;
        result.is_loop = false;
    };

    switch (line.type)
    {
    case CommandType::EXTRUDER_ON:
        result.extruder_active = true;
        return result;
    case CommandType::EXTRUDER_OFF:
        result.extruder_active = false;
        to_path();
        return result;
    default:
        break;
    }

    switch (line.marker)
    {
    case MarkerType::LOOP_BEGIN:
        result.kind = FeatureKind::LOOP;
        result.is_loop = true;
        break;
    case MarkerType::INNER_EDGE_BEGIN:
        result.kind = FeatureKind::INNER_EDGE;
        result.is_loop = true;
        break;
    case MarkerType::OUTER_EDGE_BEGIN:
        result.kind = FeatureKind::OUTER_EDGE;
        result.is_loop = true;
        break;
    case MarkerType::LOOP_END:
    case MarkerType::EDGE_END:
        to_path();
        break;
    default:
        break;
    }
    return result;
}

} // namespace stretch
