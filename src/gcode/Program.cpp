// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#include "gcode/Program.h"

#include "exceptions.h"

#include <fmt/format.h>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/none_of.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/view/reverse.hpp>
#include <range/v3/view/transform.hpp>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

namespace stretch
{

Program Program::fromText(std::string_view text)
{
    Program program;
    Point3D location;
    size_t line_nr = 0;
    size_t start = 0;
    while (start < text.size())
    {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos)
        {
            end = text.size();
        }
        std::string_view raw = text.substr(start, end - start);
        if (! raw.empty() && raw.back() == '\r')
        {
            raw.remove_suffix(1);
        }
        GCodeLine line = GCodeLine::parse(raw, location, ++line_nr);
        location = line.location;
        program.addLine(std::move(line));
        start = end + 1;
    }
    spdlog::debug("Parsed {} lines into {} layers.", line_nr, program.layers_.size());
    return program;
}

Program Program::fromLines(const std::vector<std::string>& lines)
{
    Program program;
    Point3D location;
    size_t line_nr = 0;
    for (const std::string& raw : lines)
    {
        GCodeLine line = GCodeLine::parse(raw, location, ++line_nr);
        location = line.location;
        program.addLine(std::move(line));
    }
    return program;
}

void Program::addLine(GCodeLine&& line)
{
    if (layers_.empty() || (line.marker == MarkerType::LAYER_START && ! layers_.back().lines.empty()))
    {
        Layer layer;
        layer.index = layers_.size();
        layers_.push_back(std::move(layer));
    }
    Layer& layer = layers_.back();

    if (line.isMove() && ranges::none_of(layer.lines, &GCodeLine::isMove))
    {
        layer.z = line.location.z_; // The first move decides, even over the height in the marker.
    }
    else if (line.marker == MarkerType::LAYER_START && line.marker_value.has_value() && ! layer.z.has_value())
    {
        layer.z = line.marker_value;
    }
    if (line.type == CommandType::EXTRUDER_ON || (line.isMove() && line.e.has_value()))
    {
        layer.has_extrusion = true;
    }
    layer.lines.push_back(std::move(line));
}

size_t Program::lineCount() const
{
    return ranges::accumulate(
        layers_ | ranges::views::transform(
                      [](const Layer& layer)
                      {
                          return layer.lines.size();
                      }),
        size_t{ 0 });
}

std::optional<ZBounds> Program::bounds() const
{
    const auto extrudes = [](const Layer& layer)
    {
        return layer.has_extrusion && layer.z.has_value();
    };
    const auto first = ranges::find_if(layers_, extrudes);
    if (first == layers_.end())
    {
        return std::nullopt;
    }
    const auto reversed = layers_ | ranges::views::reverse;
    const auto last = ranges::find_if(reversed, extrudes);
    return ZBounds{ *first->z, *last->z };
}

ZBounds Program::requireHeight(const double min_z_change) const
{
    const auto usable = ranges::find_if(
        layers_,
        [min_z_change](const Layer& layer)
        {
            return layer.has_extrusion && layer.z.has_value() && *layer.z > min_z_change;
        });
    if (usable == layers_.end())
    {
        throw exceptions::InsufficientHeightException(min_z_change);
    }
    const ZBounds usable_bounds{ *usable->z, bounds().value().zmax };
    if (usable_bounds.zmin >= usable_bounds.zmax)
    {
        throw exceptions::InsufficientHeightException(usable_bounds.zmin, usable_bounds.zmax);
    }
    spdlog::info("Usable height from {:.2f}mm to {:.2f}mm.", usable_bounds.zmin, usable_bounds.zmax);
    return usable_bounds;
}

Program Program::subRange(const size_t first, const size_t last) const
{
    if (first > last || last >= layers_.size())
    {
        throw std::out_of_range(fmt::format("Layer range {}:{} is outside the program's {} layers.", first, last, layers_.size()));
    }
    Program result;
    result.layers_.assign(layers_.begin() + first, layers_.begin() + last + 1);
    return result;
}

} // namespace stretch
