// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#include "StretchFilter.h"

#include "GCodeEmitter.h"
#include "compensation/LineTraversal.h"
#include "compensation/StretchComputer.h"
#include "compensation/StretchContext.h"
#include "gcode/Program.h"
#include "utils/format/Point2D.h"

#include <range/v3/view/join.hpp>
#include <range/v3/view/transform.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>

namespace stretch
{

namespace
{

auto allLines(const Program& program)
{
    return program.layers()
         | ranges::views::transform(
               [](const Layer& layer) -> const std::vector<GCodeLine>&
               {
                   return layer.lines;
               })
         | ranges::views::join;
}

} // namespace

StretchFilter::StretchFilter(const StretchSettings& settings)
    : settings_(settings)
{
}

double StretchFilter::findEdgeWidth(const Program& program, const double default_edge_width)
{
    std::optional<double> edge_width;
    for (const GCodeLine& line : allLines(program))
    {
        if (line.marker == MarkerType::INITIALIZATION_END)
        {
            return edge_width.value_or(default_edge_width);
        }
        if (line.marker == MarkerType::EDGE_WIDTH && line.marker_value.has_value())
        {
            edge_width = line.marker_value;
        }
    }
    return default_edge_width; // No initialization block.
}

void StretchFilter::apply(const Program& program, std::ostream& output)
{
    statistics_ = StretchStatistics();
    if (settings_.min_z_change.has_value())
    {
        program.requireHeight(*settings_.min_z_change);
    }

    GCodeEmitter emitter(output, settings_.output_coordinate_precision, settings_.output_feed_rate_precision, settings_.default_feed_rate);
    if (! settings_.activate_stretch)
    {
        spdlog::info("Stretch is not activated, the program is passed through.");
        for (const GCodeLine& line : allLines(program))
        {
            emitter.writeLine(line.raw);
        }
        statistics_.lines = emitter.getLineCount();
        return;
    }

    statistics_.edge_width = findEdgeWidth(program, settings_.default_edge_width);
    const StretchComputer computer(StretchContext::create(settings_, statistics_.edge_width));

    // Nothing is stretched before the end of the initialization block.
    bool initialized = false;

    FeatureState state;
    for (const Layer& layer : program.layers())
    {
        const size_t stretched_before = statistics_.stretched_moves;
        for (size_t index = 0; index < layer.lines.size(); index++)
        {
            const GCodeLine& line = layer.lines[index];
            if (! initialized)
            {
                emitter.trackFeedRate(line);
                emitter.writeLine(line.raw);
                initialized = line.marker == MarkerType::INITIALIZATION_END;
                continue;
            }
            state = processLine(state, layer, index, computer, emitter);
        }
        spdlog::debug("Layer {}: stretched {} moves.", layer.index, statistics_.stretched_moves - stretched_before);
    }

    statistics_.lines = emitter.getLineCount();
    spdlog::info(
        "Stretched {} of {} lines with edge width {}mm, largest displacement {:.4f}mm.",
        statistics_.stretched_moves,
        statistics_.lines,
        statistics_.edge_width,
        statistics_.maximum_displacement);
}

FeatureState StretchFilter::processLine(const FeatureState& state, const Layer& layer, const size_t index, const StretchComputer& computer, GCodeEmitter& emitter)
{
    const GCodeLine& line = layer.lines[index];
    emitter.trackFeedRate(line);

    if (line.isLinearMove())
    {
        const double maximum_stretch = computer.context().maximumStretch(state.kind);
        if (maximum_stretch > 0.0 && (state.extruder_active || isJustBeforeExtrusion(layer.view(), index)))
        {
            const Point2D displacement = computer.absoluteStretch(layer.view(), index, state.is_loop, maximum_stretch);
            emitter.writeLinearMove(line.location.xy() + displacement, line.location.z_, line);

            statistics_.stretched_moves++;
            statistics_.maximum_displacement = std::max(statistics_.maximum_displacement, displacement.vSize());
            spdlog::trace("Line {} ({}): stretched by {}", line.line_nr, toString(state.kind), displacement);
            return state.next(line);
        }
    }
    emitter.writeLine(line.raw);
    return state.next(line);
}

} // namespace stretch
