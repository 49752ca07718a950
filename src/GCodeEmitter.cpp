// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#include "GCodeEmitter.h"

#include "gcode/GCodeLine.h"
#include "utils/string.h"

namespace stretch
{

GCodeEmitter::GCodeEmitter(std::ostream& output, const unsigned int coordinate_precision, const unsigned int feed_rate_precision, const double initial_feed_rate)
    : output_stream_(&output)
    , coordinate_precision_(coordinate_precision)
    , feed_rate_precision_(feed_rate_precision)
    , current_feed_rate_(initial_feed_rate)
{
}

void GCodeEmitter::trackFeedRate(const GCodeLine& line)
{
    if (line.f.has_value())
    {
        current_feed_rate_ = *line.f;
    }
}

void GCodeEmitter::writeLine(std::string_view raw)
{
    *output_stream_ << raw << new_line_;
    line_count_++;
}

void GCodeEmitter::writeLinearMove(const Point2D& point, const double z, const GCodeLine& source)
{
    *output_stream_ << "G1 X" << PrecisionedDouble{ coordinate_precision_, point.x_ } << " Y" << PrecisionedDouble{ coordinate_precision_, point.y_ } << " Z"
                    << PrecisionedDouble{ coordinate_precision_, z } << " F" << PrecisionedDouble{ feed_rate_precision_, current_feed_rate_ };
    if (source.e.has_value())
    {
        *output_stream_ << " E" << PrecisionedDouble{ 5, *source.e };
    }
    if (! source.comment.empty())
    {
        *output_stream_ << " " << source.comment;
    }
    *output_stream_ << new_line_;
    line_count_++;
}

} // namespace stretch
