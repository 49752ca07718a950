// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef GCODE_EMITTER_H
#define GCODE_EMITTER_H

#include "utils/NoCopy.h"
#include "utils/Point2D.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace stretch
{
struct GCodeLine;

/*!
 * \brief Writes the lines of a filtered program to a stream, in document order.
 *
 * Lines are either passed through as they were or replaced by a linear move to
 * a new location. The emitter keeps track of the last feed rate that was
 * given, so that a replacement move always states its feed rate.
 */
class GCodeEmitter : public NoCopy
{
public:
    /*!
     * \param output The stream to write to. It must outlive the emitter.
     * \param coordinate_precision Number of decimals written for coordinates and extrusion.
     * \param feed_rate_precision Number of decimals written for feed rates.
     * \param initial_feed_rate Feed rate in mm/min used until a line gives one.
     */
    GCodeEmitter(std::ostream& output, const unsigned int coordinate_precision, const unsigned int feed_rate_precision, const double initial_feed_rate);

    /*!
     * \brief Remember the feed rate of \p line, if it has one.
     */
    void trackFeedRate(const GCodeLine& line);

    /*!
     * \brief Write a line unchanged.
     */
    void writeLine(std::string_view raw);

    /*!
     * \brief Write a linear move to \p point at height \p z that replaces \p source.
     *
     * The move is written with the current feed rate. The extrusion value and
     * the comment of \p source are kept.
     */
    void writeLinearMove(const Point2D& point, const double z, const GCodeLine& source);

    double getCurrentFeedRate() const
    {
        return current_feed_rate_;
    }

    /*!
     * The number of lines written so far.
     */
    size_t getLineCount() const
    {
        return line_count_;
    }

private:
    std::ostream* output_stream_;
    std::string new_line_ = "\n";
    unsigned int coordinate_precision_;
    unsigned int feed_rate_precision_;
    double current_feed_rate_; //!< mm/min
    size_t line_count_ = 0;
};

} // namespace stretch

#endif // GCODE_EMITTER_H
