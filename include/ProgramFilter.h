// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef PROGRAM_FILTER_H
#define PROGRAM_FILTER_H

#include <ostream>
#include <string_view>

namespace stretch
{
class Program;

/*!
 * \brief A pass over a parsed program that writes the modified program.
 *
 * Passes over the same program model (stretching, arc fitting, relative
 * extrusion, temperature gradients) are independent of each other and can be
 * chained by parsing the output of one as the input of the next.
 */
class ProgramFilter
{
public:
    virtual ~ProgramFilter() = default;

    /*!
     * The name of the filter, for logging.
     */
    virtual std::string_view getName() const = 0;

    /*!
     * \brief Write the filtered \p program to \p output.
     *
     * Either the whole program is written, or an exception is thrown before
     * anything is written.
     */
    virtual void apply(const Program& program, std::ostream& output) = 0;
};

} // namespace stretch

#endif // PROGRAM_FILTER_H
