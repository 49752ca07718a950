// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#include "gcode/GCodeLine.h"

#include "utils/string.h"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <sstream>

namespace stretch
{

namespace
{

CommandType commandTypeOf(const std::string& command)
{
    if (command == "G1" || command == "G01")
    {
        return CommandType::LINEAR_MOVE;
    }
    if (command == "G0" || command == "G00")
    {
        return CommandType::RAPID_MOVE;
    }
    if (command == "G2" || command == "G3" || command == "G02" || command == "G03")
    {
        return CommandType::ARC_MOVE;
    }
    if (command == "M101")
    {
        return CommandType::EXTRUDER_ON;
    }
    if (command == "M103")
    {
        return CommandType::EXTRUDER_OFF;
    }
    return CommandType::NONE;
}

/*!
 * Parse a decimal number that makes up the whole of \p text. Returns an empty
 * optional for anything else, including hexadecimal, infinite and NaN values.
 */
std::optional<double> parseNumber(std::string_view text)
{
    if (text.empty() || text.find_first_not_of("+-.0123456789eE") != std::string_view::npos)
    {
        return std::nullopt;
    }
    const std::string number(text);
    char* end = nullptr;
    const double value = std::strtod(number.c_str(), &end);
    if (end == number.c_str() || *end != '\0' || ! std::isfinite(value))
    {
        return std::nullopt;
    }
    return value;
}

MarkerType markerTypeOf(std::string_view text, std::optional<double>& value, const size_t line_nr)
{
    static const std::regex edge_width_regex(R"(^\(<edgeWidth> ([^ )]+))");
    static const std::regex layer_regex(R"(^\(<layer> (-?[\.\d]+))");

    if (text.empty() || (text.front() != '(' && text.front() != ';'))
    {
        return MarkerType::NONE;
    }
    if (text.starts_with(";LAYER:") || text.starts_with("(<layer>"))
    {
        std::cmatch match;
        if (std::regex_search(text.data(), text.data() + text.size(), match, layer_regex))
        {
            value = parseNumber(match[1].str());
        }
        return MarkerType::LAYER_START;
    }
    if (text.starts_with("(<edgeWidth>"))
    {
        std::cmatch match;
        if (std::regex_search(text.data(), text.data() + text.size(), match, edge_width_regex))
        {
            value = parseNumber(match[1].str());
        }
        if (! value.has_value() || *value <= 0.0)
        {
            spdlog::warn("Malformed input on line {}: edge width in '{}' is not a positive number, the marker is ignored.", line_nr, text);
            value.reset();
        }
        return MarkerType::EDGE_WIDTH;
    }
    if (text.starts_with("(<loop>"))
    {
        return MarkerType::LOOP_BEGIN;
    }
    if (text.starts_with("(</loop>)"))
    {
        return MarkerType::LOOP_END;
    }
    if (text.starts_with("(<edge> outer"))
    {
        return MarkerType::OUTER_EDGE_BEGIN;
    }
    if (text.starts_with("(<edge>"))
    {
        return MarkerType::INNER_EDGE_BEGIN;
    }
    if (text.starts_with("(</edge>)"))
    {
        return MarkerType::EDGE_END;
    }
    if (text.starts_with("(</extruderInitialization>)"))
    {
        return MarkerType::INITIALIZATION_END;
    }
    return MarkerType::NONE;
}

/*!
 * Parse the number after the field letter. Returns an empty optional if the
 * word is not entirely a finite number.
 */
std::optional<double> parseFieldValue(const std::string& word)
{
    return parseNumber(std::string_view(word).substr(1));
}

} // namespace

GCodeLine GCodeLine::parse(std::string_view raw, const Point3D& previous_location, const size_t line_nr)
{
    GCodeLine line;
    line.raw = std::string(raw);
    line.line_nr = line_nr;
    line.location = previous_location;

    const std::string_view text = trim(raw);
    line.marker = markerTypeOf(text, line.marker_value, line_nr);

    // The part before a semicolon or bracket holds the command and its fields.
    std::string_view code = raw;
    size_t comment_start = code.find(';');
    const size_t bracket = code.substr(0, comment_start).find('(');
    if (bracket != std::string_view::npos && bracket > 0)
    {
        comment_start = bracket;
    }
    if (comment_start != std::string_view::npos)
    {
        line.comment = std::string(trim(raw.substr(comment_start)));
        code = code.substr(0, comment_start);
    }
    if (! text.empty() && text.front() == '(')
    {
        return line; // Comment line.
    }

    std::istringstream words{ std::string(code) };
    std::string word;
    if (! (words >> word))
    {
        return line;
    }
    line.command = word;
    line.type = commandTypeOf(word);
    if (! line.isMove())
    {
        return line;
    }

    while (words >> word)
    {
        const char letter = static_cast<char>(std::toupper(static_cast<unsigned char>(word.front())));
        std::optional<double>* field = nullptr;
        switch (letter)
        {
        case 'X':
            field = &line.x;
            break;
        case 'Y':
            field = &line.y;
            break;
        case 'Z':
            field = &line.z;
            break;
        case 'E':
            field = &line.e;
            break;
        case 'F':
            field = &line.f;
            break;
        default:
            continue;
        }
        if (field->has_value())
        {
            continue; // The first occurrence counts.
        }
        *field = parseFieldValue(word);
        if (! field->has_value())
        {
            spdlog::warn("Malformed input on line {}: cannot parse '{}', the field is ignored.", line_nr, word);
        }
    }

    line.location = Point3D(line.x.value_or(previous_location.x_), line.y.value_or(previous_location.y_), line.z.value_or(previous_location.z_));
    return line;
}

} // namespace stretch
