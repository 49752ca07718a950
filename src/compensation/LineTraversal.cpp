// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#include "compensation/LineTraversal.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace stretch
{

LineTraversal::LineTraversal(std::span<const GCodeLine> lines, const std::ptrdiff_t start_index, const bool is_loop, const Direction direction)
    : lines_(lines)
    , index_(start_index)
    , is_loop_(is_loop)
    , direction_(direction)
{
}

std::optional<size_t> LineTraversal::next()
{
    if (exhausted_)
    {
        return std::nullopt;
    }
    const auto size = static_cast<std::ptrdiff_t>(lines_.size());
    const auto step = static_cast<std::ptrdiff_t>(direction_);
    while (true)
    {
        if (index_ < 0 || index_ >= size) // Ran off the layer.
        {
            if (! wrapAround())
            {
                return exhaust();
            }
            continue;
        }
        if (first_index_ && (index_ == *first_index_ || (has_wrapped_ && (index_ - *first_index_) * step > 0)))
        {
            // Came back to the start. After wrapping, everything from the start onwards was visited already.
            return exhaust();
        }
        if (! first_index_)
        {
            first_index_ = index_;
        }

        const std::ptrdiff_t current = index_;
        const GCodeLine& line = lines_[current];
        if (isThreadBoundary(line))
        {
            if (! wrapAround())
            {
                return exhaust();
            }
            continue;
        }
        index_ += step;
        if (line.isLinearMove())
        {
            return static_cast<size_t>(current);
        }
    }
}

const GCodeLine* LineTraversal::nextLine()
{
    const std::optional<size_t> index = next();
    if (! index)
    {
        return nullptr;
    }
    return &lines_[*index];
}

bool LineTraversal::isThreadBoundary(const GCodeLine& line) const
{
    if (line.type == CommandType::EXTRUDER_OFF)
    {
        return true;
    }
    if (direction_ == Direction::BACKWARD && line.isLinearMove())
    {
        return isBeforeExtrusion(lines_, static_cast<size_t>(index_));
    }
    return false;
}

std::optional<std::ptrdiff_t> LineTraversal::wrapIndex() const
{
    const auto size = static_cast<std::ptrdiff_t>(lines_.size());
    if (direction_ == Direction::FORWARD)
    {
        for (std::ptrdiff_t index = std::min(index_, size) - 1; index >= 0; index--)
        {
            if (lines_[index].type == CommandType::EXTRUDER_ON)
            {
                return index + 1;
            }
        }
        spdlog::debug("No activate command was found for this loop.");
    }
    else
    {
        for (std::ptrdiff_t index = std::max(index_, std::ptrdiff_t{ -1 }) + 1; index < size; index++)
        {
            if (lines_[index].type == CommandType::EXTRUDER_OFF)
            {
                return index - 2;
            }
        }
        spdlog::debug("No deactivate command was found for this loop.");
    }
    return std::nullopt;
}

bool LineTraversal::wrapAround()
{
    if (! is_loop_ || has_wrapped_)
    {
        return false;
    }
    const std::optional<std::ptrdiff_t> target = wrapIndex();
    if (! target)
    {
        return false;
    }
    has_wrapped_ = true;
    index_ = *target;
    return true;
}

std::optional<size_t> LineTraversal::exhaust()
{
    exhausted_ = true;
    return std::nullopt;
}

bool isBeforeExtrusion(std::span<const GCodeLine> lines, const size_t index)
{
    size_t linear_moves = 0;
    for (size_t later = index + 1; later < lines.size(); later++)
    {
        switch (lines[later].type)
        {
        case CommandType::LINEAR_MOVE:
            linear_moves++;
            break;
        case CommandType::EXTRUDER_ON:
            return linear_moves > 0;
        case CommandType::EXTRUDER_OFF:
            return false;
        default:
            break;
        }
    }
    // Neither found: treat the move as part of the thread.
    return false;
}

bool isJustBeforeExtrusion(std::span<const GCodeLine> lines, const size_t index)
{
    for (size_t later = index + 1; later < lines.size(); later++)
    {
        switch (lines[later].type)
        {
        case CommandType::LINEAR_MOVE:
        case CommandType::EXTRUDER_OFF:
            return false;
        case CommandType::EXTRUDER_ON:
            return true;
        default:
            break;
        }
    }
    return false;
}

} // namespace stretch
