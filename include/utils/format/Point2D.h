// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef UTILS_FORMAT_POINT2D_H
#define UTILS_FORMAT_POINT2D_H

#include "utils/Point2D.h"

#include <fmt/format.h>

template<>
struct [[maybe_unused]] fmt::formatter<stretch::Point2D>
{
    constexpr auto parse(fmt::format_parse_context& ctx) -> decltype(ctx.begin())
    {
        if (ctx.begin() != ctx.end() && *ctx.begin() != '}')
        {
            throw fmt::format_error("invalid format");
        }
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(const stretch::Point2D& point, FormatContext& ctx) const -> decltype(ctx.out())
    {
        return fmt::format_to(ctx.out(), "({:.4f}, {:.4f})", point.x_, point.y_);
    }
};

#endif // UTILS_FORMAT_POINT2D_H
