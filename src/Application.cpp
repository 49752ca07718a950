// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#include "Application.h"

#include "communication/CommandLine.h" //To use the command line to run the filter.
#include "settings/Settings.h" //For the version.
#include "utils/string.h" //For stringcasecompare.

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/cfg/helpers.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/dup_filter_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <memory>
#include <string>

namespace stretch
{

Application::Application()
{
    auto dup_sink = std::make_shared<spdlog::sinks::dup_filter_sink_mt>(std::chrono::seconds{ 10 });
    auto base_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>(); // stdout may carry the g-code.
    dup_sink->add_sink(base_sink);

    spdlog::default_logger()->sinks()
        = std::vector<std::shared_ptr<spdlog::sinks::sink>>{ dup_sink }; // replace default_logger sinks with the duplicating filtering sink to avoid spamming

    if (auto spdlog_val = spdlog::details::os::getenv("STRETCH_ENGINE_LOG_LEVEL"); ! spdlog_val.empty())
    {
        spdlog::cfg::helpers::load_levels(spdlog_val);
    };
}

Application& Application::getInstance()
{
    static Application instance; // Constructs using the default constructor.
    return instance;
}

void Application::printCall() const
{
    spdlog::error("Command called: {}", fmt::join(arguments_, " "));
}

void Application::printHelp() const
{
    fmt::print(stderr, "\n");
    fmt::print(stderr, "usage:\n");
    fmt::print(stderr, "StretchEngine help\n");
    fmt::print(stderr, "\tShow this help message\n");
    fmt::print(stderr, "\n");
    fmt::print(stderr, "StretchEngine stretch [-v] [-j <settings.json>] [-s <settingkey>=<value>] [--layers <first>:<last>] [-o <output.gcode>] <input.gcode>\n");
    fmt::print(stderr, "  -v\n\tIncrease the verbose level (show log messages).\n");
    fmt::print(stderr, "  -j\n\tLoad a JSON file with setting values.\n");
    fmt::print(stderr, "  -s <setting>=<value>\n\tSet a setting to a value, overriding the JSON files given before.\n");
    fmt::print(stderr, "  --layers <first>:<last>\n\tOnly filter the given range of layers, as if it were the whole program.\n");
    fmt::print(stderr, "  -o <output_file>\n\tSpecify a file to which to write the stretched g-code. Defaults to standard output.\n");
    fmt::print(stderr, "  <input.gcode>\n\tThe program to stretch. Use - or leave out to read standard input.\n");
    fmt::print(stderr, "\n");
    fmt::print(stderr, "Settings (ratios of the edge width declared in the program):\n");
    fmt::print(stderr, "  activate_stretch, loop_stretch_ratio, path_stretch_ratio, edge_inside_stretch_ratio,\n");
    fmt::print(stderr, "  edge_outside_stretch_ratio, cross_limit_distance_ratio, stretch_lookahead_ratio\n");
    fmt::print(stderr, "and default_edge_width, default_feed_rate, output_coordinate_precision, output_feed_rate_precision, min_z_change.\n");
    fmt::print(stderr, "\n");
}

void Application::printLicense() const
{
    fmt::print(stderr, "\n");
    fmt::print(stderr, "StretchEngine version {}\n", STRETCH_ENGINE_VERSION);
    fmt::print(stderr, "Copyright (C) 2026 UltiMaker\n");
    fmt::print(stderr, "\n");
    fmt::print(stderr, "This program is free software: you can redistribute it and/or modify\n");
    fmt::print(stderr, "it under the terms of the GNU Affero General Public License as published by\n");
    fmt::print(stderr, "the Free Software Foundation, either version 3 of the License, or\n");
    fmt::print(stderr, "(at your option) any later version.\n");
    fmt::print(stderr, "\n");
    fmt::print(stderr, "This program is distributed in the hope that it will be useful,\n");
    fmt::print(stderr, "but WITHOUT ANY WARRANTY; without even the implied warranty of\n");
    fmt::print(stderr, "MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the\n");
    fmt::print(stderr, "GNU Affero General Public License for more details.\n");
    fmt::print(stderr, "\n");
    fmt::print(stderr, "You should have received a copy of the GNU Affero General Public License\n");
    fmt::print(stderr, "along with this program.  If not, see <http://www.gnu.org/licenses/>.\n");
}

int Application::stretch()
{
    CommandLine command_line(arguments_);
    return command_line.run();
}

int Application::run(const size_t argc, char** argv)
{
    arguments_.assign(argv, argv + argc);

    printLicense();

    if (argc < 2)
    {
        printHelp();
        return 1;
    }

    if (stringcasecompare(argv[1], "stretch") == 0)
    {
        return stretch();
    }
    if (stringcasecompare(argv[1], "help") == 0)
    {
        printHelp();
        return 0;
    }

    spdlog::error("Unknown command: {}", argv[1]);
    printCall();
    printHelp();
    return 1;
}

} // namespace stretch
