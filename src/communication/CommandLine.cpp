// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#include "communication/CommandLine.h"

#include "StretchFilter.h"
#include "exceptions.h"
#include "gcode/Program.h"
#include "settings/StretchSettings.h"

#include <rapidjson/error/en.h> //Loading JSON documents to get settings from them.
#include <rapidjson/memorystream.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace stretch
{

namespace
{

bool jsonValue2Str(const rapidjson::Value& value, std::string& value_string)
{
    if (value.IsString())
    {
        value_string = value.GetString();
    }
    else if (value.IsTrue())
    {
        value_string = "true";
    }
    else if (value.IsFalse())
    {
        value_string = "false";
    }
    else if (value.IsInt64())
    {
        value_string = std::to_string(value.GetInt64());
    }
    else if (value.IsNumber())
    {
        value_string = std::to_string(value.GetDouble());
    }
    else
    {
        return false;
    }
    return true;
}

/*
 * Parse "<first>:<last>" into a pair of layer indices.
 */
std::optional<std::pair<size_t, size_t>> parseLayerRange(const std::string& argument)
{
    const size_t separator = argument.find(':');
    if (separator == std::string::npos)
    {
        return std::nullopt;
    }
    try
    {
        const unsigned long first = std::stoul(argument.substr(0, separator));
        const unsigned long last = std::stoul(argument.substr(separator + 1));
        if (first > last)
        {
            return std::nullopt;
        }
        return std::make_pair(static_cast<size_t>(first), static_cast<size_t>(last));
    }
    catch (const std::logic_error&)
    {
        return std::nullopt;
    }
}

} // namespace

CommandLine::CommandLine(const std::vector<std::string>& arguments)
    : arguments_(arguments)
{
}

bool CommandLine::parseArguments()
{
    bool has_input = false;
    for (size_t argument_index = 2; argument_index < arguments_.size(); argument_index++)
    {
        std::string argument = arguments_[argument_index];
        if (argument.size() > 1 && argument[0] == '-') // Starts with "-".
        {
            if (argument[1] == '-') // Starts with "--".
            {
                if (argument.starts_with("--layers"))
                {
                    argument_index++;
                    if (argument_index >= arguments_.size())
                    {
                        spdlog::error("Missing layer range with --layers argument.");
                        return false;
                    }
                    layer_range_ = parseLayerRange(arguments_[argument_index]);
                    if (! layer_range_)
                    {
                        spdlog::error("Invalid layer range: {}. Expected <first>:<last>.", arguments_[argument_index]);
                        return false;
                    }
                }
                else
                {
                    spdlog::error("Unknown option: {}", argument);
                    return false;
                }
                continue;
            }

            switch (argument[1])
            {
            case 'v':
            {
                spdlog::set_level(spdlog::level::debug);
                break;
            }
            case 'j':
            {
                argument_index++;
                if (argument_index >= arguments_.size())
                {
                    spdlog::error("Missing JSON file with -j argument.");
                    return false;
                }
                argument = arguments_[argument_index];
                if (loadJSON(std::filesystem::path{ argument }, settings_) != 0)
                {
                    spdlog::error("Failed to load JSON file: {}", argument);
                    return false;
                }
                break;
            }
            case 'o':
            {
                argument_index++;
                if (argument_index >= arguments_.size())
                {
                    spdlog::error("Missing output file with -o argument.");
                    return false;
                }
                output_file_ = arguments_[argument_index];
                break;
            }
            case 's':
            {
                // Parse the given setting and store it.
                argument_index++;
                if (argument_index >= arguments_.size())
                {
                    spdlog::error("Missing setting name and value with -s argument.");
                    return false;
                }
                argument = arguments_[argument_index];
                const size_t value_position = argument.find('=');
                if (value_position == std::string::npos)
                {
                    spdlog::error("Missing value in setting argument: -s {}", argument);
                    return false;
                }
                const std::string key = argument.substr(0, value_position);
                const std::string value = argument.substr(value_position + 1);
                settings_.add(key, value);
                break;
            }
            default:
            {
                spdlog::error("Unknown option: {}", argument);
                return false;
            }
            }
        }
        else
        {
            if (has_input)
            {
                spdlog::error("Only one input file can be given, got {} after {}.", argument, input_file_.generic_string());
                return false;
            }
            input_file_ = argument;
            has_input = true;
        }
    }
    return true;
}

int CommandLine::run()
{
    if (! parseArguments())
    {
        return 1;
    }

    try
    {
        const StretchSettings stretch_settings = StretchSettings::fromSettings(settings_);
        spdlog::debug("Settings:{}", settings_.getAllSettingsString());

        Program program = Program::fromText(readInput());
        if (layer_range_)
        {
            program = program.subRange(layer_range_->first, layer_range_->second);
            spdlog::info("Filtering layers {} to {}.", layer_range_->first, layer_range_->second);
        }

        // Produce everything in memory first, so that a failed run leaves no partial output.
        std::ostringstream gcode;
        StretchFilter filter(stretch_settings);
        filter.apply(program, gcode);
        writeOutput(gcode.str());
    }
    catch (const std::exception& exception)
    {
        spdlog::error("{}", exception.what());
        return 1;
    }
    return 0;
}

std::string CommandLine::readInput() const
{
    if (input_file_ == "-")
    {
        return std::string(std::istreambuf_iterator<char>(std::cin), {});
    }
    std::ifstream file(input_file_, std::ios::binary);
    if (! file)
    {
        throw exceptions::InputFileException(input_file_);
    }
    return std::string(std::istreambuf_iterator<char>(file), {});
}

void CommandLine::writeOutput(const std::string& gcode) const
{
    if (output_file_ == "-")
    {
        std::cout << gcode;
        std::cout.flush();
        return;
    }
    std::ofstream file(output_file_, std::ios::binary);
    if (! file)
    {
        throw exceptions::OutputFileException(output_file_);
    }
    file << gcode;
}

int CommandLine::loadJSON(const std::filesystem::path& json_filename, Settings& settings)
{
    std::ifstream file(json_filename, std::ios::binary);
    if (! file)
    {
        spdlog::error("Couldn't open JSON file: {}", json_filename.generic_string());
        return 1;
    }

    std::vector<char> read_buffer(std::istreambuf_iterator<char>(file), {});
    rapidjson::MemoryStream memory_stream(read_buffer.data(), read_buffer.size());

    rapidjson::Document json_document;
    json_document.ParseStream(memory_stream);
    if (json_document.HasParseError())
    {
        spdlog::error("Error parsing JSON (offset {}): {}", json_document.GetErrorOffset(), GetParseError_En(json_document.GetParseError()));
        return 2;
    }
    return loadJSON(json_document, settings);
}

int CommandLine::loadJSON(const rapidjson::Document& document, Settings& settings)
{
    if (! document.IsObject())
    {
        spdlog::error("JSON settings must be an object.");
        return 3;
    }
    const rapidjson::Value& element = document.HasMember("settings") ? document["settings"] : document;
    if (! element.IsObject())
    {
        spdlog::error("JSON member 'settings' must be an object.");
        return 3;
    }

    for (rapidjson::Value::ConstMemberIterator setting = element.MemberBegin(); setting != element.MemberEnd(); setting++)
    {
        const std::string name = setting->name.GetString();
        std::string value_string;
        if (! jsonValue2Str(setting->value, value_string))
        {
            spdlog::warn("Unrecognized data type in JSON setting {}", name);
            continue;
        }
        settings.add(name, value_string);
    }
    return 0;
}

} // namespace stretch
