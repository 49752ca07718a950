// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef COMMANDLINE_H
#define COMMANDLINE_H

#include "settings/Settings.h"

#include <rapidjson/document.h> //Loading JSON documents to get settings from them.

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string> //To store the command line arguments.
#include <utility>
#include <vector> //To store the command line arguments.

namespace stretch
{

/*
 * \brief When filtering via the command line, interprets the command line
 * arguments to read a program, stretch it and write the result.
 */
class CommandLine
{
public:
    /*
     * \brief Construct a new command line run.
     * \param arguments The command line arguments passed to the application,
     * starting with the executable and the command.
     */
    CommandLine(const std::vector<std::string>& arguments);

    /*
     * \brief Interpret the arguments and run the filter.
     * \return The exit code of the process: 0 on success, 1 on bad arguments
     * or a failed run.
     */
    int run();

    /*
     * \brief Interpret the arguments only, without running anything.
     * \return Whether the arguments were valid.
     */
    bool parseArguments();

    /*
     * \brief Load settings from a JSON file.
     *
     * The file holds an object with setting names and values, either at the top
     * level or in a member called "settings".
     * \param json_filename The file to load.
     * \param settings The settings to add the values to.
     * \return 0 on success, 1 if the file couldn't be read, 2 if it is not
     * valid JSON, 3 if it holds no settings object.
     */
    static int loadJSON(const std::filesystem::path& json_filename, Settings& settings);

    /*
     * \brief Load settings from a parsed JSON document.
     * \return 0 on success, 3 if the document holds no settings object.
     */
    static int loadJSON(const rapidjson::Document& document, Settings& settings);

    const Settings& getSettings() const
    {
        return settings_;
    }

    const std::optional<std::pair<size_t, size_t>>& getLayerRange() const
    {
        return layer_range_;
    }

    const std::filesystem::path& getInputFile() const
    {
        return input_file_;
    }

    const std::filesystem::path& getOutputFile() const
    {
        return output_file_;
    }

private:
    /*
     * \brief Read the whole input program, from a file or standard input.
     * \throws exceptions::InputFileException if the file can't be opened.
     */
    std::string readInput() const;

    /*
     * \brief Write the output, to a file or standard output.
     * \throws exceptions::OutputFileException if the file can't be opened.
     */
    void writeOutput(const std::string& gcode) const;

    /*
     * \brief The command line arguments that the application was called with.
     */
    std::vector<std::string> arguments_;

    Settings settings_;

    std::filesystem::path input_file_ = "-"; //!< "-" means standard input.
    std::filesystem::path output_file_ = "-"; //!< "-" means standard output.
    std::optional<std::pair<size_t, size_t>> layer_range_;
};

} // namespace stretch

#endif // COMMANDLINE_H
