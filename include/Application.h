// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef APPLICATION_H
#define APPLICATION_H

#include "utils/NoCopy.h"

#include <cstddef>
#include <string>
#include <vector>

namespace stretch
{

/*!
 * A singleton class that serves as the starting point for all filtering.
 *
 * The application sets up logging and interprets the first command line
 * argument to decide what it must be doing.
 */
class Application : NoCopy
{
public:
    /*!
     * Gets the instance of this application class.
     */
    static Application& getInstance();

    /*!
     * \brief Print to the stderr channel what the original call to the executable was.
     */
    void printCall() const;

    /*!
     * \brief Print to the stderr channel how to use StretchEngine.
     */
    void printHelp() const;

    /*!
     * \brief Starts the application.
     *
     * It will start by parsing the command line arguments to see what it must
     * be doing.
     * \param argc The number of arguments provided to the application.
     * \param argv The arguments provided to the application.
     * \return The exit code of the process.
     */
    int run(const size_t argc, char** argv);

protected:
    /*!
     * \brief Print the header and license to the stderr channel.
     */
    void printLicense() const;

    /*!
     * \brief Run the stretch filter as the rest of the arguments describe.
     */
    int stretch();

private:
    /*
     * \brief The arguments that the application was called with.
     */
    std::vector<std::string> arguments_;

    /*!
     * \brief Constructs a new Application instance.
     *
     * You cannot call this because this goes via the getInstance() function.
     */
    Application();

    ~Application() = default;
};

} // namespace stretch

#endif // APPLICATION_H
