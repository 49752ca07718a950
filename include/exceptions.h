// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

#include <fmt/format.h>

#include <exception>
#include <filesystem>
#include <string>
#include <string_view>

namespace stretch::exceptions
{

/*!
 * The program has no usable height: no layer with extrusion lies above the
 * minimum height, or the lowest such layer is not below the highest one.
 */
class InsufficientHeightException : public std::exception
{
    std::string msg_;

public:
    InsufficientHeightException(const double min_z_change) noexcept
        : msg_(fmt::format("Height is too small: no layer with extrusion found above {}mm.", min_z_change)){};

    InsufficientHeightException(const double zmin, const double zmax) noexcept
        : msg_(fmt::format("Height is too small: lowest usable layer at {}mm is not below the highest layer at {}mm.", zmin, zmax))
    {
    }

    virtual const char* what() const noexcept override
    {
        return msg_.c_str();
    }
};

class SettingNotFoundException : public std::exception
{
    std::string msg_;

public:
    SettingNotFoundException(std::string_view key) noexcept
        : msg_(fmt::format("Trying to retrieve setting with no value given: {}", key)){};

    virtual const char* what() const noexcept override
    {
        return msg_.c_str();
    }
};

class InvalidSettingException : public std::exception
{
    std::string msg_;

public:
    InvalidSettingException(std::string_view key, std::string_view reason) noexcept
        : msg_(fmt::format("Invalid value for setting '{}': {}", key, reason)){};

    virtual const char* what() const noexcept override
    {
        return msg_.c_str();
    }
};

class InputFileException : public std::exception
{
    std::string msg_;

public:
    InputFileException(const std::filesystem::path& path) noexcept
        : msg_(fmt::format("Couldn't open input file: {}", path.generic_string())){};

    virtual const char* what() const noexcept override
    {
        return msg_.c_str();
    }
};

class OutputFileException : public std::exception
{
    std::string msg_;

public:
    OutputFileException(const std::filesystem::path& path) noexcept
        : msg_(fmt::format("Failed to open {} for output.", path.generic_string())){};

    virtual const char* what() const noexcept override
    {
        return msg_.c_str();
    }
};

} // namespace stretch::exceptions

#endif // EXCEPTIONS_H
