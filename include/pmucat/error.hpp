/*
 * This file is part of the pmucat software.
 * PMU event and metric catalog processing
 *
 * Copyright (c) 2024,
 *    Technische Universitaet Dresden, Germany
 *
 * pmucat is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * pmucat is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with pmucat.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace pmucat
{
class Error : public std::runtime_error
{
public:
    explicit Error(const std::string& what) : std::runtime_error(what)
    {
    }
};

/**
 * A malformed catalog line, record or file.
 */
class FormatError : public Error
{
public:
    FormatError(const std::filesystem::path& source, const std::string& what)
    : Error(source.string() + ": " + what), source_(source)
    {
    }

    explicit FormatError(const std::string& what) : Error(what)
    {
    }

    const std::filesystem::path& source() const
    {
        return source_;
    }

private:
    std::filesystem::path source_;
};

/**
 * A catalog file or directory is missing or can not be read.
 */
class ResourceError : public Error
{
public:
    ResourceError(const std::filesystem::path& path, const std::string& what)
    : Error(what + ": " + path.string()), path_(path)
    {
    }

    const std::filesystem::path& path() const
    {
        return path_;
    }

private:
    std::filesystem::path path_;
};

class LookupError : public Error
{
public:
    explicit LookupError(const std::string& what) : Error(what)
    {
    }
};

class ConditionalSyntaxError : public Error
{
public:
    ConditionalSyntaxError(const std::string& what, const std::string& fragment)
    : Error(what + ": " + fragment), fragment_(fragment)
    {
    }

    const std::string& fragment() const
    {
        return fragment_;
    }

private:
    std::string fragment_;
};
} // namespace pmucat
