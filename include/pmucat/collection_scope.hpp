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

#include <pmucat/error.hpp>

#include <fmt/core.h>

#include <string>

namespace pmucat
{

enum class CollectionScope
{
    SYSTEM,
    PROCESS,
    CGROUP
};

/**
 * per-process and per-cgroup collection can not count events of shared (uncore) units
 */
inline bool is_task_bound(CollectionScope scope)
{
    return scope == CollectionScope::PROCESS || scope == CollectionScope::CGROUP;
}

inline std::string scope_name(CollectionScope scope)
{
    switch (scope)
    {
    case CollectionScope::SYSTEM:
        return "system";
    case CollectionScope::PROCESS:
        return "process";
    case CollectionScope::CGROUP:
        return "cgroup";
    }
    throw LookupError("Unknown CollectionScope!");
}

inline CollectionScope scope_from_string(const std::string& name)
{
    if (name == "system")
    {
        return CollectionScope::SYSTEM;
    }
    else if (name == "process")
    {
        return CollectionScope::PROCESS;
    }
    else if (name == "cgroup")
    {
        return CollectionScope::CGROUP;
    }
    throw LookupError(
        fmt::format("unknown collection scope '{}', expected system, process or cgroup", name));
}

} // namespace pmucat
