module;

#include <cstddef>
#include <format>
#include <string>

module Topology:Errors.Impl;

import Core;
import :Errors;

namespace Topology
{
    std::string Describe(const TopologyError& error)
    {
        std::string out = std::format("{}", Core::ErrorCodeToString(error.Code));
        if (error.Violated != Invariant::None)
            out += std::format(" ({})", InvariantToString(error.Violated));
        if (!error.Detail.empty())
            out += std::format(": {}", error.Detail);
        if (!error.Cells.empty())
        {
            out += " [";
            for (std::size_t i = 0; i < error.Cells.size(); ++i)
            {
                if (i > 0) out += ' ';
                out += std::format("{}", error.Cells[i]);
            }
            out += ']';
        }
        return out;
    }
}
