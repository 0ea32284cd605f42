/// @file error.cpp
/// @brief Error factories and human-readable rendering.

#include "core/error.hpp"

#include <sstream>

namespace starlane
{

std::string_view to_string(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::UnknownPoint:       return "unknown_point";
        case ErrorKind::InvalidConstraint:  return "invalid_constraint";
        case ErrorKind::RouteNotFound:      return "route_not_found";
        case ErrorKind::CorruptIndex:       return "corrupt_index";
        case ErrorKind::UnsupportedVersion: return "unsupported_version";
        case ErrorKind::HeatCalculation:    return "heat_calculation";
        case ErrorKind::ShipData:           return "ship_data";
        case ErrorKind::Io:                 return "io";
    }
    return "unknown";
}

// -----------------------------------------------------------------
// message
// -----------------------------------------------------------------

std::string Error::message() const
{
    std::ostringstream out;

    switch (kind)
    {
        case ErrorKind::UnknownPoint:
            out << "unknown point name: " << name;
            if (suggestions.size() == 1)
            {
                out << ". Did you mean '" << suggestions.front() << "'?";
            }
            else if (suggestions.size() > 1)
            {
                out << ". Did you mean one of: ";
                for (std::size_t i = 0; i < suggestions.size(); ++i)
                {
                    if (i > 0)
                    {
                        out << ", ";
                    }
                    out << "'" << suggestions[i] << "'";
                }
                out << "?";
            }
            break;

        case ErrorKind::InvalidConstraint:
            out << "invalid constraint: " << reason;
            break;

        case ErrorKind::RouteNotFound:
            out << "no route found between " << start << " and " << goal;
            if (!hint.empty())
            {
                out << " (" << hint << ")";
            }
            break;

        case ErrorKind::CorruptIndex:
            out << "corrupt spatial index: " << reason;
            break;

        case ErrorKind::UnsupportedVersion:
            out << "unsupported spatial index version " << version
                << " (newest supported: " << supported << ")";
            break;

        case ErrorKind::HeatCalculation:
            out << "heat calculation failed: " << reason;
            break;

        case ErrorKind::ShipData:
            out << "invalid ship data: " << reason;
            break;

        case ErrorKind::Io:
            out << "i/o error on " << path << ": " << reason;
            break;
    }

    return out.str();
}

// -----------------------------------------------------------------
// Factories
// -----------------------------------------------------------------

Error Error::unknown_point(std::string name, std::vector<std::string> suggestions)
{
    Error e;
    e.kind = ErrorKind::UnknownPoint;
    e.name = std::move(name);
    e.suggestions = std::move(suggestions);
    return e;
}

Error Error::invalid_constraint(std::string reason)
{
    Error e;
    e.kind = ErrorKind::InvalidConstraint;
    e.reason = std::move(reason);
    return e;
}

Error Error::route_not_found(std::string start, std::string goal, std::string hint)
{
    Error e;
    e.kind = ErrorKind::RouteNotFound;
    e.start = std::move(start);
    e.goal = std::move(goal);
    e.hint = std::move(hint);
    return e;
}

Error Error::corrupt_index(std::string reason)
{
    Error e;
    e.kind = ErrorKind::CorruptIndex;
    e.reason = std::move(reason);
    return e;
}

Error Error::unsupported_version(int version, int supported)
{
    Error e;
    e.kind = ErrorKind::UnsupportedVersion;
    e.version = version;
    e.supported = supported;
    return e;
}

Error Error::heat_calculation(std::string reason)
{
    Error e;
    e.kind = ErrorKind::HeatCalculation;
    e.reason = std::move(reason);
    return e;
}

Error Error::ship_data(std::string reason)
{
    Error e;
    e.kind = ErrorKind::ShipData;
    e.reason = std::move(reason);
    return e;
}

Error Error::io(std::string path, std::string reason)
{
    Error e;
    e.kind = ErrorKind::Io;
    e.path = std::move(path);
    e.reason = std::move(reason);
    return e;
}

} // namespace starlane
