#pragma once

#include <stdexcept>
#include <string>

#include "common/enums.hpp"

namespace hashprint {

// Every failure of a run is reported as a HashprintError. A missing state file
// is not an error; StateStore::load returns an empty optional for it.
class HashprintError : public std::runtime_error
{
public:
    HashprintError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    ErrorKind kind() const
    {
        return m_kind;
    }

private:
    ErrorKind m_kind;
};

inline const char *toKindString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Io:
        return "io";
    case ErrorKind::Deserialize:
        return "deserialize";
    case ErrorKind::RootMismatch:
        return "root_mismatch";
    }
    return "io";
}

} // namespace hashprint
