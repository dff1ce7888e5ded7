#pragma once

namespace hashprint {

enum class ErrorKind {
    Io,
    Deserialize,
    RootMismatch
};

} // namespace hashprint
