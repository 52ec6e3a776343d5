#include "errors.hpp"

const char *toString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Config:
        return "config";
    case ErrorKind::Transport:
        return "transport";
    case ErrorKind::Integrity:
        return "integrity";
    case ErrorKind::Io:
        return "io";
    case ErrorKind::Cancelled:
        return "cancelled";
    }
    return "unknown";
}
