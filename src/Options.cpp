#include "Options.hpp"
#include <cerrno>
#include <cstdlib>

bool parse_positive(const char *text, long max, long &out) {
    char *end = nullptr;
    errno = 0;
    long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE) return false;
    if (value <= 0 || value > max) return false;
    out = value;
    return true;
}
