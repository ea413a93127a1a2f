#ifndef LOG_HPP
#define LOG_HPP

#include <cstdio>
#include <cstdarg>

void dprintf(const char* format, ...);

#endif
