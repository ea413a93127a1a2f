#ifndef OPTIONS_HPP
#define OPTIONS_HPP

// Parses a decimal integer in [1, max]. Rejects trailing characters and overflow.
bool parse_positive(const char *text, long max, long &out);

#endif
