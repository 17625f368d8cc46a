/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Helper class
 */

#ifndef U_K_UTIL_H
#define U_K_UTIL_H

#include <cstdlib>
#include <string>
#include <vector>

namespace UpdateKit {

struct Util {
    static void ltrim(std::string &s);
    static void rtrim(std::string &s);
    static void trim(std::string &s);
    static std::string toLower(std::string s);
    static bool contains(const std::string &haystack, const std::string &needle);
    static std::string join(const std::vector<std::string> &parts, const std::string &separator);
    static std::vector<std::string> splitLines(const std::string &text);

    /**
     * @brief Text as a terminal would show it
     *
     * Drops a trailing carriage return (CRLF line endings) and everything up to the last
     * remaining one, i.e. spinner frames the manager redraws before the actual line.
     */
    static std::string visibleText(const std::string &line);

    /**
     * @brief Strip decorative glyphs, collapse whitespace runs and trim
     *
     * Removes the ellipsis the manager uses for truncated cells, guillemets, zero-width spaces
     * and byte order marks; non-breaking spaces count as whitespace.
     */
    static std::string cleanText(std::string text);

    /**
     * @brief Byte offsets of every code point in the UTF-8 string s
     * @return one entry per code point plus a final entry equal to s.size()
     *
     * Throws std::invalid_argument for malformed sequences.
     */
    static std::vector<size_t> codepointOffsets(const std::string &s);

    /**
     * @brief Number of code points in s, or std::string::npos for invalid UTF-8
     */
    static size_t codepointLength(const std::string &s);
};

struct CString {
    ~CString() { free(ptr); }
    operator char*() { return ptr; }
    char *ptr = nullptr;
};

} // namespace UpdateKit

#endif // U_K_UTIL_H
