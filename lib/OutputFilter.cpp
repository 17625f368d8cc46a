/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Classification of the manager's streamed install output
 */

#include "OutputFilter.hpp"
#include "Util.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <regex>

namespace UpdateKit {

namespace {

const std::regex byteCounterRe(R"((\d+(\.\d+)?)\s*(B|KB|MB|GB|TB|KiB|MiB|GiB|TiB)\s*/\s*(\d+(\.\d+)?)\s*(B|KB|MB|GB|TB|KiB|MiB|GiB|TiB))",
                               std::regex::icase);
const std::regex percentRe(R"(^\d{1,3}(\.\d+)?\s*%$)");

// Full block, dark, medium and light shade (UTF-8)
const std::array<std::string, 4> barGlyphs = {"\xE2\x96\x88", "\xE2\x96\x93", "\xE2\x96\x92", "\xE2\x96\x91"};

bool hasBarGlyph(const std::string &s) {
    return std::any_of(barGlyphs.begin(), barGlyphs.end(),
            [&s](const std::string &glyph) { return Util::contains(s, glyph); });
}

} // anonymous namespace

LineKind OutputFilter::classify(const std::string &line) {
    std::string s = Util::visibleText(line);
    Util::trim(s);
    if (s.empty())
        return LineKind::Blank;

    if (std::regex_search(s, byteCounterRe) || std::regex_match(s, percentRe) || hasBarGlyph(s))
        return LineKind::ByteProgress;

    if (std::all_of(s.begin(), s.end(), [](unsigned char c) {
            return c == '-' || c == '\\' || c == '|' || c == '/' || std::isspace(c);
        }))
        return LineKind::Spinner;

    return LineKind::Text;
}

} // namespace UpdateKit
