/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Helper class
 */

#include "Util.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace UpdateKit {

using namespace std;

namespace {

// UTF-8 encoded glyphs removed from table cells
const array<string, 5> decorativeGlyphs = {
    "\xE2\x80\xA6", // horizontal ellipsis
    "\xC2\xAB",     // left guillemet
    "\xC2\xBB",     // right guillemet
    "\xE2\x80\x8B", // zero-width space
    "\xEF\xBB\xBF"  // byte order mark
};
const string nonBreakingSpace = "\xC2\xA0";

void replaceAll(string &s, const string &from, const string &to) {
    for (size_t pos = 0; (pos = s.find(from, pos)) != string::npos; pos += to.length())
        s.replace(pos, from.length(), to);
}

} // anonymous namespace

// trim from start (in place)
void Util::ltrim(string &s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(),
            [](unsigned char a) { return !std::isspace(a); }));
}

// trim from end (in place)
void Util::rtrim(string &s) {
    s.erase(std::find_if(s.rbegin(), s.rend(),
            [](unsigned char a) { return !std::isspace(a); }).base(), s.end());
}

// trim from both ends (in place)
void Util::trim(string &s) {
    ltrim(s);
    rtrim(s);
}

string Util::toLower(string s) {
    std::transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool Util::contains(const string &haystack, const string &needle) {
    return haystack.find(needle) != string::npos;
}

string Util::join(const vector<string> &parts, const string &separator) {
    string result;
    for (auto it = parts.begin(); it != parts.end(); ++it) {
        if (it != parts.begin())
            result.append(separator);
        result.append(*it);
    }
    return result;
}

vector<string> Util::splitLines(const string &text) {
    vector<string> lines;
    stringstream ss(text);
    for (string line; getline(ss, line); )
        lines.push_back(line);
    return lines;
}

string Util::visibleText(const string &line) {
    string s = line;
    while (!s.empty() && s.back() == '\r')
        s.pop_back();
    size_t cr = s.rfind('\r');
    if (cr != string::npos)
        s.erase(0, cr + 1);
    return s;
}

string Util::cleanText(string text) {
    for (auto &glyph: decorativeGlyphs)
        replaceAll(text, glyph, "");
    replaceAll(text, nonBreakingSpace, " ");

    string result;
    bool pendingSpace = false;
    for (unsigned char c: text) {
        if (std::isspace(c)) {
            pendingSpace = !result.empty();
            continue;
        }
        if (pendingSpace) {
            result.push_back(' ');
            pendingSpace = false;
        }
        result.push_back(c);
    }
    return result;
}

vector<size_t> Util::codepointOffsets(const string &s) {
    vector<size_t> offsets;
    offsets.reserve(s.size() + 1);
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = s[i];
        size_t len;
        if (c < 0x80)
            len = 1;
        else if ((c & 0xE0) == 0xC0)
            len = 2;
        else if ((c & 0xF0) == 0xE0)
            len = 3;
        else if ((c & 0xF8) == 0xF0)
            len = 4;
        else
            throw invalid_argument{"Invalid UTF-8 lead byte at offset " + to_string(i) + "."};
        if (i + len > s.size())
            throw invalid_argument{"Truncated UTF-8 sequence at offset " + to_string(i) + "."};
        for (size_t k = 1; k < len; k++) {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80)
                throw invalid_argument{"Invalid UTF-8 continuation byte at offset " + to_string(i + k) + "."};
        }
        offsets.push_back(i);
        i += len;
    }
    offsets.push_back(s.size());
    return offsets;
}

size_t Util::codepointLength(const string &s) {
    try {
        return codepointOffsets(s).size() - 1;
    } catch (const invalid_argument &e) {
        return string::npos;
    }
}

} // namespace UpdateKit
