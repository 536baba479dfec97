/*
 * This file is part of PowerGuard Actuator (PGuard).
 *
 * Copyright (c) 2025 Ian Anthony R. Tancinco
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "utils.h"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <cctype>
#include <fstream>
#include <iterator>
#include <unistd.h>

void asciiLower(std::string& s)
{
    for (char& c : s)
    {
        if (c >= 'A' && c <= 'Z') c = c - 'A' + 'a';
    }
}

std::string ToLower(std::string s)
{
    asciiLower(s);
    return s;
}

std::string Trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

bool IsBlank(const std::optional<std::string>& s)
{
    return !s.has_value() || Trim(*s).empty();
}

std::string SanitizeText(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            out += (c < 0x20 && c != '\t') || c == 0x7F ? '?' : static_cast<char>(c);
            ++i;
            continue;
        }

        size_t len = 0;
        unsigned int cp = 0;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }

        bool valid = len != 0 && i + len <= s.size();
        for (size_t k = 1; valid && k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) valid = false;
            else cp = (cp << 6) | (cc & 0x3F);
        }
        // Reject overlong forms, surrogates and values past U+10FFFF
        if (valid) {
            static const unsigned int minCp[] = { 0, 0, 0x80, 0x800, 0x10000 };
            valid = cp >= minCp[len] && cp <= 0x10FFFF && !(cp >= 0xD800 && cp <= 0xDFFF);
        }

        if (valid) {
            out.append(s, i, len);
            i += len;
        } else {
            out += '?';
            ++i;
        }
    }
    return out;
}

bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle)
{
    if (needle.empty() || haystack.empty()) return false;

    auto it = std::search(
        haystack.begin(), haystack.end(),
        needle.begin(), needle.end(),
        [](char ch1, char ch2) {
            return std::tolower(static_cast<unsigned char>(ch1)) ==
                   std::tolower(static_cast<unsigned char>(ch2));
        }
    );
    return it != haystack.end();
}

std::optional<long long> ParseInteger(const std::string& s)
{
    std::string t = Trim(s);
    if (t.empty()) return std::nullopt;
    try {
        size_t used = 0;
        long long v = std::stoll(t, &used, 10);
        if (used != t.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> ParseBool(const std::string& s)
{
    std::string t = ToLower(Trim(s));
    if (t == "true" || t == "1" || t == "yes" || t == "on") return true;
    if (t == "false" || t == "0" || t == "no" || t == "off") return false;
    return std::nullopt;
}

bool IsValidPackageName(const std::string& pkg)
{
    if (pkg.empty() || pkg.size() > 255) return false;
    if (pkg.front() == '.' || pkg.back() == '.') return false;

    bool segmentStart = true;
    for (char c : pkg) {
        if (c == '.') {
            if (segmentStart) return false; // empty segment
            segmentStart = true;
            continue;
        }
        bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        bool digit = c >= '0' && c <= '9';
        if (segmentStart && !alpha) return false;
        if (!alpha && !digit && c != '_') return false;
        segmentStart = false;
    }
    return true;
}

uint64_t NowEpochMs()
{
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

std::string FormatEpochMs(uint64_t epochMs, int utcOffsetMinutes, const char* fmt)
{
    long long shifted = static_cast<long long>(epochMs / 1000) + static_cast<long long>(utcOffsetMinutes) * 60;
    std::time_t t = static_cast<std::time_t>(shifted);

    struct tm timeinfo {};
    char buf[64] = {0};
    if (gmtime_r(&t, &timeinfo) == nullptr) return "";
    if (std::strftime(buf, sizeof(buf), fmt, &timeinfo) == 0) return "";
    return buf;
}

std::optional<std::string> ReadSmallFile(const std::filesystem::path& path, size_t maxBytes)
{
    std::ifstream f(path, std::ios::binary);
    if (!f) return std::nullopt;

    std::string data;
    char buf[4096];
    while (f && data.size() < maxBytes) {
        f.read(buf, sizeof(buf));
        data.append(buf, static_cast<size_t>(f.gcount()));
    }
    if (data.size() > maxBytes) data.resize(maxBytes);
    return data;
}

std::string JoinArgs(const std::vector<std::string>& argv)
{
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

void UniqueFd::reset(int fd)
{
    if (m_fd >= 0) ::close(m_fd);
    m_fd = fd;
}
