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

#ifndef PGUARD_UTILS_H
#define PGUARD_UTILS_H

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstdint>

// Lowercase conversion (ASCII only)
void asciiLower(std::string& s);
std::string ToLower(std::string s);

std::string Trim(const std::string& s);
bool IsBlank(const std::optional<std::string>& s);

// Valid UTF-8 with control characters; anything else becomes '?'
std::string SanitizeText(const std::string& s);

// Case-insensitive containment check
bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle);

// Strict decimal parse; rejects trailing garbage
std::optional<long long> ParseInteger(const std::string& s);
std::optional<bool> ParseBool(const std::string& s);

// Android package-style identifier (a.b.c, optional :process suffix rejected)
bool IsValidPackageName(const std::string& pkg);

// Wall clock, Unix epoch milliseconds
uint64_t NowEpochMs();

// strftime over (epochMs + offset) interpreted as UTC
std::string FormatEpochMs(uint64_t epochMs, int utcOffsetMinutes, const char* fmt);

// Whole file, or nullopt if unreadable
std::optional<std::string> ReadSmallFile(const std::filesystem::path& path, size_t maxBytes = 1 << 20);

// argv joined for logging
std::string JoinArgs(const std::vector<std::string>& argv);

// Owns a POSIX file descriptor
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : m_fd(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : m_fd(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) reset(other.release());
        return *this;
    }

    int get() const { return m_fd; }
    explicit operator bool() const { return m_fd >= 0; }
    int release() { int fd = m_fd; m_fd = -1; return fd; }
    void reset(int fd = -1);

private:
    int m_fd = -1;
};

#endif // PGUARD_UTILS_H
