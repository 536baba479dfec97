#ifndef PGUARD_LOGGER_H
#define PGUARD_LOGGER_H

#include <string>
#include <filesystem>

// Log a message to the global log file
void Log(const std::string& msg);

// Get the path to the data directory (config, journal, logs live below it)
std::filesystem::path GetLogPath();

// Override the log directory (config "log_dir"); empty restores the default
void SetLogDirectory(const std::filesystem::path& dir);

#endif // PGUARD_LOGGER_H
