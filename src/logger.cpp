#include "logger.h"
#include <fstream>
#include <mutex>
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <cstdio>
#include <sys/stat.h>

static std::mutex g_logMtx;
static std::filesystem::path g_logDirOverride;

std::filesystem::path GetLogPath()
{
    const char* home = std::getenv("PGUARD_HOME");
    if (home && *home)
    {
        return std::filesystem::path(home);
    }
    return std::filesystem::path("/data/local/tmp/pguard");
}

void SetLogDirectory(const std::filesystem::path& dir)
{
    std::lock_guard lg(g_logMtx);
    g_logDirOverride = dir;
}

void Log(const std::string& msg)
{
    std::lock_guard lg(g_logMtx);
    try
    {
        std::filesystem::path dir = g_logDirOverride.empty() ? GetLogPath() / "logs" : g_logDirOverride;

        if (!std::filesystem::exists(dir))
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (!ec)
            {
                // Owner: rwx, group/others: read-only
                ::chmod(dir.c_str(), 0755);
            }
        }

        std::ofstream log(dir / "pguard.log", std::ios::app);
        if (log)
        {
            auto now = std::chrono::system_clock::now();
            std::time_t t = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()).count() % 1000;

            const size_t TIMEBUF_SIZE = 32;
            char timebuf[TIMEBUF_SIZE] = {0};
            struct tm timeinfo;

            if (localtime_r(&t, &timeinfo) != nullptr)
            {
                if (std::strftime(timebuf, TIMEBUF_SIZE, "%Y-%m-%d %H:%M:%S", &timeinfo) > 0)
                {
                    char msbuf[8] = {0};
                    std::snprintf(msbuf, sizeof(msbuf), ".%03d", static_cast<int>(ms));
                    log << "[" << timebuf << msbuf << "] " << msg << std::endl;
                }
                else
                {
                    log << "[Timestamp Error] " << msg << std::endl;
                }
            }
            else
            {
                log << msg << std::endl;
            }
        }
    }
    catch (const std::exception&)
    {
        // Silent in daemon mode - no console output
    }
}
