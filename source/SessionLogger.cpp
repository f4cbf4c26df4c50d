#include "SessionLogger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

FileSessionLogger::FileSessionLogger(const std::string &filename, bool quiet)
    : file_(filename, std::ios::app), filename_(filename), quiet_(quiet)
{
    if (!file_.is_open())
    {
        std::cerr << "Warning: Could not open log file for writing: " << filename << std::endl;
        warned_ = true;
    }
}

void FileSessionLogger::logSettings(const std::string &summary)
{
    writeLine(summary);
}

void FileSessionLogger::logHeader(const std::vector<std::string> &labels)
{
    std::string header = "STEP";
    for (const auto &label : labels)
    {
        header += "," + label;
    }
    writeLine(header);
}

void FileSessionLogger::logCounts(long step, const std::vector<int> &counts)
{
    std::ostringstream row;
    row << step;
    for (int count : counts)
    {
        row << "," << count;
    }
    writeLine(row.str());
}

void FileSessionLogger::logGameEnd(double elapsedSeconds, long steps)
{
    std::ostringstream oss;
    oss << "game_end at " << timestamp()
        << "; elapsed=" << std::fixed << std::setprecision(3) << elapsedSeconds << "s"
        << "; steps=" << steps;
    writeLine(oss.str());
}

std::string FileSessionLogger::timestamp()
{
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "." << std::setw(6) << std::setfill('0') << micros;
    return oss.str();
}

void FileSessionLogger::writeLine(const std::string &line)
{
    if (file_.is_open())
    {
        file_ << line << std::endl;
        if (!file_ && !warned_)
        {
            std::cerr << "Warning: failed writing to log file " << filename_ << ", continuing without it" << std::endl;
            warned_ = true;
        }
    }
    if (!quiet_)
        std::cout << line << std::endl;
}
