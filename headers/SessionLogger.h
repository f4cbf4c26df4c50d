#pragma once
#include <fstream>
#include <string>
#include <vector>

// receives the session log lines, synchronously and exactly once each
class SessionLogger
{
public:
    virtual ~SessionLogger() = default;

    virtual void logSettings(const std::string &summary) = 0;
    virtual void logHeader(const std::vector<std::string> &labels) = 0;
    // one row per tick with at least one conversion
    virtual void logCounts(long step, const std::vector<int> &counts) = 0;
    virtual void logGameEnd(double elapsedSeconds, long steps) = 0;
};

// appends to a text log and echoes to stdout unless quiet
// write failures are reported once on stderr and otherwise ignored
class FileSessionLogger : public SessionLogger
{
public:
    FileSessionLogger(const std::string &filename, bool quiet);

    void logSettings(const std::string &summary) override;
    void logHeader(const std::vector<std::string> &labels) override;
    void logCounts(long step, const std::vector<int> &counts) override;
    void logGameEnd(double elapsedSeconds, long steps) override;

    bool isOpen() const { return file_.is_open(); }

    // "YYYY-MM-DD HH:MM:SS.ffffff" local time
    static std::string timestamp();

private:
    std::ofstream file_;
    std::string filename_;
    bool quiet_;
    bool warned_ = false;

    void writeLine(const std::string &line);
};
