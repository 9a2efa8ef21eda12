#ifndef TXTREADER_UTILS_H
#define TXTREADER_UTILS_H

#include <exception>
#include <string>

// because Drogon redefines these, let's capture them as constants
extern const int SYSLOG_INFO, SYSLOG_ERR, SYSLOG_DEBUG;

// functions
[[noreturn]] void logFatal(const std::exception &ex, int exitCode);
long long nowMs(void);
std::string toLower(std::string s);
std::string trimAscii(const std::string& s);
bool endsWithNoCase(const std::string& s, const std::string& suffix);
bool parseInt64(const std::string& s, long long& out);

#endif // TXTREADER_UTILS_H
