// because Drogon redefines these, let's capture them as constants
// make sure this is done in utils.cpp before #including anything Drogon
#include "utils.h"  // this must be here to bring in externs (to keep C++ linker happy)
#include <syslog.h>
const int SYSLOG_INFO  = LOG_INFO;
const int SYSLOG_ERR   = LOG_ERR;
const int SYSLOG_DEBUG = LOG_DEBUG;
// now you can safely include Drogon stuff if you want to...

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <iostream>

// for logging fatal exceptions to syslog
[[noreturn]] void logFatal(const std::exception &ex, int exitCode) {
  std::string msg = std::string("Fatal: ") + ex.what();
  std::cerr << msg << std::endl;
  syslog(SYSLOG_ERR, "%s", msg.c_str());
  closelog();   // flush
  exit(exitCode);
}

// return UTC time at this moment in milliseconds
long long nowMs(void) {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string toLower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// strip spaces/tabs/newlines from both ends
std::string trimAscii(const std::string& s) {
    const char* ws = " \t\r\n";
    auto a = s.find_first_not_of(ws);
    if (a == std::string::npos) return {};
    auto b = s.find_last_not_of(ws);
    return s.substr(a, b - a + 1);
}

bool endsWithNoCase(const std::string& s, const std::string& suffix) {
    if (s.size() < suffix.size()) return false;
    return toLower(s.substr(s.size() - suffix.size())) == toLower(suffix);
}

// strict decimal parse: optional leading '-', digits only, must fit in 64 bits
bool parseInt64(const std::string& s, long long& out) {
    if (s.empty() || std::isspace(static_cast<unsigned char>(s[0]))) return false;
    try {
        size_t pos = 0;
        long long v = std::stoll(s, &pos, 10);
        if (pos != s.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}
