#ifndef TXTREADER_CONFIG_H
#define TXTREADER_CONFIG_H

#include <string>
#include <unordered_map>

class Config {
public:
    // Singleton accessor
    static Config& get();

    // Load from file: overridePath, else $TXTREADER_CONF, else /etc/txtreader/txtreader.conf
    // Keys that are missing or invalid keep their defaults.
    void load(const std::string& overridePath = "");

    // Getters
    const std::string& host() const { return host_; }
    int port() const { return port_; }
    const std::string& dbPath() const { return dbPath_; }
    const std::string& libraryDir() const { return libraryDir_; }
    const std::string& uploadDir() const { return uploadDir_; }
    long long maxFileSize() const { return static_cast<long long>(maxFileSizeMB_) * 1024 * 1024; } // returns in bytes
    int maxFileSizeMB() const { return maxFileSizeMB_; }               // returns in MB
    int tokenTimeout() const  { return tokenTimeout_; }                // returns in mins
    int maxHeartbeatInterval() const { return maxHeartbeatInterval_; } // returns in secs
    int defaultWindow() const { return defaultWindow_; }               // returns in chars
    int maxWindow() const     { return maxWindow_; }                   // returns in chars

    std::string toShortString() const;
    std::string toString() const;

private:
    // Private constructor
    Config() = default;

    // Disable copy
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void resetDefaults();

    // Values
    std::string host_ = "127.0.0.1";
    int port_ = 9000;
    std::string dbPath_ = "/var/lib/txtreader/app.db";
    std::string libraryDir_ = "/var/lib/txtreader/library";
    std::string uploadDir_ = "/var/lib/txtreader/tmp";
    int maxFileSizeMB_ = 10;        // MB
    int tokenTimeout_ = 60;         // mins
    int maxHeartbeatInterval_ = 30; // secs
    int defaultWindow_ = 4000;      // chars
    int maxWindow_ = 10000;         // chars
};

#endif // TXTREADER_CONFIG_H
