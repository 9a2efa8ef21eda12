#ifndef TXTREADER_SESSIONMANAGER_H
#define TXTREADER_SESSIONMANAGER_H

#include <unordered_map>
#include <mutex>
#include <string>
#include <chrono>

#include <drogon/drogon.h>

//
// SessionManager:  handles authorisation tokens
//   This is the identity collaborator: every /api call resolves its bearer
//   token to a user id here before touching a book.
//
class SessionManager {
public:
    using Clock = std::chrono::system_clock;
    struct SessionToken {
        const std::string token;
        const std::chrono::time_point<Clock> expiry;
    };

    // robust singleton - no copying or assignment
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;
    SessionManager(SessionManager&&) = delete;
    SessionManager& operator=(SessionManager&&) = delete;

    static SessionManager& instance();  // singleton instance

    // add a session for this user and return token/expiry
    SessionToken add(long long userId,
                     const std::string& username,
                     const std::string& device);

    // returns user id if token valid, else 0
    long long userIdIfValid(const drogon::HttpRequestPtr& req);
    long long userIdIfValid(const std::string& token);

private:
    struct Session {
        long long userId;
        std::string username;
        std::string device;
        std::chrono::time_point<Clock> expires;
    };

    SessionManager() = default; // singleton

    std::string bearerToken(const drogon::HttpRequestPtr& req);
    std::string makeToken(size_t bytes = 32);   // create a token
    void pruneExpired();                        // deletes old tokens

    std::unordered_map<std::string, Session> sessions_;
    std::mutex mu_;
};

#endif // TXTREADER_SESSIONMANAGER_H
