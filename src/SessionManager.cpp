#include <strings.h>    // for strncasecmp()
#include <vector>

#include <sodium.h>

#include "SessionManager.h"
#include "Config.h"

// singleton instance
SessionManager& SessionManager::instance() {
    static SessionManager inst;     // instantiated once on first-call
    return inst;
}

// add a user/device
// RETURNS: token/expiry
SessionManager::SessionToken SessionManager::add(long long userId,
                                                 const std::string& username,
                                                 const std::string& device) {

    const auto token = makeToken();
    const auto tokenLife = Config::get().tokenTimeout() * 60; // in secs
    const auto expires = Clock::now() + std::chrono::seconds(tokenLife);

    std::lock_guard<std::mutex> lk(mu_);
    pruneExpired(); // do some housekeeping first
    sessions_[token] = Session{userId, username, device, expires};

    return SessionToken{token,expires};
}

// create a token from the OS CSPRNG
std::string SessionManager::makeToken(size_t bytes) {
    std::vector<unsigned char> raw(bytes);
    randombytes_buf(raw.data(), raw.size());
    std::string hex(bytes * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), raw.data(), raw.size());
    hex.pop_back();     // drop the terminator sodium wrote
    return hex;
}

// extract the token from a HttpRequest header
std::string SessionManager::bearerToken(const drogon::HttpRequestPtr& req) {
  auto h = req->getHeader("authorization");
  if (h.size() >= 7 && strncasecmp(h.c_str(), "Bearer ", 7) == 0)
    return h.substr(7);
  return "";
}

// validate token inside HttpRequest header
// RETURN: user id if token is valid, else 0
long long SessionManager::userIdIfValid(const drogon::HttpRequestPtr& req) {
    const std::string token = bearerToken(req);
    return userIdIfValid(token);
}

// validate token
// RETURN: user id if token is valid, else 0
long long SessionManager::userIdIfValid(const std::string& token) {
    if (token.empty()) return 0;   // no token

    const auto now = Clock::now();

    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(token);
    if (it == sessions_.end()) return 0;   // couldn't find it

    if (it->second.expires <= now) {
        // this single entry has expired already, so may as well delete it now
        sessions_.erase(it);
        return 0;
    }

    return it->second.userId;
}

// pruneExpired(): delete old tokens
// note: assumes you have already locked the mutex
void SessionManager::pruneExpired() {
    const auto now = Clock::now();
    for (auto it = sessions_.begin(); it != sessions_.end(); ) {
        if (it->second.expires <= now) it = sessions_.erase(it);
        else ++it;
    }
}
