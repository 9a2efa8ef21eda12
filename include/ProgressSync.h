#ifndef TXTREADER_PROGRESSSYNC_H
#define TXTREADER_PROGRESSSYNC_H

#include <functional>
#include <optional>
#include <string>

#include "Database.h"
#include "Models.h"

struct HeartbeatResult {
    bool      synced      = true;
    long long position    = 0;      // authoritative position after this heartbeat
    long long readingTime = 0;      // cumulative seconds for (user, book)
};

//
// reconcileHeartbeat(): the pure progress state machine.
//   no row yet          -> create it at the reported position, synced
//   same device         -> credit elapsed (clamped to [0, maxIntervalSecs]), take reported position
//   different device    -> credit nothing; keep the stored position unless the
//                          reported one matches it (synced only if it does)
//   last_device_id/last_read_at always move to this heartbeat.
//
ProgressDecision reconcileHeartbeat(const std::optional<ProgressRecord>& current,
                                    const std::string& deviceId,
                                    long long reportedPosition,
                                    long long nowMs,
                                    long long maxIntervalSecs);

//
// ProgressSync: heartbeat entry point.  Each call is one transaction on the
// (user, book) row, so concurrent heartbeats never double-credit time.
//
class ProgressSync {
public:
    using Clock = std::function<long long()>;   // epoch ms

    ProgressSync(Database& db, long long maxIntervalSecs, Clock clock);

    // throws ServiceError(NotFound) for an unknown book,
    //        ServiceError(InvalidRange) if position is outside the book
    HeartbeatResult heartbeat(long long userId, long long bookId,
                              const std::string& deviceId, long long position);

private:
    Database& db_;
    long long maxIntervalSecs_;
    Clock clock_;
};

#endif // TXTREADER_PROGRESSSYNC_H
