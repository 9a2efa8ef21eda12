#include <algorithm>
#include <syslog.h>
#include <utility>

#include "ProgressSync.h"
#include "ServiceError.h"
#include "utils.h"

ProgressDecision reconcileHeartbeat(const std::optional<ProgressRecord>& current,
                                    const std::string& deviceId,
                                    long long reportedPosition,
                                    long long nowMs,
                                    long long maxIntervalSecs) {
    ProgressDecision d;

    if (!current) {
        d.next = ProgressRecord{reportedPosition, 0, nowMs, deviceId};
        return d;
    }

    d.next = *current;

    if (deviceId == current->lastDeviceId) {
        // continuous session: clock skew or a suspended client never earns more than one interval
        const long long elapsed = (nowMs - current->lastReadAt) / 1000;
        d.credited = std::clamp(elapsed, 0LL, std::max(maxIntervalSecs, 0LL));
        d.next.position = reportedPosition;
    } else if (reportedPosition != current->position) {
        // switching device opened the book before the other device's last write
        d.synced = false;
    }

    d.next.readingTime += d.credited;
    d.next.lastReadAt   = nowMs;
    d.next.lastDeviceId = deviceId;
    return d;
}

ProgressSync::ProgressSync(Database& db, long long maxIntervalSecs, Clock clock)
    : db_(db), maxIntervalSecs_(maxIntervalSecs), clock_(std::move(clock)) {}

HeartbeatResult ProgressSync::heartbeat(long long userId, long long bookId,
                                        const std::string& deviceId, long long position) {
    auto decision = db_.applyProgress(userId, bookId,
        [&](const BookRecord& book, const std::optional<ProgressRecord>& current) {
            if (position < 0 || position > book.charLength())
                throw ServiceError(ErrorKind::InvalidRange,
                                   "position " + std::to_string(position) + " outside [0, " +
                                   std::to_string(book.charLength()) + "]");
            return reconcileHeartbeat(current, deviceId, position, clock_(), maxIntervalSecs_);
        });

    if (!decision.synced) {
        syslog(SYSLOG_DEBUG, "user [%lld] book [%lld]: device [%s] re-anchored from %lld to %lld",
               userId, bookId, deviceId.c_str(), position, decision.next.position);
    }

    return HeartbeatResult{decision.synced, decision.next.position, decision.next.readingTime};
}
