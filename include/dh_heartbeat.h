#ifndef TXTREADER_HEARTBEAT_H
#define TXTREADER_HEARTBEAT_H

int registerHeartbeatHandler(void);

#endif
