#ifndef TXTREADER_USERINFO_H
#define TXTREADER_USERINFO_H

int registerUserInfoHandler(void);

#endif
