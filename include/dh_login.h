#ifndef TXTREADER_LOGIN_H
#define TXTREADER_LOGIN_H

int registerLoginHandler(void);

#endif
