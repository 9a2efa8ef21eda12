#ifndef TXTREADER_ROOT_H
#define TXTREADER_ROOT_H

int registerRootHandler(void);

#endif
