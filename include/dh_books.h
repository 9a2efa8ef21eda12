#ifndef TXTREADER_BOOKS_H
#define TXTREADER_BOOKS_H

int registerBookListHandlers(void);

#endif
