#ifndef TXTREADER_JUMPTOCHAPTER_H
#define TXTREADER_JUMPTOCHAPTER_H

int registerJumpToChapterHandler(void);

#endif
