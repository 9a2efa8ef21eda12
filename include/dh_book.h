#ifndef TXTREADER_BOOK_H
#define TXTREADER_BOOK_H

#include "TextStore.h"

// GET / PUT / DELETE /api/books/{id}
int registerBookHandler(TextStore& store);

#endif
