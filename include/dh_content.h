#ifndef TXTREADER_CONTENT_H
#define TXTREADER_CONTENT_H

#include "TextStore.h"

int registerContentHandler(const TextStore& store);

#endif
