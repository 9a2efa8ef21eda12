#ifndef TXTREADER_UPLOAD_H
#define TXTREADER_UPLOAD_H

#include "ChapterIndexer.h"
#include "TextStore.h"

int registerUploadHandler(TextStore& store, const ChapterIndexer& indexer);

#endif
