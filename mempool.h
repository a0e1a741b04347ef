#pragma once

#include <stddef.h>

struct mempool;

/* returns zeroed memory, or NULL if a new block can't be allocated */
void* mempool_new(mempool*& rpm, size_t size);
void mempool_free(mempool* m);
