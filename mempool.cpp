#include "mempool.h"

#include <stdlib.h>
#include <assert.h>

struct mempool {
	mempool* next;
	size_t used;
};

#define MEMPOOL_RESERVED ((sizeof(mempool)+15) & ~0xF)
#define MEMPOOL_SIZE (1<<18)

void* mempool_new(mempool*& rpm, size_t size)
{
	assert(size < MEMPOOL_SIZE-MEMPOOL_RESERVED);

	const size_t aligned = (size+15) & ~(size_t)0xF;
	if (rpm && (rpm->used+aligned) <= MEMPOOL_SIZE) {
		size_t prevused = rpm->used;
		rpm->used += aligned;
		return ((char*)rpm) + prevused;
	}

	char* mem = (char*) calloc(MEMPOOL_SIZE, 1);
	if (!mem) {
		return NULL;
	}

	mempool* old = rpm;
	rpm = (mempool*)mem;
	rpm->used = MEMPOOL_RESERVED;
	rpm->next = old;

	return mempool_new(rpm, size);
}

void mempool_free(mempool* m)
{
	while (m) {
		mempool* next = m->next;
		free(m);
		m = next;
	}
}
