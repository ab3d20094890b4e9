// -*- related-file-name: "../include/duplex/nodeallocator.hh" -*-
/*
 * nodeallocator.{cc,hh} -- pool allocator for list nodes
 *
 * Copyright (c) 2026 The Duplex authors
 *
 * Permission is hereby granted, free of charge, to any person obtaining a
 * copy of this software and associated documentation files (the "Software"),
 * to deal in the Software without restriction, subject to the conditions
 * listed in the Duplex LICENSE file. These conditions include: you must
 * preserve this copyright notice, and you cannot mention the copyright
 * holders in advertising related to the Software without their permission.
 * The Software is provided WITHOUT ANY WARRANTY, EXPRESS OR IMPLIED. This
 * notice is a summary of the Duplex LICENSE file; the license in that file is
 * legally binding.
 */

#include <duplex/config.h>
#include <duplex/glue.hh>
#include <duplex/nodeallocator.hh>
DUPLEX_DECLS

NodeAllocator::NodeAllocator(size_t size)
    : _free(0), _buffer(0), _size(size < sizeof(link) ? sizeof(link) : size)
{
#ifdef VALGRIND_CREATE_MEMPOOL
    VALGRIND_CREATE_MEMPOOL(this, 0, 0);
#endif
}

NodeAllocator::~NodeAllocator()
{
    while (buffer *b = _buffer) {
	_buffer = b->next;
	delete[] reinterpret_cast<char *>(b);
    }
#ifdef VALGRIND_DESTROY_MEMPOOL
    VALGRIND_DESTROY_MEMPOOL(this);
#endif
}

void *NodeAllocator::hard_allocate()
{
    size_t nelements;

    // each new buffer doubles the last, up to max_buffer_size
    if (!_buffer)
	nelements = (min_buffer_size - header_size) / _size;
    else {
	size_t shift = sizeof(size_t) * 8 - ffs_msb(_buffer->maxpos + _size);
	size_t new_size = (size_t) 1 << (shift + 1);
	if (new_size > max_buffer_size)
	    new_size = max_buffer_size;
	nelements = (new_size - header_size) / _size;
    }
    if (nelements < min_nelements)
	nelements = min_nelements;

    buffer *b = reinterpret_cast<buffer *>(new(std::nothrow) char[header_size + _size * nelements]);
    if (b) {
	b->next = _buffer;
	_buffer = b;
	b->maxpos = header_size + _size * nelements;
	b->pos = header_size + _size;
	void *data = reinterpret_cast<char *>(_buffer) + header_size;
#ifdef VALGRIND_MEMPOOL_ALLOC
	VALGRIND_MEMPOOL_ALLOC(this, data, _size);
#endif
	return data;
    } else
	return 0;
}

/** @brief Exchange the contents of this allocator and @a x.
 *
 * Blocks allocated from either allocator move with its buffers. */
void NodeAllocator::swap(NodeAllocator &x)
{
    size_t xsize = _size;
    _size = x._size;
    x._size = xsize;

    link *xfree = _free;
    _free = x._free;
    x._free = xfree;

    buffer *xbuffer = _buffer;
    _buffer = x._buffer;
    x._buffer = xbuffer;

#ifdef VALGRIND_MOVE_MEMPOOL
    VALGRIND_MOVE_MEMPOOL(this, reinterpret_cast<NodeAllocator *>(100));
    VALGRIND_MOVE_MEMPOOL(&x, this);
    VALGRIND_MOVE_MEMPOOL(reinterpret_cast<NodeAllocator *>(100), &x);
#endif
}

DUPLEX_ENDDECLS
