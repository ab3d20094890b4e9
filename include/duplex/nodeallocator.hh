// -*- related-file-name: "../../lib/nodeallocator.cc" -*-
#ifndef DUPLEX_NODEALLOCATOR_HH
#define DUPLEX_NODEALLOCATOR_HH
#include <duplex/glue.hh>
#if HAVE_VALGRIND && HAVE_VALGRIND_MEMCHECK_H
# include <valgrind/memcheck.h>
#endif
DUPLEX_DECLS

/** @class NodeAllocator
 * @brief Pool allocator for fixed-size list nodes.
 *
 * A NodeAllocator hands out blocks of one fixed size, carved from
 * progressively larger buffers.  Deallocated blocks go onto a free list and
 * are reused before any new buffer space.  Memory returns to the system
 * only when the NodeAllocator is destroyed.
 *
 * NodeAllocator is not thread safe; its owner must serialize calls.
 *
 * When Valgrind is available, each NodeAllocator registers as a Valgrind
 * memory pool, so use of a deallocated node is reported. */
class NodeAllocator { public:

    NodeAllocator(size_t size);
    ~NodeAllocator();

    inline size_t size() const {
	return _size;
    }

    inline void *allocate();
    inline void deallocate(void *p);

    void swap(NodeAllocator &x);

  private:

    struct link {
	link *next;
    };

    struct buffer {
	buffer *next;
	size_t pos;
	size_t maxpos;
    };

    enum {
	min_buffer_size = 1024,
	max_buffer_size = 1048576,
	min_nelements = 8,
	header_size = (sizeof(buffer) + 15) & ~15
    };

    link *_free;
    buffer *_buffer;
    size_t _size;

    void *hard_allocate();

    NodeAllocator(const NodeAllocator &x);
    NodeAllocator &operator=(const NodeAllocator &x);

};


template <size_t node_size>
class SizedNodeAllocator : public NodeAllocator { public:

    SizedNodeAllocator()
	: NodeAllocator(node_size) {
    }

};


/** @brief Return a block of size() bytes, or null if memory is
 * exhausted. */
inline void *NodeAllocator::allocate()
{
    if (link *l = _free) {
#ifdef VALGRIND_MEMPOOL_ALLOC
	VALGRIND_MEMPOOL_ALLOC(this, l, _size);
	VALGRIND_MAKE_MEM_DEFINED(&l->next, sizeof(l->next));
#endif
	_free = l->next;
#ifdef VALGRIND_MAKE_MEM_DEFINED
	VALGRIND_MAKE_MEM_UNDEFINED(&l->next, sizeof(l->next));
#endif
	return l;
    } else if (_buffer && _buffer->pos < _buffer->maxpos) {
	void *data = reinterpret_cast<char *>(_buffer) + _buffer->pos;
	_buffer->pos += _size;
#ifdef VALGRIND_MEMPOOL_ALLOC
	VALGRIND_MEMPOOL_ALLOC(this, data, _size);
#endif
	return data;
    } else
	return hard_allocate();
}

/** @brief Return block @a p to the free list.
 *
 * @a p must have come from this allocator's allocate(), and any object
 * constructed there must already be destroyed. */
inline void NodeAllocator::deallocate(void *p)
{
    if (p) {
	reinterpret_cast<link *>(p)->next = _free;
	_free = reinterpret_cast<link *>(p);
#ifdef VALGRIND_MEMPOOL_FREE
	VALGRIND_MEMPOOL_FREE(this, p);
#endif
    }
}

DUPLEX_ENDDECLS
#endif
