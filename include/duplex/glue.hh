// -*- c-basic-offset: 4; related-file-name: "../../lib/glue.cc" -*-
#ifndef DUPLEX_GLUE_HH
#define DUPLEX_GLUE_HH
// Removes many common #include <header>s and abstracts differences between
// single-threaded and multithreaded builds.

// HEADERS

#include <stdio.h>
#include <stdlib.h>
#include <stddef.h>
#include <stdint.h>
#include <string.h>
#include <ctype.h>
#include <errno.h>
#include <limits.h>
#include <assert.h>
#if HAVE_MULTITHREAD
# include <pthread.h>
# include <sched.h>
#endif


// DEBUGGING OUTPUT
extern "C" {
void duplex_chatter(const char *fmt, ...);
}


// LALLOC

#define DUPLEX_LALLOC(size)	((void *)(new uint8_t[(size)]))
#define DUPLEX_LFREE(p, size)	delete[] ((void) (size), (uint8_t *)(p))


DUPLEX_DECLS

// TYPE MARKERS

/** @brief Type used for value arguments.
 *
 * fast_argument<T>::type is T for small trivially copyable types and
 * const T & otherwise. */
template <typename T> struct fast_argument {
    typedef const T &type;
};
#define DUPLEX_FAST_ARGUMENT(t) \
    template <> struct fast_argument<t> { \
	typedef t type; \
    }
DUPLEX_FAST_ARGUMENT(bool);
DUPLEX_FAST_ARGUMENT(char);
DUPLEX_FAST_ARGUMENT(signed char);
DUPLEX_FAST_ARGUMENT(unsigned char);
DUPLEX_FAST_ARGUMENT(short);
DUPLEX_FAST_ARGUMENT(unsigned short);
DUPLEX_FAST_ARGUMENT(int);
DUPLEX_FAST_ARGUMENT(unsigned);
DUPLEX_FAST_ARGUMENT(long);
DUPLEX_FAST_ARGUMENT(unsigned long);
DUPLEX_FAST_ARGUMENT(long long);
DUPLEX_FAST_ARGUMENT(unsigned long long);
DUPLEX_FAST_ARGUMENT(double);
#undef DUPLEX_FAST_ARGUMENT
template <typename T> struct fast_argument<T *> {
    typedef T *type;
};

/** @brief Return the index of the most significant bit set in @a x.
 * @return 0 if @a x == 0; otherwise the index of the first bit set, where
 * bits are numbered from 1 starting at the most significant bit */
inline int ffs_msb(unsigned long x) {
    return x ? __builtin_clzl(x) + 1 : 0;
}

DUPLEX_ENDDECLS

#endif
