// -*- c-basic-offset: 4; related-file-name: "../../lib/sync.cc" -*-
#ifndef DUPLEX_SYNC_HH
#define DUPLEX_SYNC_HH
#include <duplex/glue.hh>
DUPLEX_DECLS

/** @file <duplex/sync.hh>
 * @brief Classes for synchronizing among multiple threads.
 */

/** @class Mutex
 * @brief A non-recursive blocking mutex.
 *
 * Mutex wraps a POSIX mutex.  Unlike a spinlock, a thread waiting for a
 * Mutex sleeps, so a Mutex may be held for the length of a long traversal.
 *
 * Mutex operations do nothing unless Duplex was configured with
 * HAVE_MULTITHREAD.
 *
 * The main Mutex operations are acquire(), which acquires the lock, and
 * release(), which releases the lock.
 *
 * It is NOT OK for a thread to acquire a lock it has already acquired.
 * Debugging builds (without NDEBUG) detect this and abort; other builds
 * deadlock.
 *
 * @sa LockGuard
 */
class Mutex { public:

    inline Mutex();
    inline ~Mutex();

    inline void acquire();
    inline void release();

  private:

#if HAVE_MULTITHREAD
    pthread_mutex_t _lock;
#endif

    static void lock_failure(const char *op, int err);

    Mutex(const Mutex &);
    Mutex &operator=(const Mutex &);

};

/** @brief Create a Mutex. */
inline
Mutex::Mutex()
{
#if HAVE_MULTITHREAD
    pthread_mutexattr_t attr;
    pthread_mutexattr_init(&attr);
# ifndef NDEBUG
    pthread_mutexattr_settype(&attr, PTHREAD_MUTEX_ERRORCHECK);
# endif
    int r = pthread_mutex_init(&_lock, &attr);
    pthread_mutexattr_destroy(&attr);
    if (unlikely(r != 0))
	lock_failure("Mutex", r);
#endif
}

inline
Mutex::~Mutex()
{
#if HAVE_MULTITHREAD
    pthread_mutex_destroy(&_lock);
#endif
}

/** @brief Acquires the Mutex.
 *
 * On return, this thread has acquired the lock.  The function will block
 * indefinitely until the lock is acquired.
 */
inline void
Mutex::acquire()
{
#if HAVE_MULTITHREAD
    int r = pthread_mutex_lock(&_lock);
    if (unlikely(r != 0))
	lock_failure("acquire", r);
#endif
}

/** @brief Releases the Mutex.
 *
 * The Mutex must have been previously acquired by Mutex::acquire.
 */
inline void
Mutex::release()
{
#if HAVE_MULTITHREAD
    int r = pthread_mutex_unlock(&_lock);
    if (unlikely(r != 0))
	lock_failure("release", r);
#endif
}


/** @class LockGuard
 * @brief Holds a Mutex for the lifetime of a scope.
 *
 * @code
 * {
 *     LockGuard guard(_lock);
 *     ... _lock is held here ...
 * }
 * @endcode
 */
class LockGuard { public:

    explicit LockGuard(Mutex &lock)
	: _lock(lock) {
	_lock.acquire();
    }

    ~LockGuard() {
	_lock.release();
    }

  private:

    Mutex &_lock;

    LockGuard(const LockGuard &);
    LockGuard &operator=(const LockGuard &);

};

DUPLEX_ENDDECLS
#endif
