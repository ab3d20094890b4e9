#ifndef DUPLEX_DEQUE_HH
#define DUPLEX_DEQUE_HH
#include <duplex/glue.hh>
#include <duplex/sync.hh>
#include <duplex/nodeallocator.hh>
#include <duplex/pair.hh>
#include <duplex/string.hh>
#include <duplex/straccum.hh>
#include <duplex/error.hh>
DUPLEX_DECLS

/** @file <duplex/deque.hh>
 * @brief A synchronized double-ended queue with optional bounded capacity.
 */

/** @class Deque
 * @brief A thread-safe double-ended queue built on a doubly linked list.
 * @param T element type
 *
 * A Deque stores a sequence of T values.  Elements may be added and removed
 * at either end in constant time.  Indexed lookup walks from whichever end
 * is closer, so elements near either end are found quickly.
 *
 * A Deque may have a bounded capacity.  Inserting into a full bounded Deque
 * succeeds, but evicts one element from the opposite end: push_back() on a
 * full Deque drops the front element and push_front() drops the back
 * element.  A Deque with capacity 0 is always empty.  The constant
 * Deque::unbounded requests an unbounded Deque.  Capacity never changes
 * after construction.
 *
 * Every Deque operation is protected by a single Mutex, so Deques may be
 * shared freely among threads.  The Mutex is not recursive.  In particular,
 * while a range returned by values() or all() is alive, the thread holding
 * that range must not call any other locking operation on the same Deque.
 *
 * T must be copy-constructible, default-constructible, and assignable.
 * count() additionally requires operator==, and unparse() requires an
 * operator<< for StringAccum.
 *
 * @code
 * Deque<int> d(3);
 * d.push_back(0);
 * d.push_back(1);
 * d.push_back(2);
 * d.push_back(3);                  // evicts 0
 * int x;
 * d.try_pop_front(x);              // x == 1
 * for (int v : d.values())
 *     duplex_chatter("%d", v);     // prints 2, then 3
 * @endcode
 */
template <typename T>
class Deque { public:

    typedef T value_type;
    typedef int size_type;

    enum {
	unbounded = -1			///< Capacity of an unbounded Deque
    };

    enum {
	pop_error = -ENOENT,		///< Returned when popping from an empty Deque
	peek_error = -ERANGE		///< Returned for an out-of-bounds index
    };

  private:

    struct node {
	T value;
	node *next;
	node *prev;
	node(const T &v)
	    : value(v), next(0), prev(0) {
	}
    };

  public:

    /** @class Deque::const_iterator
     * @brief Iterates over Deque elements from front to back. */
    class const_iterator { public:
	const_iterator()
	    : _n(0) {
	}
	const T &operator*() const {
	    return _n->value;
	}
	const T *operator->() const {
	    return &_n->value;
	}
	void operator++() {
	    _n = _n->next;
	}
	bool operator==(const const_iterator &x) const {
	    return _n == x._n;
	}
	bool operator!=(const const_iterator &x) const {
	    return _n != x._n;
	}
	explicit const_iterator(node *n)
	    : _n(n) {
	}
      private:
	node *_n;
    };

    /** @class Deque::pair_iterator
     * @brief Iterates over (position, element) pairs, starting at
     * position 0. */
    class pair_iterator { public:
	pair_iterator()
	    : _n(0), _i(0) {
	}
	Pair<int, T> operator*() const {
	    return Pair<int, T>(_i, _n->value);
	}
	void operator++() {
	    _n = _n->next;
	    ++_i;
	}
	bool operator==(const pair_iterator &x) const {
	    return _n == x._n;
	}
	bool operator!=(const pair_iterator &x) const {
	    return _n != x._n;
	}
	explicit pair_iterator(node *n)
	    : _n(n), _i(0) {
	}
      private:
	node *_n;
	int _i;
    };

    /** @class Deque::locked_range
     * @brief A traversal of a Deque that holds the Deque's lock.
     *
     * Creating a locked_range acquires the Deque's Mutex; destroying it
     * releases the Mutex.  A locked_range can be moved but not copied, so
     * the Mutex is released exactly once, by whichever range object owns
     * the traversal last.  Abandoning a traversal early, for example by
     * breaking out of a range-based for loop, releases the Mutex too. */
    template <typename I>
    class locked_range { public:
	locked_range(locked_range<I> &&x)
	    : _d(x._d) {
	    x._d = 0;
	}
	~locked_range() {
	    if (_d)
		_d->_lock.release();
	}
	I begin() const {
	    return I(_d ? _d->_head : 0);
	}
	I end() const {
	    return I();
	}
      private:
	const Deque<T> *_d;
	explicit locked_range(const Deque<T> *d)
	    : _d(d) {
	    _d->_lock.acquire();
	}
	locked_range(const locked_range<I> &);
	locked_range<I> &operator=(const locked_range<I> &);
	friend class Deque<T>;
    };

    typedef locked_range<const_iterator> value_range;
    typedef locked_range<pair_iterator> pair_range;


    explicit inline Deque(size_type capacity);
    inline Deque();
    Deque(const Deque<T> &x);
    Deque(Deque<T> &&x);
    inline ~Deque();

    static int check_capacity(size_type capacity, ErrorHandler *errh = 0);
    static inline Deque<T> make_unlimited();
    template <typename I>
    static Deque<T> make_from(I first, I last, size_type capacity = unbounded);

    inline size_type size() const;
    inline size_type capacity() const;
    inline bool unlimited() const;
    inline bool full() const;
    inline bool empty() const;

    inline bool push_back(const T &x);
    inline bool push_front(const T &x);
    template <typename I> int extend(I first, I last);
    template <typename I> int extend_front(I first, I last);

    int try_pop_back(T &x, ErrorHandler *errh = 0);
    int try_pop_front(T &x, ErrorHandler *errh = 0);

    int try_peek(int index, T &x, ErrorHandler *errh = 0) const;
    T peek(int index) const;

    int count(const T &x) const;
    inline void clear();
    inline Deque<T> copy() const;
    void rotate(int n);
    void reverse();

    inline value_range values() const;
    inline pair_range all() const;

    String unparse() const;

  private:

    node *_head;
    node *_tail;
    size_type _length;
    const size_type _capacity;
    mutable Mutex _lock;
    SizedNodeAllocator<sizeof(node)> _alloc;

    bool link_back(const T &x);
    bool link_front(const T &x);
    void unlink_front();
    void unlink_back();
    void unlink_all();
    node *locate(int index) const;

    static inline size_type clean_capacity(size_type capacity);

    Deque<T> &operator=(const Deque<T> &);

};


/** @brief Construct an empty Deque holding at most @a capacity elements.
 * @param capacity maximum size, or Deque::unbounded
 *
 * Any other negative @a capacity is reported to the default ErrorHandler,
 * and the Deque is unbounded. */
template <typename T>
inline Deque<T>::Deque(size_type capacity)
    : _head(0), _tail(0), _length(0), _capacity(clean_capacity(capacity))
{
}

/** @brief Construct an empty unbounded Deque. */
template <typename T>
inline Deque<T>::Deque()
    : _head(0), _tail(0), _length(0), _capacity(unbounded)
{
}

/** @brief Construct a copy of @a x.
 *
 * @a x is locked while its elements are copied.  The result has the same
 * capacity as @a x and its own nodes.  If memory runs out, the copy holds
 * only a prefix of @a x. */
template <typename T>
Deque<T>::Deque(const Deque<T> &x)
    : _head(0), _tail(0), _length(0), _capacity(x._capacity)
{
    LockGuard guard(x._lock);
    for (node *n = x._head; n; n = n->next)
	if (!link_back(n->value))
	    break;
}

/** @brief Move-construct a Deque from @a x.
 *
 * The new Deque takes over @a x's elements and node pool.  @a x is left
 * empty, with its original capacity. */
template <typename T>
Deque<T>::Deque(Deque<T> &&x)
    : _head(0), _tail(0), _length(0), _capacity(x._capacity)
{
    LockGuard guard(x._lock);
    _alloc.swap(x._alloc);
    _head = x._head;
    _tail = x._tail;
    _length = x._length;
    x._head = x._tail = 0;
    x._length = 0;
}

template <typename T>
inline Deque<T>::~Deque()
{
    unlink_all();
}

/** @brief Check whether @a capacity is a valid Deque capacity.
 * @param capacity proposed capacity
 * @param errh error handler
 * @return 0 if @a capacity is valid, -EINVAL otherwise
 *
 * Valid capacities are nonnegative or equal Deque::unbounded.  Reports
 * invalid capacities to @a errh, if it is nonnull. */
template <typename T>
int Deque<T>::check_capacity(size_type capacity, ErrorHandler *errh)
{
    if (capacity >= 0 || capacity == unbounded)
	return 0;
    if (errh)
	errh->error("invalid deque capacity %d", capacity);
    return -EINVAL;
}

template <typename T>
inline typename Deque<T>::size_type Deque<T>::clean_capacity(size_type capacity)
{
    if (check_capacity(capacity, ErrorHandler::default_handler()) < 0)
	return unbounded;
    return capacity;
}

/** @brief Return an empty unbounded Deque. */
template <typename T>
inline Deque<T> Deque<T>::make_unlimited()
{
    return Deque<T>();
}

/** @brief Return a Deque containing the elements in [@a first, @a last).
 * @param first start of input range
 * @param last end of input range
 * @param capacity capacity of the result
 *
 * Elements are appended in order, so when a bounded @a capacity is smaller
 * than the input, only the last @a capacity elements remain. */
template <typename T> template <typename I>
Deque<T> Deque<T>::make_from(I first, I last, size_type capacity)
{
    Deque<T> d(capacity);
    for (; first != last; ++first)
	if (!d.link_back(*first))
	    break;
    return d;
}

/** @brief Return the number of elements. */
template <typename T>
inline typename Deque<T>::size_type Deque<T>::size() const
{
    LockGuard guard(_lock);
    return _length;
}

/** @brief Return the capacity, or Deque::unbounded. */
template <typename T>
inline typename Deque<T>::size_type Deque<T>::capacity() const
{
    return _capacity;
}

/** @brief Return true iff the Deque is unbounded. */
template <typename T>
inline bool Deque<T>::unlimited() const
{
    return _capacity == unbounded;
}

/** @brief Return true iff the Deque is bounded and holds capacity()
 * elements.
 *
 * Inserting into a full Deque evicts an element. */
template <typename T>
inline bool Deque<T>::full() const
{
    LockGuard guard(_lock);
    return _capacity != unbounded && _length >= _capacity;
}

/** @brief Return true iff the Deque has no elements. */
template <typename T>
inline bool Deque<T>::empty() const
{
    LockGuard guard(_lock);
    return _length == 0;
}

/** @brief Append @a x to the back of the Deque.
 * @return true, or false if memory was exhausted
 *
 * If the Deque was full, the front element is evicted.  On failure the
 * Deque is unchanged. */
template <typename T>
inline bool Deque<T>::push_back(const T &x)
{
    LockGuard guard(_lock);
    return link_back(x);
}

/** @brief Prepend @a x to the front of the Deque.
 * @return true, or false if memory was exhausted
 *
 * If the Deque was full, the back element is evicted. */
template <typename T>
inline bool Deque<T>::push_front(const T &x)
{
    LockGuard guard(_lock);
    return link_front(x);
}

/** @brief Append the elements of [@a first, @a last) in order.
 * @return number of elements appended
 *
 * The whole range is appended under one lock acquisition, so no other
 * thread observes a partial result.  Stops early if memory is exhausted. */
template <typename T> template <typename I>
int Deque<T>::extend(I first, I last)
{
    LockGuard guard(_lock);
    int n = 0;
    for (; first != last; ++first, ++n)
	if (!link_back(*first))
	    break;
    return n;
}

/** @brief Prepend the elements of [@a first, @a last), one at a time.
 * @return number of elements prepended
 *
 * The range ends up in reverse order at the front of the Deque. */
template <typename T> template <typename I>
int Deque<T>::extend_front(I first, I last)
{
    LockGuard guard(_lock);
    int n = 0;
    for (; first != last; ++first, ++n)
	if (!link_front(*first))
	    break;
    return n;
}

/** @brief Remove the back element and store it in @a x.
 * @param x result
 * @param errh error handler
 * @return 0 on success, Deque::pop_error if the Deque was empty
 *
 * When the Deque is empty, stores T() in @a x and reports an error to
 * @a errh if it is nonnull. */
template <typename T>
int Deque<T>::try_pop_back(T &x, ErrorHandler *errh)
{
    {
	LockGuard guard(_lock);
	if (_tail) {
	    x = _tail->value;
	    unlink_back();
	    return 0;
	}
    }
    x = T();
    if (errh)
	errh->error("deque: pop from empty queue");
    return pop_error;
}

/** @brief Remove the front element and store it in @a x.
 * @return 0 on success, Deque::pop_error if the Deque was empty
 * @sa try_pop_back */
template <typename T>
int Deque<T>::try_pop_front(T &x, ErrorHandler *errh)
{
    {
	LockGuard guard(_lock);
	if (_head) {
	    x = _head->value;
	    unlink_front();
	    return 0;
	}
    }
    x = T();
    if (errh)
	errh->error("deque: pop from empty queue");
    return pop_error;
}

/** @brief Store the element at position @a index in @a x.
 * @param index position, counting from 0 at the front
 * @param x result
 * @param errh error handler
 * @return 0 on success, Deque::peek_error if @a index is out of bounds
 *
 * The Deque is unchanged.  When @a index is out of bounds, stores T() in
 * @a x and reports an error naming @a index to @a errh if it is nonnull. */
template <typename T>
int Deque<T>::try_peek(int index, T &x, ErrorHandler *errh) const
{
    {
	LockGuard guard(_lock);
	if (index >= 0 && index < _length) {
	    x = locate(index)->value;
	    return 0;
	}
    }
    x = T();
    if (errh)
	errh->error("deque: index %d out of bounds", index);
    return peek_error;
}

/** @brief Return the element at position @a index.
 * @pre 0 <= @a index < size()
 *
 * An out-of-bounds @a index is reported at abort level to the default
 * ErrorHandler, and the process aborts.  Use try_peek() when @a index may
 * be invalid. */
template <typename T>
T Deque<T>::peek(int index) const
{
    LockGuard guard(_lock);
    if (unlikely(index < 0 || index >= _length)) {
	if (ErrorHandler *errh = ErrorHandler::default_handler())
	    errh->xmessage(ErrorHandler::e_abort,
			   ErrorHandler::format("deque: index %d out of bounds", index));
	else
	    duplex_chatter("deque: index %d out of bounds", index);
	abort();
    }
    return locate(index)->value;
}

/** @brief Return the number of elements equal to @a x. */
template <typename T>
int Deque<T>::count(const T &x) const
{
    LockGuard guard(_lock);
    int n = 0;
    for (node *p = _head; p; p = p->next)
	if (p->value == x)
	    ++n;
    return n;
}

/** @brief Remove all elements. */
template <typename T>
inline void Deque<T>::clear()
{
    LockGuard guard(_lock);
    unlink_all();
}

/** @brief Return an independent copy of this Deque.
 *
 * Same as Deque<T>(*this). */
template <typename T>
inline Deque<T> Deque<T>::copy() const
{
    return Deque<T>(*this);
}

/** @brief Rotate the Deque @a n steps to the right.
 *
 * Rotating one step to the right moves the back element to the front.
 * Negative @a n rotates left.  The result equals |@a n| single-step
 * rotations, but only about min(k, size() - k) links are followed, where
 * k is @a n modulo size(). */
template <typename T>
void Deque<T>::rotate(int n)
{
    LockGuard guard(_lock);
    if (_length < 2)
	return;
    int k = n % _length;
    if (k < 0)
	k += _length;
    if (k == 0)
	return;

    node *new_head = locate(_length - k);
    node *new_tail = new_head->prev;
    // close the ring, then cut it in front of new_head
    _tail->next = _head;
    _head->prev = _tail;
    new_tail->next = 0;
    new_head->prev = 0;
    _head = new_head;
    _tail = new_tail;
}

/** @brief Reverse the order of the elements in place. */
template <typename T>
void Deque<T>::reverse()
{
    LockGuard guard(_lock);
    for (node *n = _head; n; ) {
	node *next = n->next;
	n->next = n->prev;
	n->prev = next;
	n = next;
    }
    node *h = _head;
    _head = _tail;
    _tail = h;
}

/** @brief Return a locked traversal of the elements, front to back.
 *
 * The Deque's lock is held until the returned range is destroyed.
 *
 * @code
 * for (Deque<int>::const_iterator it = d.values().begin(); ...)  // WRONG:
 *     // the temporary range, and the lock, die at the end of the line
 * Deque<int>::value_range r = d.values();                       // right
 * for (Deque<int>::const_iterator it = r.begin(); it != r.end(); ++it)
 *     ...;
 * for (int v : d.values())                                       // right
 *     ...;
 * @endcode */
template <typename T>
inline typename Deque<T>::value_range Deque<T>::values() const
{
    return value_range(this);
}

/** @brief Return a locked traversal of (position, element) pairs.
 * @sa values() */
template <typename T>
inline typename Deque<T>::pair_range Deque<T>::all() const
{
    return pair_range(this);
}

/** @brief Return a string representation of the Deque, such as
 * "Deque{capacity:3, [0, 1, 2]}". */
template <typename T>
String Deque<T>::unparse() const
{
    StringAccum sa;
    sa << "Deque{capacity:";
    if (_capacity == unbounded)
	sa << "unlimited";
    else
	sa << _capacity;
    sa << ", [";
    {
	LockGuard guard(_lock);
	for (node *n = _head; n; n = n->next) {
	    if (n != _head)
		sa << ", ";
	    sa << n->value;
	}
    }
    sa << "]}";
    return sa.take_string();
}


// The helpers below expect the caller to hold _lock.

template <typename T>
bool Deque<T>::link_back(const T &x)
{
    if (_capacity == 0)
	return true;
    void *p = _alloc.allocate();
    if (!p)
	return false;
    node *n = new(p) node(x);
    n->prev = _tail;
    if (_tail)
	_tail->next = n;
    else
	_head = n;
    _tail = n;
    ++_length;
    if (_capacity != unbounded && _length > _capacity)
	unlink_front();
    return true;
}

template <typename T>
bool Deque<T>::link_front(const T &x)
{
    if (_capacity == 0)
	return true;
    void *p = _alloc.allocate();
    if (!p)
	return false;
    node *n = new(p) node(x);
    n->next = _head;
    if (_head)
	_head->prev = n;
    else
	_tail = n;
    _head = n;
    ++_length;
    if (_capacity != unbounded && _length > _capacity)
	unlink_back();
    return true;
}

template <typename T>
void Deque<T>::unlink_front()
{
    node *n = _head;
    assert(n);
    _head = n->next;
    if (_head)
	_head->prev = 0;
    else
	_tail = 0;
    n->next = n->prev = 0;
    --_length;
    n->~node();
    _alloc.deallocate(n);
}

template <typename T>
void Deque<T>::unlink_back()
{
    node *n = _tail;
    assert(n);
    _tail = n->prev;
    if (_tail)
	_tail->next = 0;
    else
	_head = 0;
    n->next = n->prev = 0;
    --_length;
    n->~node();
    _alloc.deallocate(n);
}

template <typename T>
void Deque<T>::unlink_all()
{
    node *n = _head;
    _head = _tail = 0;
    _length = 0;
    while (n) {
	node *next = n->next;
	n->~node();
	_alloc.deallocate(n);
	n = next;
    }
}

/** @pre 0 <= @a index < _length */
template <typename T>
typename Deque<T>::node *Deque<T>::locate(int index) const
{
    node *n;
    if (index < _length / 2) {
	n = _head;
	for (int i = 0; i < index; ++i)
	    n = n->next;
    } else {
	n = _tail;
	for (int i = _length - 1; i > index; --i)
	    n = n->prev;
    }
    return n;
}

/** @relates Deque
 * @brief Append @a d's unparse() representation to @a sa. */
template <typename T>
inline StringAccum &operator<<(StringAccum &sa, const Deque<T> &d)
{
    return sa << d.unparse();
}

DUPLEX_ENDDECLS
#endif
