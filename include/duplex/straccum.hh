// -*- c-basic-offset: 4; related-file-name: "../../lib/straccum.cc" -*-
#ifndef DUPLEX_STRACCUM_HH
#define DUPLEX_STRACCUM_HH
#include <duplex/glue.hh>
#include <duplex/string.hh>
#if __GNUC__ > 4
# define DUPLEX_SNPRINTF_ATTR __attribute__((__format__(__printf__, 3, 4)))
#else
# define DUPLEX_SNPRINTF_ATTR /* nothing */
#endif
DUPLEX_DECLS

/** @file <duplex/straccum.hh>
 * @brief Duplex's StringAccum class, used to construct Strings efficiently
 * from pieces.
 */

class StringAccum { public:

    typedef const char *const_iterator;
    typedef char *iterator;

    inline StringAccum();
    explicit inline StringAccum(int capacity);
    inline StringAccum(const StringAccum &x);
    inline StringAccum(StringAccum &&x);
    inline ~StringAccum();

    inline StringAccum &operator=(const StringAccum &x);
    inline StringAccum &operator=(StringAccum &&x);

    inline const char *data() const;
    inline int length() const;
    inline int capacity() const;

    const char *c_str();

    inline bool empty() const;
    inline const_iterator begin() const;
    inline const_iterator end() const;

    inline bool out_of_memory() const;
    void assign_out_of_memory();

    inline void clear();
    inline char *reserve(int n);
    inline void adjust_length(int delta);
    inline char *extend(int nadjust, int nreserve = 0);
    inline void pop_back(int n = 1);

    inline void append(char c);
    inline void append(unsigned char c);
    inline void append(const char *cstr);
    inline void append(const char *s, int len);
    inline void append(const char *first, const char *last);
    void append_fill(int c, int len);
    void append_numeric(String::intmax_t x, int base = 10, bool uppercase = true);
    void append_numeric(String::uintmax_t x, int base = 10, bool uppercase = true);

    StringAccum &snprintf(int n, const char *format, ...) DUPLEX_SNPRINTF_ATTR;

    String take_string();

    void swap(StringAccum &x);

  private:

    enum {
	MEMO_SPACE = String::MEMO_SPACE
    };

    struct rep_t {
	unsigned char *s;
	int len;
	int cap;
	rep_t()
	    : s(reinterpret_cast<unsigned char *>(const_cast<char *>(String::empty_data()))),
	      len(0), cap(0) {
	}
    };

    rep_t r_;

    char *grow(int);
    char *hard_extend(int nadjust, int nreserve);
    void hard_append(const char *s, int len);

};

inline StringAccum &operator<<(StringAccum &sa, char c);
inline StringAccum &operator<<(StringAccum &sa, unsigned char c);
inline StringAccum &operator<<(StringAccum &sa, const char *cstr);
inline StringAccum &operator<<(StringAccum &sa, const String &s);
inline StringAccum &operator<<(StringAccum &sa, bool x);
inline StringAccum &operator<<(StringAccum &sa, short x);
inline StringAccum &operator<<(StringAccum &sa, unsigned short x);
inline StringAccum &operator<<(StringAccum &sa, int x);
inline StringAccum &operator<<(StringAccum &sa, unsigned x);
StringAccum &operator<<(StringAccum &sa, long x);
StringAccum &operator<<(StringAccum &sa, unsigned long x);
inline StringAccum &operator<<(StringAccum &sa, long long x);
inline StringAccum &operator<<(StringAccum &sa, unsigned long long x);
StringAccum &operator<<(StringAccum &sa, double x);
StringAccum &operator<<(StringAccum &sa, void *ptr);


/** @brief Construct an empty StringAccum (with length 0). */
inline StringAccum::StringAccum() {
}

/** @brief Construct a StringAccum with room for at least @a capacity
 * characters.
 *
 * If @a capacity == 0, the StringAccum is created empty. */
inline StringAccum::StringAccum(int capacity) {
    assert(capacity >= 0);
    unsigned char *s;
    if (capacity
	&& (s = (unsigned char *) DUPLEX_LALLOC(capacity + MEMO_SPACE))) {
	r_.s = s + MEMO_SPACE;
	r_.cap = capacity;
    }
}

/** @brief Construct a StringAccum containing a copy of @a x. */
inline StringAccum::StringAccum(const StringAccum &x) {
    append(x.data(), x.length());
}

/** @brief Move-construct a StringAccum from @a x. */
inline StringAccum::StringAccum(StringAccum &&x)
    : r_(x.r_) {
    x.r_ = rep_t();
}

/** @brief Destroy a StringAccum, freeing its memory. */
inline StringAccum::~StringAccum() {
    if (r_.cap > 0)
	DUPLEX_LFREE(r_.s - MEMO_SPACE, r_.cap + MEMO_SPACE);
}

/** @brief Assign this StringAccum to @a x. */
inline StringAccum &StringAccum::operator=(const StringAccum &x) {
    if (&x != this) {
	if (out_of_memory())
	    r_.cap = 0;
	r_.len = 0;
	append(x.data(), x.length());
    }
    return *this;
}

/** @brief Move-assign this StringAccum to @a x. */
inline StringAccum &StringAccum::operator=(StringAccum &&x) {
    x.swap(*this);
    return *this;
}

/** @brief Return the contents of the StringAccum.
 *
 * The result is not null-terminated; see c_str(). */
inline const char *StringAccum::data() const {
    return reinterpret_cast<const char *>(r_.s);
}

/** @brief Return the length of the StringAccum. */
inline int StringAccum::length() const {
    return r_.len;
}

/** @brief Return the StringAccum's current capacity, or -1 if it is
 * out-of-memory. */
inline int StringAccum::capacity() const {
    return r_.cap;
}

/** @brief Test if the StringAccum is empty. */
inline bool StringAccum::empty() const {
    return r_.len == 0;
}

inline StringAccum::const_iterator StringAccum::begin() const {
    return reinterpret_cast<char *>(r_.s);
}

inline StringAccum::const_iterator StringAccum::end() const {
    return reinterpret_cast<char *>(r_.s + r_.len);
}

/** @brief Test if the StringAccum is out-of-memory. */
inline bool StringAccum::out_of_memory() const {
    return unlikely(r_.cap < 0);
}

/** @brief Erase the StringAccum's contents.
 *
 * Also resets the StringAccum's out-of-memory status. */
inline void StringAccum::clear() {
    if (r_.cap < 0)
	r_.cap = 0;
    r_.len = 0;
}

/** @brief Reserve space for at least @a n characters.
 * @return a pointer to at least @a n characters, or null if allocation
 * fails
 *
 * reserve() does not change length(). Write into the returned buffer, then
 * call adjust_length() with the number of characters actually written. */
inline char *StringAccum::reserve(int n) {
    assert(n >= 0);
    if (r_.len + n <= r_.cap)
	return reinterpret_cast<char *>(r_.s + r_.len);
    else
	return grow(r_.len + n);
}

/** @brief Adjust the StringAccum's length by @a delta. */
inline void StringAccum::adjust_length(int delta) {
    assert(r_.len + delta >= 0 && r_.len + delta <= r_.cap);
    r_.len += delta;
}

/** @brief Reserve @a nadjust + @a nreserve characters and extend the
 * length by @a nadjust.
 * @return a pointer to the first new character, or null */
inline char *StringAccum::extend(int nadjust, int nreserve) {
    assert(nadjust >= 0 && nreserve >= 0);
    if (r_.len + nadjust + nreserve <= r_.cap) {
	char *x = reinterpret_cast<char *>(r_.s + r_.len);
	r_.len += nadjust;
	return x;
    } else
	return hard_extend(nadjust, nreserve);
}

/** @brief Remove @a n characters from the end of the StringAccum. */
inline void StringAccum::pop_back(int n) {
    assert(n >= 0 && r_.len >= n);
    r_.len -= n;
}

/** @brief Append character @a c to the StringAccum. */
inline void StringAccum::append(char c) {
    if (r_.len < r_.cap || grow(r_.len))
	r_.s[r_.len++] = c;
}

/** @overload */
inline void StringAccum::append(unsigned char c) {
    append(static_cast<char>(c));
}

/** @brief Append the first @a len characters of @a s. */
inline void StringAccum::append(const char *s, int len) {
    assert(len >= 0);
    if (r_.len + len <= r_.cap) {
	memcpy(r_.s + r_.len, s, len);
	r_.len += len;
    } else
	hard_append(s, len);
}

/** @brief Append the null-terminated C string @a cstr. */
inline void StringAccum::append(const char *cstr) {
    append(cstr, strlen(cstr));
}

/** @brief Append the data from @a first to @a last.
 *
 * Does nothing if @a first >= @a last. */
inline void StringAccum::append(const char *first, const char *last) {
    if (first < last)
	append(first, last - first);
}

/** @relates StringAccum
 * @brief Append character @a c to StringAccum @a sa. */
inline StringAccum &operator<<(StringAccum &sa, char c) {
    sa.append(c);
    return sa;
}

/** @relates StringAccum */
inline StringAccum &operator<<(StringAccum &sa, unsigned char c) {
    sa.append(c);
    return sa;
}

/** @relates StringAccum
 * @brief Append null-terminated C string @a cstr to StringAccum @a sa. */
inline StringAccum &operator<<(StringAccum &sa, const char *cstr) {
    sa.append(cstr);
    return sa;
}

/** @relates StringAccum
 * @brief Append "true" or "false" to @a sa, depending on @a x. */
inline StringAccum &operator<<(StringAccum &sa, bool x) {
    if (x)
	sa.append("true", 4);
    else
	sa.append("false", 5);
    return sa;
}

/** @relates StringAccum
 * @brief Append decimal representation of @a x to @a sa. */
inline StringAccum &operator<<(StringAccum &sa, short x) {
    return sa << static_cast<long>(x);
}

/** @overload */
inline StringAccum &operator<<(StringAccum &sa, unsigned short x) {
    return sa << static_cast<unsigned long>(x);
}

/** @overload */
inline StringAccum &operator<<(StringAccum &sa, int x) {
    return sa << static_cast<long>(x);
}

/** @overload */
inline StringAccum &operator<<(StringAccum &sa, unsigned x) {
    return sa << static_cast<unsigned long>(x);
}

/** @overload */
inline StringAccum &operator<<(StringAccum &sa, long long x) {
    sa.append_numeric(static_cast<String::intmax_t>(x));
    return sa;
}

/** @overload */
inline StringAccum &operator<<(StringAccum &sa, unsigned long long x) {
    sa.append_numeric(static_cast<String::uintmax_t>(x));
    return sa;
}

/** @relates StringAccum
 * @brief Append the contents of @a str to @a sa. */
inline StringAccum &operator<<(StringAccum &sa, const String &str) {
    sa.append(str.data(), str.length());
    return sa;
}

DUPLEX_ENDDECLS
#endif
