// -*- c-basic-offset: 4; related-file-name: "../include/duplex/string.hh" -*-
/*
 * string.{cc,hh} -- a String class with shared substrings
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
#include <duplex/string.hh>
#include <duplex/straccum.hh>
DUPLEX_DECLS

/** @class String
 * @brief A string of characters.
 *
 * The String class represents a string of characters.  Strings may be
 * constructed from C strings, characters, numbers, and so forth.  They may
 * also be added together.  The underlying character arrays are dynamically
 * allocated and reference counted; String operations allocate as little
 * memory as possible.  For instance, substring() shares memory with the
 * original string rather than copying.
 *
 * Strings have the usual value semantics: assigning or appending to one
 * String never changes another.  The reference counts are updated
 * atomically, so Strings may be copied freely between threads (for
 * instance, as elements of a Deque).
 *
 * <h3>Out-of-memory strings</h3>
 *
 * When there is not enough memory to create a particular string, a special
 * "out-of-memory" string is returned instead.  Out-of-memory strings are
 * contagious: the result of any concatenation operation involving an
 * out-of-memory string is another out-of-memory string.  Use
 * out_of_memory() to check for them.
 */

const char String::null_data = '\0';
const char String::oom_data[] = "(out of memory)";
static const char int_data[] = "0\0001\0002\0003\0004\0005\0006\0007\0008\0009";

const String::rep_t String::null_string_rep = {
    &null_data, 0, 0
};
const String::rep_t String::oom_string_rep = {
    oom_data, oom_len, 0
};

/** @cond never */
String::memo_t *
String::create_memo(char *space, int dirty, int capacity)
{
    assert(capacity > 0 && capacity >= dirty);
    memo_t *memo;
    if (space)
	memo = reinterpret_cast<memo_t *>(space);
    else
	memo = (memo_t *) DUPLEX_LALLOC(MEMO_SPACE + capacity);
    if (memo) {
	memo->capacity = capacity;
	memo->dirty = dirty;
	memo->refcount = (space ? 0 : 1);
    }
    return memo;
}

void
String::delete_memo(memo_t *memo)
{
    assert(!memo->refcount);
    assert(memo->capacity >= memo->dirty);
    DUPLEX_LFREE(memo, MEMO_SPACE + memo->capacity);
}
/** @endcond never */


/** @brief Construct a base-10 string representation of @a x. */
String::String(int x)
{
    if (x >= 0 && x < 10)
	assign_memo(int_data + 2 * x, 1, 0);
    else {
	char buf[32];
	int len = snprintf(buf, sizeof(buf), "%d", x);
	assign(buf, len, false);
    }
}

/** @overload */
String::String(unsigned x)
{
    if (x < 10)
	assign_memo(int_data + 2 * x, 1, 0);
    else {
	char buf[32];
	int len = snprintf(buf, sizeof(buf), "%u", x);
	assign(buf, len, false);
    }
}

/** @overload */
String::String(long x)
{
    if (x >= 0 && x < 10)
	assign_memo(int_data + 2 * x, 1, 0);
    else {
	char buf[32];
	int len = snprintf(buf, sizeof(buf), "%ld", x);
	assign(buf, len, false);
    }
}

/** @overload */
String::String(unsigned long x)
{
    if (x < 10)
	assign_memo(int_data + 2 * x, 1, 0);
    else {
	char buf[32];
	int len = snprintf(buf, sizeof(buf), "%lu", x);
	assign(buf, len, false);
    }
}

/** @overload */
String::String(long long x)
{
    _r = null_string_rep;
    *this = make_numeric(static_cast<intmax_t>(x));
}

/** @overload */
String::String(unsigned long long x)
{
    _r = null_string_rep;
    *this = make_numeric(static_cast<uintmax_t>(x));
}

String
String::make_claim(char *str, int len, int capacity)
{
    assert(str && len > 0 && capacity >= len);
    memo_t *new_memo = create_memo(str - MEMO_SPACE, len, capacity);
    return String(str, len, new_memo);
}

/** @brief Create and return a string representation of @a x.
 * @param x number
 * @param base base; must be 8, 10, or 16, defaults to 10
 * @param uppercase if true, then use uppercase letters in base 16 */
String
String::make_numeric(intmax_t x, int base, bool uppercase)
{
    StringAccum sa;
    sa.append_numeric(x, base, uppercase);
    return sa.take_string();
}

/** @overload */
String
String::make_numeric(uintmax_t x, int base, bool uppercase)
{
    StringAccum sa;
    sa.append_numeric(x, base, uppercase);
    return sa.take_string();
}

void
String::assign_out_of_memory()
{
    deref();
    _r = oom_string_rep;
}

void
String::assign(const char *s, int len, bool need_deref)
{
    if (!s) {
	assert(len <= 0);
	len = 0;
    } else if (len < 0)
	len = strlen(s);

    if (need_deref) {
	// "s = s.c_str()" and friends: the data already lives in our memo
	if (unlikely(_r.memo
		     && s >= _r.memo->real_data
		     && s + len <= _r.memo->real_data + _r.memo->capacity)) {
	    _r.data = s;
	    _r.length = len;
	    return;
	}
	deref();
    }

    if (len == 0) {
	_r.memo = 0;
	_r.data = &null_data;
    } else {
	// round the memo up to a multiple of 16 bytes
	int memo_capacity = (len + 15 + MEMO_SPACE) & ~15;
	_r.memo = create_memo(0, len, memo_capacity - MEMO_SPACE);
	if (!_r.memo) {
	    _r = oom_string_rep;
	    return;
	}
	memcpy(_r.memo->real_data, s, len);
	_r.data = _r.memo->real_data;
    }
    _r.length = len;
}

char *
String::append_uninitialized(int len)
{
    if (len <= 0 || out_of_memory())
	return 0;

    // Append in place if the unused part of the memo directly follows our
    // data and nobody else has claimed it.
    uint32_t dirty;
    if (_r.memo
	&& ((dirty = _r.memo->dirty), _r.memo->capacity > dirty + len)) {
	char *real_dirty = _r.memo->real_data + dirty;
	if (real_dirty == _r.data + _r.length
	    && __atomic_compare_exchange_n(&_r.memo->dirty, &dirty, dirty + len,
					   false, __ATOMIC_ACQ_REL, __ATOMIC_RELAXED)) {
	    _r.length += len;
	    return real_dirty;
	}
    }

    // Small strings grow to a multiple of 16 bytes, large ones to a power
    // of 2.
    int want_memo_len = _r.length + len + MEMO_SPACE;
    int memo_capacity;
    if (want_memo_len <= 1024)
	memo_capacity = (want_memo_len + 15) & ~15;
    else
	for (memo_capacity = 2048; memo_capacity < want_memo_len; )
	    memo_capacity *= 2;

    memo_t *new_memo = create_memo(0, _r.length + len, memo_capacity - MEMO_SPACE);
    if (!new_memo) {
	assign_out_of_memory();
	return 0;
    }

    char *new_data = new_memo->real_data;
    memcpy(new_data, _r.data, _r.length);
    deref();
    _r.data = new_data;
    _r.memo = new_memo;
    new_data += _r.length;
    _r.length += len;
    return new_data;
}

void
String::append(const char *s, int len, memo_t *memo)
{
    if (!s) {
	assert(len <= 0);
	len = 0;
    } else if (len < 0)
	len = strlen(s);

    if (unlikely(len == 0) || out_of_memory())
	/* do nothing */;
    else if (_r.length == 0 && memo) {
	// share the appended string's memo
	deref();
	assign_memo(s, len, memo);
    } else if (likely(!(_r.memo
			&& s >= _r.memo->real_data
			&& s + len <= _r.memo->real_data + _r.memo->capacity))) {
	if (char *space = append_uninitialized(len))
	    memcpy(space, s, len);
    } else {
	// appending part of ourselves; keep the source alive
	String preserve_s(*this);
	if (char *space = append_uninitialized(len))
	    memcpy(space, s, len);
    }
}

const char *
String::hard_c_str() const
{
    // Stable and null strings are guaranteed to have data[length]
    // readable.  Memo strings may end at the memo's capacity.
    const char *end_data = _r.data + _r.length;
    if ((_r.memo && end_data >= _r.memo->real_data + _r.memo->dirty)
	|| *end_data != '\0') {
	if (char *x = const_cast<String *>(this)->append_uninitialized(1)) {
	    *x = '\0';
	    --_r.length;
	}
    }
    return _r.data;
}

/** @brief Return a substring of this string, consisting of the @a len
 * characters starting at index @a pos.
 *
 * If @a pos is negative, starts that far from the end of the string.  If
 * @a len is negative, leaves that many characters off the end of the
 * string.  Parts of the requested substring that lie outside the string
 * are silently dropped. */
String
String::substring(int pos, int len) const
{
    if (pos < 0)
	pos += _r.length;

    int pos2;
    if (len < 0)
	pos2 = _r.length + len;
    else if (pos >= 0 && len >= _r.length)
	pos2 = _r.length;
    else
	pos2 = pos + len;

    if (pos < 0)
	pos = 0;
    if (pos2 > _r.length)
	pos2 = _r.length;

    if (pos >= pos2)
	return String();
    else
	return String(_r.data + pos, pos2 - pos, _r.memo);
}

/** @brief Return the index of the leftmost @a c at or after @a start, or
 * -1 if there is none. */
int
String::find_left(char c, int start) const
{
    if (start < 0)
	start = 0;
    if (start < _r.length)
	if (const char *x = (const char *) memchr(_r.data + start, c, _r.length - start))
	    return x - _r.data;
    return -1;
}

/** @brief Return the index of the rightmost @a c at or before @a start,
 * or -1 if there is none. */
int
String::find_right(char c, int start) const
{
    if (start >= _r.length)
	start = _r.length - 1;
    for (int i = start; i >= 0; i--)
	if (_r.data[i] == c)
	    return i;
    return -1;
}

/** @brief Return a "printable" version of this string.
 *
 * Control characters are written as "^@"-style sequences and characters
 * 127-255 as octal escapes such as "\377". */
String
String::printable() const
{
    int i = 0;
    while (i < _r.length && _r.data[i] >= 32 && _r.data[i] <= 126)
	++i;
    if (i == _r.length || out_of_memory())
	return *this;

    StringAccum sa(_r.length * 2);
    sa.append(_r.data, i);
    for (; i < _r.length; i++) {
	unsigned char c = _r.data[i];
	if (c >= 32 && c <= 126)
	    sa << c;
	else if (c < 32)
	    sa << '^' << (unsigned char) (c + 64);
	else
	    sa.snprintf(4, "\\%03o", c);
    }
    return sa.take_string();
}

/** @brief Test whether this string begins with the data in @a s.
 *
 * If @a len < 0, then treats @a s as a null-terminated C string. */
bool
String::starts_with(const char *s, int len) const
{
    if (len < 0)
	len = strlen(s);
    return _r.length >= len && (_r.data == s || memcmp(_r.data, s, len) == 0);
}

/** @brief Compare this string with the data in @a s.
 *
 * Same as String::compare(*this, String(s, len)).  If @a len < 0, then
 * treats @a s as a null-terminated C string. */
int
String::compare(const char *s, int len) const
{
    if (len < 0)
	len = strlen(s);
    int lencmp = _r.length - len, cmp;
    if (unlikely(_r.data == s))
	cmp = 0;
    else
	cmp = memcmp(_r.data, s, lencmp < 0 ? _r.length : len);
    return cmp ? cmp : lencmp;
}

DUPLEX_ENDDECLS
