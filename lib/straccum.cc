// -*- c-basic-offset: 4; related-file-name: "../include/duplex/straccum.hh" -*-
/*
 * straccum.{cc,hh} -- build up strings with operator<<
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
#include <duplex/straccum.hh>
#include <duplex/string.hh>
#include <stdarg.h>
DUPLEX_DECLS

/** @class StringAccum
 * @brief Efficiently build up Strings from pieces.
 *
 * A StringAccum is a mutable character buffer. It is generally built up by
 * operator<<() and then turned into a String by take_string(), which donates
 * the StringAccum's memory to the String without copying.  Deque::unparse()
 * and the ErrorHandler formatting code both build their output this way.
 *
 * When an allocation fails, the StringAccum becomes "out-of-memory":
 * further appends are ignored and take_string() returns an out-of-memory
 * String.
 */

/** @brief Change this StringAccum into an out-of-memory StringAccum. */
void
StringAccum::assign_out_of_memory()
{
    if (r_.cap > 0)
	DUPLEX_LFREE(r_.s - MEMO_SPACE, r_.cap + MEMO_SPACE);
    r_.s = reinterpret_cast<unsigned char *>(const_cast<char *>(String::empty_data()));
    r_.cap = -1;
    r_.len = 0;
}

char *
StringAccum::grow(int want)
{
    if (r_.cap < 0)
	return 0;

    // capacities stay one MEMO_SPACE short of a power of two
    int ncap = (r_.cap ? (r_.cap + MEMO_SPACE) * 2 : 128) - MEMO_SPACE;
    while (ncap <= want)
	ncap = (ncap + MEMO_SPACE) * 2 - MEMO_SPACE;

    unsigned char *n = (unsigned char *) DUPLEX_LALLOC(ncap + MEMO_SPACE);
    if (!n) {
	assign_out_of_memory();
	return 0;
    }
    n += MEMO_SPACE;

    if (r_.cap > 0) {
	memcpy(n, r_.s, r_.len);
	DUPLEX_LFREE(r_.s - MEMO_SPACE, r_.cap + MEMO_SPACE);
    }
    r_.s = n;
    r_.cap = ncap;
    return reinterpret_cast<char *>(r_.s + r_.len);
}

char *
StringAccum::hard_extend(int nadjust, int nreserve)
{
    char *x;
    if (r_.len + nadjust + nreserve <= r_.cap)
	x = reinterpret_cast<char *>(r_.s + r_.len);
    else
	x = grow(r_.len + nadjust + nreserve);
    if (x)
	r_.len += nadjust;
    return x;
}

/** @brief Null-terminate this StringAccum and return its data.
 *
 * The null character does not count toward length(). */
const char *
StringAccum::c_str()
{
    if (r_.len < r_.cap || grow(r_.len))
	r_.s[r_.len] = '\0';
    return reinterpret_cast<char *>(r_.s);
}

/** @brief Append @a len copies of character @a c. */
void
StringAccum::append_fill(int c, int len)
{
    if (char *s = extend(len))
	memset(s, c, len);
}

void
StringAccum::hard_append(const char *s, int len)
{
    // "sa.append(sa.begin(), sa.end())" must not read freed data
    const char *my_s = reinterpret_cast<char *>(r_.s);

    if (r_.len + len <= r_.cap) {
    success:
	memcpy(r_.s + r_.len, s, len);
	r_.len += len;
    } else if (likely(s < my_s || s >= my_s + r_.cap)) {
	if (grow(r_.len + len))
	    goto success;
    } else {
	rep_t old_r = r_;
	r_ = rep_t();
	if (char *new_s = extend(old_r.len + len)) {
	    memcpy(new_s, old_r.s, old_r.len);
	    memcpy(new_s + old_r.len, s, len);
	}
	DUPLEX_LFREE(old_r.s - MEMO_SPACE, old_r.cap + MEMO_SPACE);
    }
}

/** @brief Return a String with this StringAccum's contents.
 *
 * The StringAccum's memory is donated to the result, and the StringAccum
 * becomes empty. */
String
StringAccum::take_string()
{
    int len = length();
    int cap = r_.cap;
    char *str = reinterpret_cast<char *>(r_.s);
    if (len > 0 && cap > 0) {
	r_ = rep_t();
	return String::make_claim(str, len, cap);
    } else if (!out_of_memory())
	return String();
    else {
	clear();
	return String::make_out_of_memory();
    }
}

/** @brief Swap this StringAccum's contents with @a x. */
void
StringAccum::swap(StringAccum &x)
{
    rep_t xr = x.r_;
    x.r_ = r_;
    r_ = xr;
}

/** @relates StringAccum
 * @brief Append decimal representation of @a i to @a sa. */
StringAccum &
operator<<(StringAccum &sa, long i)
{
    if (char *x = sa.reserve(24)) {
	int len = sprintf(x, "%ld", i);
	sa.adjust_length(len);
    }
    return sa;
}

/** @relates StringAccum */
StringAccum &
operator<<(StringAccum &sa, unsigned long u)
{
    if (char *x = sa.reserve(24)) {
	int len = sprintf(x, "%lu", u);
	sa.adjust_length(len);
    }
    return sa;
}

/** @relates StringAccum */
StringAccum &
operator<<(StringAccum &sa, double d)
{
    if (char *x = sa.reserve(256)) {
	int len = sprintf(x, "%.12g", d);
	sa.adjust_length(len);
    }
    return sa;
}

/** @relates StringAccum
 * @brief Append hexadecimal representation of @a ptr's value to @a sa. */
StringAccum &
operator<<(StringAccum &sa, void *ptr)
{
    if (char *x = sa.reserve(30)) {
	int len = sprintf(x, "%p", ptr);
	sa.adjust_length(len);
    }
    return sa;
}

/** @overload */
void
StringAccum::append_numeric(String::uintmax_t num, int base, bool uppercase)
{
    char buf[72];
    char *trav = buf + sizeof(buf);

    assert(base == 10 || base == 16 || base == 8);
    if (base != 10) {
	const char *digits = (uppercase ? "0123456789ABCDEF" : "0123456789abcdef");
	int shift = (base == 16 ? 4 : 3);
	while (num > 0) {
	    *--trav = digits[num & (base - 1)];
	    num >>= shift;
	}
    }

    while (num > 0) {
	*--trav = '0' + (unsigned) (num % 10);
	num /= 10;
    }

    if (trav == buf + sizeof(buf))
	*--trav = '0';

    append(trav, buf + sizeof(buf));
}

/** @brief Append the string representation of @a num.
 * @param num number to append
 * @param base numeric base: must be 8, 10, or 16
 * @param uppercase true means use uppercase letters in base 16 */
void
StringAccum::append_numeric(String::intmax_t num, int base, bool uppercase)
{
    if (num < 0) {
	*this << '-';
	append_numeric(static_cast<String::uintmax_t>(0) - static_cast<String::uintmax_t>(num), base, uppercase);
    } else
	append_numeric(static_cast<String::uintmax_t>(num), base, uppercase);
}

/** @brief Append the result of snprintf() to this StringAccum.
 * @param n maximum number of characters to print
 * @param format format argument to snprintf()
 * @return *this
 *
 * The terminating null character is not appended. */
StringAccum &
StringAccum::snprintf(int n, const char *format, ...)
{
    va_list val;
    va_start(val, format);
    if (char *x = reserve(n + 1)) {
	int len = vsnprintf(x, n + 1, format, val);
	if (len > n)
	    len = n;
	adjust_length(len);
    }
    va_end(val);
    return *this;
}

DUPLEX_ENDDECLS
