// -*- c-basic-offset: 4; related-file-name: "../../lib/string.cc" -*-
#ifndef DUPLEX_STRING_HH
#define DUPLEX_STRING_HH
#include <duplex/glue.hh>
DUPLEX_DECLS
class StringAccum;

/** @file <duplex/string.hh>
 * @brief Duplex's String class.
 */

class String { public:

    typedef const char *const_iterator;
    typedef const_iterator iterator;

    typedef int (String::*unspecified_bool_type)() const;

    typedef long long intmax_t;
    typedef unsigned long long uintmax_t;

    inline String();
    inline String(const String &x);
    inline String(String &&x);
    inline String(const char *cstr);
    inline String(const char *s, int len);
    inline String(const char *first, const char *last);
    explicit inline String(bool x);
    explicit inline String(char c);
    explicit String(int x);
    explicit String(unsigned x);
    explicit String(long x);
    explicit String(unsigned long x);
    explicit String(long long x);
    explicit String(unsigned long long x);
    inline ~String();

    static inline const String &make_empty();
    static inline String make_stable(const char *cstr);
    static inline String make_stable(const char *s, int len);
    static String make_numeric(intmax_t x, int base = 10, bool uppercase = true);
    static String make_numeric(uintmax_t x, int base = 10, bool uppercase = true);
    static inline String make_out_of_memory();

    inline const char *data() const;
    inline int length() const;

    inline const char *c_str() const;

    inline operator unspecified_bool_type() const;
    inline bool empty() const;
    inline bool operator!() const;

    inline const_iterator begin() const;
    inline const_iterator end() const;

    inline char operator[](int i) const;
    inline char front() const;
    inline char back() const;

    String substring(int pos, int len) const;
    inline String substring(int pos) const;
    inline String substring(const char *first, const char *last) const;

    inline bool equals(const String &x) const;
    inline bool equals(const char *s, int len) const;
    static inline int compare(const String &a, const String &b);
    inline int compare(const String &x) const;
    int compare(const char *s, int len) const;
    inline bool starts_with(const String &x) const;
    bool starts_with(const char *s, int len) const;

    int find_left(char c, int start = 0) const;
    int find_right(char c, int start = 0x7FFFFFFF) const;

    String printable() const;

    inline String &operator=(const String &x);
    inline String &operator=(String &&x);
    inline String &operator=(const char *cstr);

    inline void swap(String &x);

    inline void append(const String &x);
    inline void append(const char *cstr);
    inline void append(const char *s, int len);
    inline void append(char c);

    inline String &operator+=(const String &x);
    inline String &operator+=(const char *cstr);
    inline String &operator+=(char c);

    inline bool out_of_memory() const;
    static inline const char *empty_data();

  private:

    /** @cond never */
    struct memo_t {
	volatile uint32_t refcount;
	uint32_t capacity;
	volatile uint32_t dirty;
	char real_data[8];	// but it might be more or less
    };

    enum {
	MEMO_SPACE = sizeof(memo_t) - 8
    };

    struct rep_t {
	const char *data;
	int length;
	memo_t *memo;
    };
    /** @endcond never */

    mutable rep_t _r;		// mutable for c_str()

    inline void assign_memo(const char *data, int length, memo_t *memo) const {
	_r.data = data;
	_r.length = length;
	if ((_r.memo = memo))
	    __atomic_add_fetch(&memo->refcount, 1, __ATOMIC_RELAXED);
    }

    inline String(const char *data, int length, memo_t *memo) {
	assign_memo(data, length, memo);
    }

    inline void assign(const String &x) const {
	assign_memo(x._r.data, x._r.length, x._r.memo);
    }

    inline void deref() const {
	if (_r.memo && __atomic_sub_fetch(&_r.memo->refcount, 1, __ATOMIC_ACQ_REL) == 0)
	    delete_memo(_r.memo);
    }

    void assign(const char *s, int len, bool need_deref);
    void assign_out_of_memory();
    void append(const char *s, int len, memo_t *memo);
    char *append_uninitialized(int len);
    static memo_t *create_memo(char *space, int dirty, int capacity);
    static void delete_memo(memo_t *memo);
    const char *hard_c_str() const;

    static const char null_data;
    static const char oom_data[16];
    static const rep_t null_string_rep;
    static const rep_t oom_string_rep;
    enum { oom_len = 15 };

    static String make_claim(char *, int, int); // claim memory

    friend class StringAccum;

};

/** @brief Construct an empty String (with length 0). */
inline String::String() {
    assign_memo(&null_data, 0, 0);
}

/** @brief Construct a copy of the String @a x. */
inline String::String(const String &x) {
    assign(x);
}

/** @brief Move-construct a String from @a x. */
inline String::String(String &&x)
    : _r(x._r) {
    x._r.memo = 0;
}

/** @brief Construct a String containing the C string @a cstr.
 * @param cstr a null-terminated C string
 * @return A String containing the characters of @a cstr, up to but not
 * including the terminating null character. */
inline String::String(const char *cstr) {
    assign(cstr, -1, false);
}

/** @brief Construct a String containing the first @a len characters of
 * string @a s.
 *
 * If @a len < 0, then treats @a s as a null-terminated C string. */
inline String::String(const char *s, int len) {
    assign(s, len, false);
}

/** @brief Construct a String containing the characters from @a first
 * to @a last. */
inline String::String(const char *first, const char *last) {
    assign(first, (first < last ? last - first : 0), false);
}

/** @brief Construct a String equal to "true" or "false" depending on the
 * value of @a x. */
inline String::String(bool x) {
    assign_memo(x ? "true" : "false", x ? 4 : 5, 0);
}

/** @brief Construct a String containing the single character @a c. */
inline String::String(char c) {
    assign(&c, 1, false);
}

/** @brief Destroy a String, freeing memory if necessary. */
inline String::~String() {
    deref();
}

/** @brief Return a const reference to an empty String. */
inline const String &String::make_empty() {
    return reinterpret_cast<const String &>(null_string_rep);
}

/** @brief Return a String that directly references the C string @a cstr.
 *
 * The make_stable() functions are suitable for static constant strings
 * whose data is known to stay around forever. */
inline String String::make_stable(const char *cstr) {
    return String(cstr, strlen(cstr), 0);
}

/** @overload */
inline String String::make_stable(const char *s, int len) {
    if (len < 0)
	len = (s ? strlen(s) : 0);
    return String(s, len, 0);
}

/** @brief Return an out-of-memory string. */
inline String String::make_out_of_memory() {
    return String(oom_data, oom_len, 0);
}

/** @brief Return the string's data. */
inline const char *String::data() const {
    return _r.data;
}

/** @brief Return the string's length. */
inline int String::length() const {
    return _r.length;
}

/** @brief Null-terminate the string.
 *
 * The terminating null character isn't considered part of the string, so
 * this->length() doesn't change. Returns a corresponding C string pointer.
 * The returned pointer is semi-temporary; it will persist until the
 * string is destroyed or appended to. */
inline const char *String::c_str() const {
    // See also hard_c_str().
    if (_r.memo && _r.data + _r.length == _r.memo->real_data + _r.memo->dirty
	&& _r.memo->dirty < _r.memo->capacity) {
	const_cast<char *>(_r.data)[_r.length] = '\0';
	return _r.data;
    } else
	return hard_c_str();
}

/** @brief Return true iff the string is nonempty. */
inline String::operator unspecified_bool_type() const {
    return _r.length != 0 ? &String::length : 0;
}

/** @brief Return true iff the string is empty. */
inline bool String::empty() const {
    return _r.length == 0;
}

/** @brief Return true iff the string is empty. */
inline bool String::operator!() const {
    return empty();
}

/** @brief Return an iterator for the first character in the string. */
inline String::const_iterator String::begin() const {
    return _r.data;
}

/** @brief Return an iterator for the end of the string. */
inline String::const_iterator String::end() const {
    return _r.data + _r.length;
}

/** @brief Return the @a i th character in the string.
 * @pre 0 <= @a i < length() */
inline char String::operator[](int i) const {
    assert((unsigned) i < (unsigned) _r.length);
    return _r.data[i];
}

/** @brief Return the first character in the string.
 * @pre !empty() */
inline char String::front() const {
    assert(_r.length > 0);
    return _r.data[0];
}

/** @brief Return the last character in the string.
 * @pre !empty() */
inline char String::back() const {
    assert(_r.length > 0);
    return _r.data[_r.length - 1];
}

/** @brief Return the suffix of this string starting at position @a pos. */
inline String String::substring(int pos) const {
    return substring(pos, _r.length);
}

/** @brief Return a substring of this string, consisting of the characters
 * in [@a first, @a last).
 * @pre begin() <= @a first <= @a last <= end() */
inline String String::substring(const char *first, const char *last) const {
    if (first < last && first >= _r.data && last <= _r.data + _r.length)
	return String(first, last - first, _r.memo);
    else
	return String();
}

/** @brief Test if this string equals @a x. */
inline bool String::equals(const String &x) const {
    return equals(x.data(), x.length());
}

/** @brief Test if this string is equal to the data in @a s.
 *
 * If @a len < 0, then treats @a s as a null-terminated C string. */
inline bool String::equals(const char *s, int len) const {
    if (len < 0)
	len = strlen(s);
    return _r.length == len && (_r.data == s || memcmp(_r.data, s, len) == 0);
}

/** @brief Compare two strings.
 * @return a number < 0 if @a a < @a b, 0 if equal, > 0 otherwise
 *
 * Strings compare lexicographically by unsigned character. */
inline int String::compare(const String &a, const String &b) {
    return a.compare(b);
}

/** @brief Compare this string with @a x. */
inline int String::compare(const String &x) const {
    return compare(x._r.data, x._r.length);
}

/** @brief Test whether this string begins with prefix @a x. */
inline bool String::starts_with(const String &x) const {
    return starts_with(x._r.data, x._r.length);
}

/** @brief Assign this string to @a x. */
inline String &String::operator=(const String &x) {
    if (likely(&x != this)) {
	deref();
	assign(x);
    }
    return *this;
}

/** @brief Move-assign this string to @a x. */
inline String &String::operator=(String &&x) {
    deref();
    _r = x._r;
    x._r.memo = 0;
    return *this;
}

/** @brief Assign this string to the C string @a cstr. */
inline String &String::operator=(const char *cstr) {
    assign(cstr, -1, true);
    return *this;
}

/** @brief Swap the values of this string and @a x. */
inline void String::swap(String &x) {
    rep_t r = _r;
    _r = x._r;
    x._r = r;
}

/** @brief Append @a x to this string. */
inline void String::append(const String &x) {
    append(x._r.data, x._r.length, x._r.memo);
}

/** @brief Append the null-terminated C string @a cstr to this string. */
inline void String::append(const char *cstr) {
    append(cstr, -1, 0);
}

/** @brief Append the first @a len characters of @a s to this string. */
inline void String::append(const char *s, int len) {
    append(s, len, 0);
}

/** @brief Append the character @a c to this string. */
inline void String::append(char c) {
    append(&c, 1, 0);
}

/** @brief Append @a x to this string.
 * @return *this */
inline String &String::operator+=(const String &x) {
    append(x._r.data, x._r.length, x._r.memo);
    return *this;
}

/** @brief Append the null-terminated C string @a cstr to this string.
 * @return *this */
inline String &String::operator+=(const char *cstr) {
    append(cstr);
    return *this;
}

/** @brief Append the character @a c to this string.
 * @return *this */
inline String &String::operator+=(char c) {
    append(&c, 1);
    return *this;
}

/** @brief Test if this is an out-of-memory string. */
inline bool String::out_of_memory() const {
    return unlikely(_r.data >= &oom_data[0] && _r.data <= &oom_data[oom_len]);
}

/** @brief Return a pointer to the data of an empty string. */
inline const char *String::empty_data() {
    return &null_data;
}

/** @relates String
 * @brief Compares two strings for equality. */
inline bool operator==(const String &a, const String &b) {
    return a.equals(b);
}

/** @relates String */
inline bool operator==(const char *a, const String &b) {
    return b.equals(a, -1);
}

/** @relates String */
inline bool operator==(const String &a, const char *b) {
    return a.equals(b, -1);
}

/** @relates String
 * @brief Compare two Strings for inequality. */
inline bool operator!=(const String &a, const String &b) {
    return !a.equals(b);
}

/** @relates String */
inline bool operator!=(const char *a, const String &b) {
    return !b.equals(a, -1);
}

/** @relates String */
inline bool operator!=(const String &a, const char *b) {
    return !a.equals(b, -1);
}

/** @relates String
 * @brief Compare two Strings. */
inline bool operator<(const String &a, const String &b) {
    return a.compare(b.data(), b.length()) < 0;
}

/** @relates String
 * @brief Concatenate the operands and return the result. */
inline String operator+(String a, const String &b) {
    a += b;
    return a;
}

/** @relates String */
inline String operator+(String a, const char *b) {
    a.append(b);
    return a;
}

/** @relates String */
inline String operator+(const char *a, const String &b) {
    String s1(a);
    s1 += b;
    return s1;
}

/** @relates String */
inline String operator+(String a, char b) {
    a.append(b);
    return a;
}

DUPLEX_ENDDECLS
#endif
