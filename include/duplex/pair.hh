// -*- c-basic-offset: 4 -*-
#ifndef DUPLEX_PAIR_HH
#define DUPLEX_PAIR_HH
#include <duplex/glue.hh>
DUPLEX_DECLS

template <class T, class U>
struct Pair {

    typedef T first_type;
    typedef U second_type;

    T first;
    U second;

    inline Pair()
	: first(), second() {
    }

    inline Pair(typename fast_argument<T>::type t,
		typename fast_argument<U>::type u)
	: first(t), second(u) {
    }

    inline Pair(const Pair<T, U> &p)
	: first(p.first), second(p.second) {
    }

    template <typename V, typename W>
    inline Pair(const Pair<V, W> &p)
	: first(p.first), second(p.second) {
    }

    Pair<T, U> &operator=(const Pair<T, U> &p) {
	first = p.first;
	second = p.second;
	return *this;
    }

    template <typename V, typename W>
    Pair<T, U> &operator=(const Pair<V, W> &p) {
	first = p.first;
	second = p.second;
	return *this;
    }

};

template <class T, class U>
inline bool operator==(const Pair<T, U> &a, const Pair<T, U> &b)
{
    return a.first == b.first && a.second == b.second;
}

template <class T, class U>
inline bool operator!=(const Pair<T, U> &a, const Pair<T, U> &b)
{
    return a.first != b.first || a.second != b.second;
}

template <class T, class U>
inline bool operator<(const Pair<T, U> &a, const Pair<T, U> &b)
{
    return a.first < b.first
	|| (!(b.first < a.first) && a.second < b.second);
}

template <class T, class U>
inline Pair<T, U> make_pair(T t, U u)
{
    return Pair<T, U>(t, u);
}

DUPLEX_ENDDECLS
#endif
