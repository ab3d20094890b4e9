// -*- c-basic-offset: 4 -*-
/*
 * dequetest.{cc,hh} -- regression test for Deque
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
#include "dequetest.hh"
#include <duplex/deque.hh>
#include <duplex/error.hh>
#include <duplex/straccum.hh>
#include <utility>
DUPLEX_DECLS

namespace {
class RecordingErrorHandler : public BaseErrorHandler { public:
    RecordingErrorHandler() { }
    void *emit(const String &str, void *, bool) {
	_text << str << '\n';
	return 0;
    }
    bool check(const String &text) {
	_last_text = _text.take_string();
	return text == _last_text;
    }
    StringAccum _text;
    String _last_text;
};

template <typename T>
bool same_contents(const Deque<T> &a, const Deque<T> &b)
{
    if (a.size() != b.size())
	return false;
    for (int i = 0; i < a.size(); ++i)
	if (!(a.peek(i) == b.peek(i)))
	    return false;
    return true;
}
}

DequeTest::DequeTest()
{
}

int
DequeTest::initialize(ErrorHandler *errh)
{
    const int seq[] = { 0, 1, 2, 3, 4, 5 };

    // bounded construction and the rotation walkthrough
    {
	Deque<int> d(3);
	CHECK(d.size() == 0);
	CHECK(d.capacity() == 3);
	CHECK(!d.unlimited());
	CHECK(d.empty());
	CHECK(!d.full());
	d.push_back(0);
	d.push_back(1);
	d.push_back(2);
	CHECK(d.size() == 3);
	CHECK(d.full());
	CHECK(!d.empty());
	CHECK(d.peek(0) == 0);
	CHECK(d.peek(2) == 2);
	d.rotate(1);
	CHECK(d.peek(0) == 2);
	d.rotate(1);
	CHECK(d.peek(0) == 1);
	d.rotate(-1);
	CHECK(d.peek(0) == 2);
    }

    // unbounded construction
    {
	Deque<int> d;
	CHECK(d.unlimited());
	CHECK(d.capacity() == Deque<int>::unbounded);
	for (int i = 0; i < 1000; ++i)
	    d.push_back(i);
	CHECK(d.size() == 1000);
	CHECK(!d.full());
	CHECK(d.peek(0) == 0 && d.peek(999) == 999 && d.peek(500) == 500);

	Deque<int> u = Deque<int>::make_unlimited();
	CHECK(u.unlimited());
	CHECK(u.empty());
    }

    // capacity validation
    {
	RecordingErrorHandler rerrh;
	CHECK(Deque<int>::check_capacity(0) == 0);
	CHECK(Deque<int>::check_capacity(17, &rerrh) == 0);
	CHECK(Deque<int>::check_capacity(Deque<int>::unbounded, &rerrh) == 0);
	CHECK(rerrh.nerrors() == 0);
	CHECK(Deque<int>::check_capacity(-2, &rerrh) == -EINVAL);
	CHECK(rerrh.nerrors() == 1);
	CHECK(rerrh.check("<3>invalid deque capacity -2\n"));
	CHECK(Deque<int>::check_capacity(-100) == -EINVAL);

	// other negative capacities are reported and mean unbounded
	ErrorHandler *old_errh = ErrorHandler::default_handler();
	ErrorHandler::set_default_handler(&rerrh);
	Deque<int> d(-5);
	ErrorHandler::set_default_handler(old_errh);
	CHECK(rerrh.check("<3>invalid deque capacity -5\n"));
	CHECK(d.unlimited());
	CHECK(d.capacity() == Deque<int>::unbounded);
	CHECK(!d.full());
	for (int i = 0; i < 10; ++i)
	    CHECK(d.push_back(i));
	CHECK(d.size() == 10);
	CHECK(d.peek(0) == 0 && d.peek(9) == 9);
    }

    // size after N appends is min(N, C) for every small capacity
    for (int c = 0; c <= 5; ++c)
	for (int n = 0; n <= 12; ++n) {
	    Deque<int> d(c);
	    for (int i = 0; i < n; ++i)
		CHECK(d.push_back(i));
	    CHECK(d.size() == (n < c ? n : c));
	    CHECK(d.full() == (d.size() == c));
	    if (d.size() > 0) {
		CHECK(d.peek(0) == n - d.size());
		CHECK(d.peek(d.size() - 1) == n - 1);
	    }
	}

    // eviction from the opposite end
    {
	Deque<int> d(3);
	for (int i = 0; i < 5; ++i)
	    CHECK(d.push_back(i));
	CHECK(d.size() == 3);
	CHECK(d.peek(0) == 2 && d.peek(1) == 3 && d.peek(2) == 4);
	CHECK(d.push_front(9));
	CHECK(d.size() == 3);
	CHECK(d.peek(0) == 9 && d.peek(1) == 2 && d.peek(2) == 3);
	CHECK(d.push_front(8));
	CHECK(d.peek(0) == 8 && d.peek(2) == 2);
	CHECK(d.push_back(7));
	CHECK(d.peek(0) == 9 && d.peek(2) == 7);
    }

    // capacity 0 is always empty
    {
	Deque<int> d(0);
	for (int i = 0; i < 10; ++i) {
	    CHECK(d.push_back(i));
	    CHECK(d.push_front(i));
	}
	CHECK(d.size() == 0);
	CHECK(d.empty());
	CHECK(d.full());
	int x = 7;
	CHECK(d.try_pop_back(x) == Deque<int>::pop_error);
	CHECK(x == 0);
	CHECK(d.unparse() == "Deque{capacity:0, []}");
    }

    // removal
    {
	RecordingErrorHandler rerrh;
	Deque<int> d;
	int x = 5;
	CHECK(d.try_pop_front(x, &rerrh) == Deque<int>::pop_error);
	CHECK(x == 0);
	CHECK(rerrh.nerrors() == 1);
	CHECK(rerrh.check("<3>deque: pop from empty queue\n"));
	x = 5;
	CHECK(d.try_pop_back(x, &rerrh) == Deque<int>::pop_error);
	CHECK(x == 0);
	CHECK(rerrh.nerrors() == 2);
	CHECK(d.empty());

	d.push_back(1);
	d.push_back(2);
	d.push_back(3);
	CHECK(d.try_pop_back(x) == 0 && x == 3);
	CHECK(d.try_pop_front(x) == 0 && x == 1);
	CHECK(d.size() == 1);
	CHECK(d.try_pop_back(x) == 0 && x == 2);
	CHECK(d.empty());
	CHECK(d.try_pop_back(x) == Deque<int>::pop_error);
	CHECK(d.try_pop_front(x) == Deque<int>::pop_error);

	// the emptied deque is fully reusable
	d.push_front(4);
	CHECK(d.size() == 1 && d.peek(0) == 4);
	d.push_front(3);
	CHECK(d.peek(0) == 3 && d.peek(1) == 4);
	CHECK(d.try_pop_front(x) == 0 && x == 3);
	CHECK(d.try_pop_front(x) == 0 && x == 4);
	CHECK(d.empty());
    }

    // lookup
    {
	RecordingErrorHandler rerrh;
	Deque<int> d;
	for (int i = 0; i < 10; ++i)
	    d.push_back(i * 10);
	for (int i = 0; i < 10; ++i) {
	    int x = -1;
	    CHECK(d.try_peek(i, x) == 0 && x == i * 10);
	    CHECK(d.peek(i) == i * 10);
	    CHECK(d.peek(i) == d.peek(i));
	}
	int x = 1;
	CHECK(d.try_peek(10, x, &rerrh) == Deque<int>::peek_error);
	CHECK(x == 0);
	CHECK(rerrh.check("<3>deque: index 10 out of bounds\n"));
	CHECK(d.try_peek(-1, x, &rerrh) == Deque<int>::peek_error);
	CHECK(rerrh.check("<3>deque: index -1 out of bounds\n"));
	CHECK(d.try_peek(1000, x) == Deque<int>::peek_error);
	CHECK(rerrh.nerrors() == 2);
	CHECK(d.size() == 10);

	Deque<int> e;
	CHECK(e.try_peek(0, x) == Deque<int>::peek_error);
    }

    // count and clear
    {
	Deque<int> d;
	d.push_back(1);
	d.push_back(2);
	d.push_back(1);
	d.push_back(3);
	d.push_front(1);
	CHECK(d.count(1) == 3);
	CHECK(d.count(2) == 1);
	CHECK(d.count(4) == 0);
	d.clear();
	CHECK(d.empty());
	CHECK(d.count(1) == 0);
	d.clear();
	CHECK(d.size() == 0);
	d.push_back(5);
	CHECK(d.size() == 1 && d.peek(0) == 5);
    }

    // copies are independent
    {
	Deque<int> d(4);
	for (int i = 1; i <= 4; ++i)
	    d.push_back(i);
	Deque<int> c = d.copy();
	CHECK(c.capacity() == 4);
	CHECK(c.size() == 4);
	CHECK(same_contents(c, d));
	c.push_back(5);
	CHECK(d.peek(0) == 1 && d.peek(3) == 4);
	CHECK(c.peek(0) == 2 && c.peek(3) == 5);
	int x;
	CHECK(d.try_pop_back(x) == 0 && x == 4);
	CHECK(c.size() == 4 && c.peek(3) == 5);

	Deque<int> e(d);
	CHECK(e.capacity() == 4 && same_contents(e, d));

	Deque<int> m(std::move(e));
	CHECK(m.size() == 3 && m.capacity() == 4);
	CHECK(m.peek(0) == 1 && m.peek(2) == 3);
	CHECK(e.size() == 0 && e.capacity() == 4);
	e.push_back(7);
	CHECK(e.size() == 1 && e.peek(0) == 7);
	CHECK(m.size() == 3);

	Deque<int> empty_copy = Deque<int>(0).copy();
	CHECK(empty_copy.capacity() == 0 && empty_copy.empty());
    }

    // construction from a sequence
    {
	Deque<int> d = Deque<int>::make_from(seq, seq + 6);
	CHECK(d.unlimited() && d.size() == 6);
	int n = 0;
	for (Pair<int, int> p : d.all()) {
	    CHECK(p == make_pair(n, n));
	    ++n;
	}
	CHECK(n == 6);

	Deque<int> b = Deque<int>::make_from(seq, seq + 6, 4);
	CHECK(b.capacity() == 4 && b.size() == 4);
	CHECK(b.peek(0) == 2 && b.peek(3) == 5);

	Deque<int> z = Deque<int>::make_from(seq, seq, 4);
	CHECK(z.empty() && z.capacity() == 4);
    }

    // rotation
    {
	Deque<int> d = Deque<int>::make_from(seq, seq + 5);
	d.rotate(2);
	CHECK(d.peek(0) == 3 && d.peek(1) == 4 && d.peek(2) == 0 && d.peek(4) == 2);
	d.rotate(-2);
	CHECK(d.peek(0) == 0 && d.peek(4) == 4);
	d.rotate(7);
	CHECK(d.peek(0) == 3 && d.peek(4) == 2);
	d.rotate(-7);
	CHECK(d.peek(0) == 0 && d.peek(4) == 4);
	d.rotate(5);
	CHECK(d.peek(0) == 0 && d.peek(4) == 4);
	d.rotate(0);
	CHECK(d.peek(0) == 0);
	d.rotate(1);
	d.rotate(-1);
	CHECK(d.peek(0) == 0 && d.peek(4) == 4);

	// links at both ends survive rotation
	d.rotate(3);
	int x;
	CHECK(d.try_pop_front(x) == 0 && x == 2);
	CHECK(d.try_pop_back(x) == 0 && x == 1);
	CHECK(d.peek(0) == 3 && d.peek(2) == 0);

	// rotate(n) matches n single steps, in both directions
	for (int n = -9; n <= 9; ++n) {
	    Deque<int> a = Deque<int>::make_from(seq, seq + 6);
	    Deque<int> b = a.copy();
	    a.rotate(n);
	    for (int i = 0; i < (n < 0 ? -n : n); ++i)
		b.rotate(n < 0 ? -1 : 1);
	    CHECK(same_contents(a, b));
	}

	Deque<int> one;
	one.push_back(1);
	one.rotate(3);
	CHECK(one.size() == 1 && one.peek(0) == 1);
	Deque<int> none;
	none.rotate(-4);
	CHECK(none.empty());
    }

    // iteration
    {
	Deque<int> d = Deque<int>::make_from(seq, seq + 6);
	{
	    int expect = 0;
	    Deque<int>::value_range r = d.values();
	    for (Deque<int>::const_iterator it = r.begin(); it != r.end(); ++it, ++expect)
		CHECK(*it == expect);
	    CHECK(expect == 6);
	}

	// each call starts a fresh traversal, and the lock is released after
	// a completed one
	int sum = 0;
	for (int v : d.values())
	    sum += v;
	for (int v : d.values())
	    sum += v;
	CHECK(sum == 30);
	d.push_back(6);
	CHECK(d.size() == 7);

	// ...and after an abandoned one
	for (int v : d.values())
	    if (v == 2)
		break;
	d.push_back(7);
	CHECK(d.size() == 8);

	// moving a range hands over the lock without releasing it twice
	{
	    Deque<int>::value_range r1 = d.values();
	    Deque<int>::value_range r2(std::move(r1));
	    CHECK(r1.begin() == r1.end());
	    CHECK(*r2.begin() == 0);
	}
	d.push_back(8);
	CHECK(d.size() == 9);

	Deque<int> e;
	for (int v : e.values()) {
	    (void) v;
	    CHECK(false);
	}
	Deque<int>::pair_range er = e.all();
	CHECK(er.begin() == er.end());
    }

    // string representation
    {
	Deque<int> d(3);
	d.push_back(0);
	d.push_back(1);
	d.push_back(2);
	CHECK(d.unparse() == "Deque{capacity:3, [0, 1, 2]}");
	CHECK(Deque<int>().unparse() == "Deque{capacity:unlimited, []}");
	StringAccum sa;
	sa << d;
	CHECK(sa.take_string() == "Deque{capacity:3, [0, 1, 2]}");
    }

    // bulk insertion and reversal
    {
	Deque<int> d(5);
	CHECK(d.extend(seq + 1, seq + 4) == 3);
	CHECK(d.size() == 3 && d.peek(0) == 1 && d.peek(2) == 3);
	CHECK(d.extend_front(seq + 1, seq + 4) == 3);
	CHECK(d.size() == 5);
	CHECK(d.peek(0) == 3 && d.peek(1) == 2 && d.peek(2) == 1 && d.peek(3) == 1 && d.peek(4) == 2);
	d.reverse();
	CHECK(d.peek(0) == 2 && d.peek(1) == 1 && d.peek(2) == 1 && d.peek(3) == 2 && d.peek(4) == 3);
	int x;
	CHECK(d.try_pop_back(x) == 0 && x == 3);
	CHECK(d.try_pop_front(x) == 0 && x == 2);
	CHECK(d.size() == 3);

	Deque<int> single;
	single.push_back(4);
	single.reverse();
	CHECK(single.peek(0) == 4);
	CHECK(single.try_pop_back(x) == 0 && x == 4);
	CHECK(single.empty());
    }

    // non-trivial element types
    {
	Deque<String> sd(4);
	for (int i = 10; i >= 0; --i)
	    sd.push_front(String(i));
	CHECK(sd.size() == 4);
	CHECK(sd.peek(0) == "0" && sd.peek(3) == "3");
	sd.push_back("3");
	CHECK(sd.count("3") == 2);
	CHECK(sd.unparse() == "Deque{capacity:4, [1, 2, 3, 3]}");
	String s;
	CHECK(sd.try_pop_front(s) == 0 && s == "1");
	CHECK(sd.try_peek(7, s) == Deque<String>::peek_error && s.empty());
	Deque<String> sc = sd.copy();
	sd.clear();
	CHECK(sc.size() == 3 && sc.peek(0) == "2");
    }

    // node pools hand out fixed-size blocks and reuse freed ones
    {
	SizedNodeAllocator<24> pool;
	CHECK(pool.size() == 24);
	void *a = pool.allocate();
	void *b = pool.allocate();
	CHECK(a && b && a != b);
	pool.deallocate(a);
	CHECK(pool.allocate() == a);
	for (int i = 0; i < 1000; ++i)
	    CHECK(pool.allocate() != 0);

	SizedNodeAllocator<24> other;
	other.swap(pool);
	CHECK(other.allocate() != 0);
	other.deallocate(b);
	CHECK(other.allocate() == b);

	SizedNodeAllocator<2> tiny;
	CHECK(tiny.size() >= sizeof(void *));
    }

    errh->message("All tests pass!");
    return 0;
}

DUPLEX_ENDDECLS
