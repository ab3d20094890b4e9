// -*- c-basic-offset: 4 -*-
/*
 * dequethreadtest.{cc,hh} -- regression test for Deque threading
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
#include "dequethreadtest.hh"
#include <duplex/deque.hh>
#include <duplex/error.hh>
#include <sched.h>
#include <unistd.h>
DUPLEX_DECLS

DequeThreadTest::DequeThreadTest()
{
}

#if HAVE_MULTITHREAD
namespace {
enum {
    nproducers = 4,
    nconsumers = 4,
    nper_producer = 20000
};

struct shared_state {
    Deque<int> *d;
    volatile uint32_t npopped;
    volatile uint32_t nbad;
};

struct thread_state {
    shared_state *shared;
    int id;
    long long sum;
    int last[nproducers];
};
}

extern "C" {
static void *deque_thread_producer(void *arg)
{
    thread_state *ts = static_cast<thread_state *>(arg);
    int base = ts->id * nper_producer;
    for (int i = 0; i < nper_producer; ++i)
	if (!ts->shared->d->push_back(base + i))
	    __atomic_add_fetch(&ts->shared->nbad, 1, __ATOMIC_RELAXED);
    return 0;
}

static void *deque_thread_consumer(void *arg)
{
    thread_state *ts = static_cast<thread_state *>(arg);
    shared_state *ss = ts->shared;
    const uint32_t total = nproducers * nper_producer;
    for (int p = 0; p < nproducers; ++p)
	ts->last[p] = -1;
    ts->sum = 0;

    while (__atomic_load_n(&ss->npopped, __ATOMIC_ACQUIRE) < total) {
	int x;
	if (ss->d->try_pop_front(x) != 0) {
	    sched_yield();
	    continue;
	}
	__atomic_add_fetch(&ss->npopped, 1, __ATOMIC_ACQ_REL);
	ts->sum += x;
	// one producer's values come out in the order they went in
	int p = x / nper_producer, i = x % nper_producer;
	if (p < 0 || p >= nproducers || i <= ts->last[p])
	    __atomic_add_fetch(&ss->nbad, 1, __ATOMIC_RELAXED);
	else
	    ts->last[p] = i;
    }
    return 0;
}

static void *deque_thread_evictor(void *arg)
{
    thread_state *ts = static_cast<thread_state *>(arg);
    for (int i = 0; i < nper_producer; ++i) {
	bool ok;
	if (i % 2)
	    ok = ts->shared->d->push_back(ts->id);
	else
	    ok = ts->shared->d->push_front(ts->id);
	if (!ok || ts->shared->d->size() > ts->shared->d->capacity())
	    __atomic_add_fetch(&ts->shared->nbad, 1, __ATOMIC_RELAXED);
    }
    return 0;
}

static void *deque_thread_blocked_writer(void *arg)
{
    shared_state *ss = static_cast<shared_state *>(arg);
    if (!ss->d->push_back(-1))
	__atomic_add_fetch(&ss->nbad, 1, __ATOMIC_RELAXED);
    __atomic_store_n(&ss->npopped, 1, __ATOMIC_RELEASE);
    return 0;
}
}

static int
start_threads(pthread_t *threads, int n, void *(*f)(void *), thread_state *ts,
	      ErrorHandler *errh)
{
    for (int i = 0; i < n; ++i) {
	int err = pthread_create(&threads[i], 0, f, &ts[i]);
	if (err != 0) {
	    for (int j = 0; j < i; ++j)
		pthread_join(threads[j], 0);
	    return errh->error("cannot start thread: %s", strerror(err));
	}
    }
    return 0;
}

static void
join_threads(pthread_t *threads, int n)
{
    for (int i = 0; i < n; ++i)
	pthread_join(threads[i], 0);
}
#endif

int
DequeThreadTest::initialize(ErrorHandler *errh)
{
#if HAVE_MULTITHREAD
    // producers and consumers: nothing lost, duplicated, or reordered
    {
	Deque<int> d;
	shared_state ss;
	ss.d = &d;
	ss.npopped = ss.nbad = 0;
	thread_state producers[nproducers], consumers[nconsumers];
	pthread_t pthreads[nproducers], cthreads[nconsumers];
	for (int i = 0; i < nproducers; ++i) {
	    producers[i].shared = &ss;
	    producers[i].id = i;
	}
	for (int i = 0; i < nconsumers; ++i) {
	    consumers[i].shared = &ss;
	    consumers[i].id = i;
	}

	int r = start_threads(cthreads, nconsumers, deque_thread_consumer, consumers, errh);
	if (r < 0)
	    return r;
	r = start_threads(pthreads, nproducers, deque_thread_producer, producers, errh);
	if (r < 0) {
	    // let the consumers finish
	    __atomic_store_n(&ss.npopped, (uint32_t) nproducers * nper_producer, __ATOMIC_RELEASE);
	    join_threads(cthreads, nconsumers);
	    return r;
	}
	join_threads(pthreads, nproducers);
	join_threads(cthreads, nconsumers);

	long long sum = 0, n = (long long) nproducers * nper_producer;
	for (int i = 0; i < nconsumers; ++i)
	    sum += consumers[i].sum;
	CHECK(ss.nbad == 0);
	CHECK(ss.npopped == (uint32_t) n);
	CHECK(sum == n * (n - 1) / 2);
	CHECK(d.empty());
    }

    // eviction under contention never overfills
    {
	Deque<int> d(64);
	shared_state ss;
	ss.d = &d;
	ss.npopped = ss.nbad = 0;
	thread_state evictors[nproducers];
	pthread_t threads[nproducers];
	for (int i = 0; i < nproducers; ++i) {
	    evictors[i].shared = &ss;
	    evictors[i].id = i;
	}
	int r = start_threads(threads, nproducers, deque_thread_evictor, evictors, errh);
	if (r < 0)
	    return r;
	join_threads(threads, nproducers);
	CHECK(ss.nbad == 0);
	CHECK(d.size() == 64);
	CHECK(d.full());
	int total = 0;
	for (int i = 0; i < nproducers; ++i)
	    total += d.count(i);
	CHECK(total == 64);
    }

    // a live values() range holds off writers
    {
	Deque<int> d;
	for (int i = 0; i < 10; ++i)
	    d.push_back(i);
	shared_state ss;
	ss.d = &d;
	ss.npopped = ss.nbad = 0;
	pthread_t writer;
	{
	    Deque<int>::value_range range = d.values();
	    int err = pthread_create(&writer, 0, deque_thread_blocked_writer, &ss);
	    if (err != 0)
		return errh->error("cannot start thread: %s", strerror(err));
	    usleep(50000);
	    CHECK(__atomic_load_n(&ss.npopped, __ATOMIC_ACQUIRE) == 0);
	    int n = 0;
	    for (Deque<int>::const_iterator it = range.begin(); it != range.end(); ++it)
		++n;
	    CHECK(n == 10);
	}
	pthread_join(writer, 0);
	CHECK(ss.nbad == 0);
	CHECK(ss.npopped == 1);
	CHECK(d.size() == 11);
	CHECK(d.peek(10) == -1);
    }

    errh->message("All tests pass!");
#else
    errh->message("Multithreading not configured, skipping tests");
#endif
    return 0;
}

DUPLEX_ENDDECLS
