// -*- c-basic-offset: 4; related-file-name: "../include/duplex/sync.hh" -*-
/*
 * sync.{cc,hh} -- thread synchronization
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
#include <duplex/sync.hh>
#include <duplex/error.hh>
DUPLEX_DECLS

/** @brief Report a failed pthread mutex operation and abort.
 *
 * Failures are programming errors: a lock acquired twice by one thread, or
 * released by a thread that does not hold it. */
void
Mutex::lock_failure(const char *op, int err)
{
    if (ErrorHandler *errh = ErrorHandler::default_handler())
	errh->xmessage(ErrorHandler::e_abort,
		       ErrorHandler::format("Mutex::%s(): %s", op, strerror(err)));
    else
	duplex_chatter("Mutex::%s(): %s", op, strerror(err));
    abort();
}

DUPLEX_ENDDECLS
