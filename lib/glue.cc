// -*- c-basic-offset: 4; related-file-name: "../include/duplex/glue.hh" -*-
/*
 * glue.{cc,hh} -- minimize portability headaches, and miscellany
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
#include <duplex/glue.hh>
#include <duplex/error.hh>
#include <stdarg.h>

// DEBUGGING OUTPUT

extern "C" {
void
duplex_chatter(const char *fmt, ...)
{
    va_list val;
    va_start(val, fmt);

    if (Duplex::ErrorHandler *errh = Duplex::ErrorHandler::default_handler())
	errh->xmessage(Duplex::ErrorHandler::e_info, fmt, val);
    else {
	vfprintf(stderr, fmt, val);
	fprintf(stderr, "\n");
    }

    va_end(val);
}
}
