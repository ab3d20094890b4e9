// -*- c-basic-offset: 4 -*-
#ifndef DUPLEX_ERRORTEST_HH
#define DUPLEX_ERRORTEST_HH
#include "regressiontest.hh"
DUPLEX_DECLS

/*
=c

ErrorTest()

=s test

runs regression tests for error handling

=d

ErrorTest checks ErrorHandler formatting, annotations, decoration, and
error counting.

*/

class ErrorTest : public RegressionTest { public:

    ErrorTest();

    const char *class_name() const		{ return "ErrorTest"; }

    int initialize(ErrorHandler *);

};

DUPLEX_ENDDECLS
#endif
