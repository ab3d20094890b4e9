// -*- c-basic-offset: 4 -*-
#ifndef DUPLEX_STRINGTEST_HH
#define DUPLEX_STRINGTEST_HH
#include "regressiontest.hh"
DUPLEX_DECLS

/*
=c

StringTest()

=s test

runs regression tests for String and StringAccum

=d

StringTest checks the String and StringAccum operations used to build
diagnostics.

*/

class StringTest : public RegressionTest { public:

    StringTest();

    const char *class_name() const		{ return "StringTest"; }

    int initialize(ErrorHandler *);

};

DUPLEX_ENDDECLS
#endif
