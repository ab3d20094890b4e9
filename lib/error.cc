// -*- related-file-name: "../include/duplex/error.hh" -*-
/*
 * error.{cc,hh} -- flexible classes for error reporting
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
#include <duplex/error.hh>
#include <duplex/straccum.hh>
DUPLEX_DECLS

const char ErrorHandler::e_abort[] = "<-999>";
const char ErrorHandler::e_fatal[] = "<-1>";
const char ErrorHandler::e_emergency[] = "<0>";
const char ErrorHandler::e_alert[] = "<1>";
const char ErrorHandler::e_critical[] = "<2>";
const char ErrorHandler::e_error[] = "<3>";
const char ErrorHandler::e_warning[] = "<4>";
const char ErrorHandler::e_warning_annotated[] = "<4>warning: ";
const char ErrorHandler::e_notice[] = "<5>";
const char ErrorHandler::e_info[] = "<6>";
const char ErrorHandler::e_debug[] = "<7>";

const int ErrorHandler::ok_result = 0;
const int ErrorHandler::error_result = -EINVAL;

ErrorHandler *ErrorHandler::the_default_handler = 0;
ErrorHandler *ErrorHandler::the_silent_handler = 0;


//
// ANNOTATIONS
//

static bool
is_anno_name_char(char c)
{
    return isalnum((unsigned char) c) || c == '_' || c == '-' || c == '.';
}

const char *
ErrorHandler::skip_anno(const String &str,
			const char *begin, const char *end,
			String *name_result, String *value_result, bool raw)
{
    String name, value;
    const char *s = begin;

    if (s + 3 <= end && *s == '<') {
	// level annotation: "<N>" or "<-N>"
	const char *x = s + 1;
	if (x != end && *x == '-')
	    ++x;
	const char *digits = x;
	while (x != end && isdigit((unsigned char) *x))
	    ++x;
	if (x != digits && x != end && *x == '>') {
	    name = String::make_stable("<>", 2);
	    value = str.substring(s + 1, x);
	    s = x + 1;
	}
    } else if (s + 2 <= end && s[0] == '{' && s[1] == '}')
	// "{}" ends the annotation area
	s += 2;
    else if (s + 3 <= end && *s == '{' && is_anno_name_char(s[1])) {
	const char *x = s + 1;
	while (x != end && is_anno_name_char(*x))
	    ++x;
	if (x != end && *x == ':') {
	    const char *vbegin = ++x;
	    bool quoted = false;
	    while (x != end && *x != '}') {
		if (*x == '\\' && x + 1 != end) {
		    quoted = true;
		    ++x;
		}
		++x;
	    }
	    if (x != end) {
		name = str.substring(s + 1, vbegin - 1);
		if (!quoted || raw)
		    value = str.substring(vbegin, x);
		else {
		    StringAccum sa;
		    for (const char *v = vbegin; v != x; ++v) {
			if (*v == '\\' && v + 1 != x)
			    ++v;
			sa << *v;
		    }
		    value = sa.take_string();
		}
		s = x + 1;
	    }
	}
    }

    if (name_result)
	*name_result = name;
    if (value_result)
	*value_result = value;
    return s;
}

const char *
ErrorHandler::parse_anno(const String &str,
			 const char *begin, const char *end, ...)
{
    const char *name, *last_pos = begin;
    void *value;
    String name_result, value_result;

    while (1) {
	const char *x = skip_anno(str, last_pos, end, &name_result, &value_result, false);
	if (x == last_pos)
	    break;
	last_pos = x;
	if (!name_result)
	    break;

	va_list val;
	va_start(val, end);
	while ((name = va_arg(val, const char *))) {
	    value = va_arg(val, void *);
	    if (name[0] == '#') {
		if (name_result.equals(name + 1, -1))
		    *reinterpret_cast<int *>(value) = strtol(value_result.c_str(), 0, 10);
	    } else if (name_result.equals(name, -1))
		*reinterpret_cast<String *>(value) = value_result;
	}
	va_end(val);
    }

    return last_pos;
}

String
ErrorHandler::make_anno(const char *name, const String &value)
{
    StringAccum sa;
    sa.append("{", 1);

    if (strcmp(name, "<>") == 0) {
	// level annotations must hold a number
	const char *s = value.begin(), *end = value.end();
	if (s != end && *s == '-')
	    ++s;
	if (s == end)
	    return String();
	for (; s != end; ++s)
	    if (!isdigit((unsigned char) *s))
		return String();
	sa.clear();
	sa << '<' << value << '>';
	return sa.take_string();
    }

    for (const char *s = name; *s; ++s)
	if (!is_anno_name_char(*s))
	    return String();
    sa << name << ':';
    for (const char *s = value.begin(); s != value.end(); ++s) {
	if (*s == '\\' || *s == '}')
	    sa << '\\';
	sa << (*s == '\n' ? ' ' : *s);
    }
    sa << '}';
    return sa.take_string();
}

String
ErrorHandler::combine_anno(const String &text, const String &anno)
{
    if (!anno)
	return text;

    // split the new annotations from their trailing text
    String anno_level;
    const char *anno_end = anno.begin(), *anno_braces = anno.begin();
    while (1) {
	String name;
	const char *x = skip_anno(anno, anno_end, anno.end(), &name, 0, true);
	if (x == anno_end)
	    break;
	if (name.equals("<>", 2)) {
	    anno_level = anno.substring(anno_end, x);
	    anno_braces = x;
	}
	anno_end = x;
	if (!name)
	    break;
    }
    String anno_trailer = anno.substring(anno_end, anno.end());

    StringAccum sa;
    const char *s = text.begin(), *end = text.end();
    do {
	const char *line_end = s;
	while (line_end != end && *line_end != '\n')
	    ++line_end;

	// collect this line's own annotations
	bool has_level = false, has_terminator = false;
	const char *body = s;
	while (1) {
	    String name;
	    const char *x = skip_anno(text, body, line_end, &name, 0, true);
	    if (x == body)
		break;
	    if (name.equals("<>", 2))
		has_level = true;
	    else if (!name)
		has_terminator = true;
	    body = x;
	    if (!name)
		break;
	}

	if (!has_level)
	    sa << anno_level;
	const char *line_annos = s;
	if (has_terminator)
	    sa.append(line_annos, body - 2);
	else
	    sa.append(line_annos, body);

	// add new brace annotations the line doesn't already have
	for (const char *a = anno_braces; a != anno_end; ) {
	    String name;
	    const char *x = skip_anno(anno, a, anno_end, &name, 0, true);
	    if (!name)
		break;
	    bool found = false;
	    for (const char *b = s; b != body; ) {
		String line_name;
		const char *y = skip_anno(text, b, body, &line_name, 0, true);
		if (y == b || !line_name)
		    break;
		if (line_name == name) {
		    found = true;
		    break;
		}
		b = y;
	    }
	    if (!found)
		sa.append(a, x);
	    a = x;
	}

	if (has_terminator)
	    sa << "{}";
	sa << anno_trailer;
	sa.append(body, line_end);
	if (line_end != end) {
	    sa << '\n';
	    ++line_end;
	}
	s = line_end;
    } while (s != end);

    return sa.take_string();
}


//
// FORMATTING
//

template <typename T>
static void
append_formatted(StringAccum &sa, const char *spec, T x)
{
    int len = ::snprintf(0, 0, spec, x);
    if (len > 0)
	sa.snprintf(len, spec, x);
}

String
ErrorHandler::format(const char *fmt, ...)
{
    va_list val;
    va_start(val, fmt);
    String s = format(fmt, val);
    va_end(val);
    return s;
}

String
ErrorHandler::format(const char *s, va_list val)
{
    StringAccum msg;

    while (1) {
	const char *pct = strchr(s, '%');
	if (!pct) {
	    if (*s)
		msg << s;
	    break;
	}
	if (pct != s)
	    msg.append(s, pct - s);
	s = pct + 1;

	// flags
	StringAccum spec;
	spec << '%';
	bool alternate = false;
	for (; *s == '#' || *s == '0' || *s == '-' || *s == ' ' || *s == '+'; ++s)
	    if (*s == '#')
		alternate = true;
	    else
		spec << *s;

	// field width
	if (*s == '*') {
	    spec << va_arg(val, int);
	    ++s;
	} else
	    for (; isdigit((unsigned char) *s); ++s)
		spec << *s;

	// precision
	if (*s == '.') {
	    ++s;
	    if (*s == '*') {
		int precision = va_arg(val, int);
		if (precision >= 0)
		    spec << '.' << precision;
		++s;
	    } else {
		spec << '.';
		for (; isdigit((unsigned char) *s); ++s)
		    spec << *s;
	    }
	}

	// length modifier
	enum { lm_none, lm_h, lm_hh, lm_l, lm_ll, lm_z } lm = lm_none;
	if (s[0] == 'h' && s[1] == 'h') {
	    lm = lm_hh;
	    s += 2;
	} else if (s[0] == 'h') {
	    lm = lm_h;
	    ++s;
	} else if (s[0] == 'l' && s[1] == 'l') {
	    lm = lm_ll;
	    s += 2;
	} else if (s[0] == 'l') {
	    lm = lm_l;
	    ++s;
	} else if (s[0] == 'z') {
	    lm = lm_z;
	    ++s;
	}

	switch (*s) {

	case 'd':
	case 'i':
	    if (lm == lm_ll) {
		spec << "ll" << 'd';
		append_formatted(msg, spec.c_str(), va_arg(val, long long));
	    } else if (lm == lm_l || lm == lm_z) {
		spec << 'l' << 'd';
		append_formatted(msg, spec.c_str(), va_arg(val, long));
	    } else {
		int x = va_arg(val, int);
		if (lm == lm_h)
		    x = (short) x;
		else if (lm == lm_hh)
		    x = (signed char) x;
		spec << 'd';
		append_formatted(msg, spec.c_str(), x);
	    }
	    break;

	case 'u':
	case 'o':
	case 'x':
	case 'X': {
	    String conv(*s);
	    if (alternate && *s != 'u') {
		// '#' must precede the width
		String rest = String(spec.data() + 1, spec.length() - 1);
		spec.clear();
		spec << "%#" << rest;
	    }
	    if (lm == lm_ll) {
		spec << "ll" << conv;
		append_formatted(msg, spec.c_str(), va_arg(val, unsigned long long));
	    } else if (lm == lm_l || lm == lm_z) {
		spec << 'l' << conv;
		append_formatted(msg, spec.c_str(), va_arg(val, unsigned long));
	    } else {
		unsigned x = va_arg(val, unsigned);
		if (lm == lm_h)
		    x = (unsigned short) x;
		else if (lm == lm_hh)
		    x = (unsigned char) x;
		spec << conv;
		append_formatted(msg, spec.c_str(), x);
	    }
	    break;
	}

	case 'e': case 'E':
	case 'f': case 'F':
	case 'g': case 'G':
	    spec << *s;
	    append_formatted(msg, spec.c_str(), va_arg(val, double));
	    break;

	case 'c': {
	    unsigned char c = va_arg(val, int);
	    if (c >= 32 && c <= 126)
		msg << c;
	    else if (c == '\n')
		msg << "\\n";
	    else if (c == '\t')
		msg << "\\t";
	    else
		msg.snprintf(4, "\\%03o", c);
	    break;
	}

	case 's': {
	    const char *x = va_arg(val, const char *);
	    if (!x)
		x = "(null)";
	    String str = (alternate ? String(x).printable() : String::make_stable(x));
	    if (spec.length() == 1)
		msg << str;
	    else {
		spec << "s";
		append_formatted(msg, spec.c_str(), str.c_str());
	    }
	    break;
	}

	case 'p':
	    msg << va_arg(val, void *);
	    break;

	case '<':
	case '>':
	    msg << '\'';
	    break;

	case '%':
	    msg << '%';
	    break;

	case '\0':
	    msg << '%';
	    return msg.take_string();

	default:
	    msg << '%' << *s;
	    break;

	}
	++s;
    }

    return msg.take_string();
}


//
// MESSAGE DISPATCH
//

String
ErrorHandler::decorate(const String &str)
{
    return str;
}

void *
ErrorHandler::emit(const String &, void *user_data, bool)
{
    return user_data;
}

void
ErrorHandler::account(int level)
{
    (void) level;
}

int
ErrorHandler::xmessage(const String &str)
{
    String xstr = decorate(str);

    int min_level = 1000;
    const char *s = xstr.begin(), *end = xstr.end();
    void *user_data = 0;
    while (s != end) {
	const char *l = s;
	while (l != end && *l != '\n')
	    ++l;
	const char *next = (l == end ? l : l + 1);

	int xlevel = 1000;
	parse_anno(xstr, s, l, "#<>", &xlevel, (const char *) 0);
	if (xlevel < min_level)
	    min_level = xlevel;

	user_data = emit(xstr.substring(s, l), user_data, next != end);
	s = next;
    }

    account(min_level);
    return min_level <= el_warning ? error_result : ok_result;
}

void
ErrorHandler::debug(const char *fmt, ...)
{
    va_list val;
    va_start(val, fmt);
    xmessage(String::make_stable(e_debug, 3), fmt, val);
    va_end(val);
}

void
ErrorHandler::message(const char *fmt, ...)
{
    va_list val;
    va_start(val, fmt);
    xmessage(String::make_stable(e_info, 3), fmt, val);
    va_end(val);
}

int
ErrorHandler::warning(const char *fmt, ...)
{
    va_list val;
    va_start(val, fmt);
    int r = xmessage(String::make_stable(e_warning_annotated), fmt, val);
    va_end(val);
    return r;
}

int
ErrorHandler::error(const char *fmt, ...)
{
    va_list val;
    va_start(val, fmt);
    int r = xmessage(String::make_stable(e_error, 3), fmt, val);
    va_end(val);
    return r;
}


//
// FILE ERROR HANDLER
//

FileErrorHandler::FileErrorHandler(FILE *f, const String &context)
    : _f(f), _context(context)
{
}

void *
FileErrorHandler::emit(const String &str, void *, bool)
{
    const char *s = parse_anno(str, str.begin(), str.end(), (const char *) 0);
    StringAccum sa;
    sa << _context;
    sa.append(s, str.end());
    sa << '\n';
    if (fwrite(sa.data(), 1, sa.length(), _f) != (size_t) sa.length())
	clearerr(_f);
    return 0;
}

void
FileErrorHandler::account(int level)
{
    BaseErrorHandler::account(level);
    if (level <= el_abort) {
	fflush(_f);
	abort();
    } else if (level <= el_fatal)
	exit(-level);
}


//
// STATIC ERROR HANDLERS
//

ErrorHandler *
ErrorHandler::static_initialize(ErrorHandler *default_handler)
{
    if (!the_silent_handler) {
	the_default_handler = default_handler;
	the_silent_handler = new SilentErrorHandler;
    }
    return default_handler;
}

void
ErrorHandler::static_cleanup()
{
    delete the_default_handler;
    delete the_silent_handler;
    the_default_handler = the_silent_handler = 0;
}

void
ErrorHandler::set_default_handler(ErrorHandler *errh)
{
    the_default_handler = errh;
}


//
// ERROR VENEER
//

int
ErrorVeneer::nwarnings() const
{
    return _errh ? _errh->nwarnings() : 0;
}

int
ErrorVeneer::nerrors() const
{
    return _errh ? _errh->nerrors() : 0;
}

void
ErrorVeneer::reset_counts()
{
    if (_errh)
	_errh->reset_counts();
}

String
ErrorVeneer::decorate(const String &str)
{
    if (_errh)
	return _errh->decorate(str);
    else
	return ErrorHandler::decorate(str);
}

void *
ErrorVeneer::emit(const String &str, void *user_data, bool more)
{
    if (_errh)
	return _errh->emit(str, user_data, more);
    else
	return ErrorHandler::emit(str, user_data, more);
}

void
ErrorVeneer::account(int level)
{
    ErrorHandler::account(level);
    if (_errh)
	_errh->account(level);
}


//
// PREFIX ERROR HANDLER
//

PrefixErrorHandler::PrefixErrorHandler(ErrorHandler *errh,
				       const String &prefix)
    : ErrorVeneer(errh), _prefix(prefix)
{
}

String
PrefixErrorHandler::decorate(const String &str)
{
    return ErrorVeneer::decorate(combine_anno(str, _prefix));
}

DUPLEX_ENDDECLS
