// -*- related-file-name: "../../lib/error.cc" -*-
#ifndef DUPLEX_ERROR_HH
#define DUPLEX_ERROR_HH
#include <duplex/string.hh>
#include <stdio.h>
#include <stdarg.h>
#if __GNUC__ > 3
# define ERRH_SENTINEL __attribute__((sentinel))
#else
# define ERRH_SENTINEL
#endif
DUPLEX_DECLS

/** @class ErrorHandler
 * @brief Error reporting class.
 *
 * Duplex reports recoverable errors by returning a negative errno value and,
 * optionally, writing a message to an ErrorHandler passed in by the caller.
 * Passing a null ErrorHandler pointer means "report nothing".
 *
 * Error messages may carry annotations ahead of the message text.  A
 * leading @em level annotation like <tt>"<3>"</tt> gives the message's
 * seriousness; lower numbers are more serious, and levels 0-7 match syslog.
 * Other annotations have the form <tt>"{name:value}"</tt>.  An empty pair
 * of braces ends the annotation area.
 *
 * <tt>"&lt;3&gt;{x:deque}index 7 out of bounds"</tt>
 *
 * Error handlers may be stacked.  ErrorVeneer subclasses such as
 * PrefixErrorHandler decorate messages and pass them on to another
 * handler. */
class ErrorHandler { public:

    /** @brief Error level constants.
     *
     * Lower values represent more serious errors.  Negative levels request
     * immediate exit: el_fatal exits the process with status 1, and el_abort
     * calls abort(). */
    enum Level {
	el_abort = -999,
	el_fatal = -1,
	el_emergency = 0,
	el_alert = 1,
	el_critical = 2,
	el_error = 3,
	el_warning = 4,
	el_notice = 5,
	el_info = 6,
	el_debug = 7
    };

    /** @brief Error level indicators. */
    static const char e_abort[],
	e_fatal[],
	e_emergency[],
	e_alert[],
	e_critical[],
	e_error[],
	e_warning[],
	e_warning_annotated[],
	e_notice[],
	e_info[],
	e_debug[];

    ErrorHandler() {
    }

    virtual ~ErrorHandler() {
    }


    /** @brief Initialize the ErrorHandler implementation.
     * @param errh default error handler
     * @return @a errh
     *
     * Creates the silent_handler() and installs @a errh as the default
     * error handler.  @a errh becomes the property of the ErrorHandler
     * implementation; static_cleanup() will delete it.  Only the first call
     * has any effect. */
    static ErrorHandler *static_initialize(ErrorHandler *errh);

    /** @brief Delete the default and silent handlers. */
    static void static_cleanup();

    /** @brief Return the default ErrorHandler, or null before
     * static_initialize(). */
    static ErrorHandler *default_handler() {
	return the_default_handler;
    }

    /** @brief Set the default ErrorHandler to @a errh.
     *
     * Any prior default handler is @em not destroyed. */
    static void set_default_handler(ErrorHandler *errh);

    /** @brief Return the global silent ErrorHandler. */
    static ErrorHandler *silent_handler() {
	return the_silent_handler;
    }


    static const int ok_result;		///< Equals 0
    static const int error_result;	///< Equals -EINVAL


    /** @brief Print a debug message (level el_debug). */
    void debug(const char *fmt, ...);
    /** @brief Print an informational message (level el_info). */
    void message(const char *fmt, ...);
    /** @brief Print a warning message (level el_warning).
     * @return error_result
     *
     * The string "warning: " is prepended to every line of the message. */
    int warning(const char *fmt, ...);
    /** @brief Print an error message (level el_error).
     * @return error_result */
    int error(const char *fmt, ...);


    /** @brief Print an annotated error message.
     * @return ok_result if the minimum error level was el_notice or higher,
     * otherwise error_result
     *
     * Passes @a str to decorate(), splits the result into lines, calls
     * emit() for each line, and finally calls account() with the minimum
     * error level of any line. */
    int xmessage(const String &str);
    /** @brief Print an error message, adding annotations @a anno. */
    int xmessage(const String &anno, const String &str) {
	return xmessage(combine_anno(str, anno));
    }
    /** @brief Format and print an error message, adding annotations. */
    int xmessage(const String &anno, const char *fmt, va_list val) {
	return xmessage(anno, format(fmt, val));
    }


    /** @brief Format an error string.
     * @param fmt printf-like format string
     *
     * Understands the conversions <tt>%d %i %u %o %x %X %c %s %p %e %f
     * %g</tt> with the usual flags, field widths, precisions (including
     * <tt>*</tt>) and the length modifiers <tt>h l ll z</tt>.  The
     * alternate form <tt>%#s</tt> prints String::printable() of its
     * argument, and <tt>%&lt;</tt> and <tt>%&gt;</tt> print opening and
     * closing quotes. */
    static String format(const char *fmt, ...);
    /** @overload */
    static String format(const char *fmt, va_list val);


    /** @brief Decorate an error message before it is emitted.
     *
     * The default implementation returns @a str unchanged. */
    virtual String decorate(const String &str);

    /** @brief Output an error message line.
     * @param str error message line, possibly with annotations
     * @param user_data callback data, 0 for first line in a message
     * @param more true iff more lines follow in the current message
     * @return @a user_data to be passed to emit() for the next line
     *
     * The default implementation does nothing. */
    virtual void *emit(const String &str, void *user_data, bool more);

    /** @brief Account for an error message at level @a level.
     *
     * @a level is the minimum error level of any line in the message, or
     * 1000 if no line had a level. */
    virtual void account(int level);


    /** @brief Return the number of warnings reported so far. */
    virtual int nwarnings() const = 0;
    /** @brief Return the number of errors reported so far. */
    virtual int nerrors() const = 0;
    /** @brief Reset the nwarnings() and nerrors() counts to zero. */
    virtual void reset_counts() = 0;


    /** @brief Create an error annotation.
     *
     * If @a name equals "<>", returns a level annotation "<@a value>".
     * Otherwise returns "{@a name:@a value}", with braces and backslashes
     * in @a value quoted. */
    static String make_anno(const char *name, const String &value);

    /** @brief Apply annotations from @a anno to every line in @a str.
     *
     * New annotations do not override existing annotations with the same
     * names.  If @a anno ends with non-annotation characters, that text is
     * prefixed to every line of @a str. */
    static String combine_anno(const String &str, const String &anno);

    /** @brief Parse error annotations from a string.
     * @param str the string
     * @param begin pointer within @a str to start of annotation area
     * @param end pointer within @a str to end of annotation area
     * @return pointer to first character after annotation area
     *
     * The variable arguments are pairs of annotation names and String
     * pointers, terminated by a null pointer.  Prefix a name with '#' to
     * store the annotation's value as an int instead.
     *
     * @code
     * int level = -1;
     * String where;
     * const char *s = ErrorHandler::parse_anno(line, line.begin(), line.end(),
     *            "#<>", &level, "x", &where, (const char *) 0);
     * @endcode */
    static const char *parse_anno(const String &str,
		const char *begin, const char *end, ...) ERRH_SENTINEL;

  private:

    static ErrorHandler *the_default_handler;
    static ErrorHandler *the_silent_handler;

    static const char *skip_anno(const String &str,
				 const char *begin, const char *end,
				 String *name_result, String *value_result,
				 bool raw);

};


class BaseErrorHandler : public ErrorHandler { public:

    BaseErrorHandler()
	: _nwarnings(0), _nerrors(0) {
    }

    int nwarnings() const {
	return _nwarnings;
    }
    int nerrors() const {
	return _nerrors;
    }
    void reset_counts() {
	_nwarnings = _nerrors = 0;
    }

    void account(int level) {
	if (level <= el_error)
	    ++_nerrors;
	else if (level == el_warning)
	    ++_nwarnings;
    }

  private:

    int _nwarnings;
    int _nerrors;

};

class SilentErrorHandler : public BaseErrorHandler { public:

    SilentErrorHandler() {
    }

};

class FileErrorHandler : public BaseErrorHandler { public:

    FileErrorHandler(FILE *f, const String &context = String());

    void *emit(const String &str, void *user_data, bool more);
    void account(int level);

  private:

    FILE *_f;
    String _context;

};

class ErrorVeneer : public ErrorHandler { public:

    ErrorVeneer(ErrorHandler *errh)	: _errh(errh) { }

    int nwarnings() const;
    int nerrors() const;
    void reset_counts();

    String decorate(const String &str);
    void *emit(const String &str, void *user_data, bool more);
    void account(int level);

  protected:

    ErrorHandler *_errh;

};

class PrefixErrorHandler : public ErrorVeneer { public:

    PrefixErrorHandler(ErrorHandler *errh, const String &prefix);

    String decorate(const String &str);

  private:

    String _prefix;

};

#undef ERRH_SENTINEL
DUPLEX_ENDDECLS
#endif
