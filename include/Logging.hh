/** \file
 *
 * \brief Logging utilities
 */

#ifndef BLACKJACK_LOGGING_HH_
#define BLACKJACK_LOGGING_HH_

#include <algorithm>
#include <iterator>
#include <memory>
#include <ostream>

namespace Blackjack {

/** \brief Log level
 *
 * \sa setupLogging(), log()
 */
enum class LogLevel {
    NONE,     ///< No logging
    FATAL,    ///< Unrecoverable error situations
    ERROR,    ///< Recoverable error situations
    WARNING,  ///< Unexpected concerning events
    INFO,     ///< Other events of importance
    DEBUG     ///< Verbose debugging logging
};

/// \cond DOXYGEN_IGNORE

namespace Impl {

bool startEntry(LogLevel level);
std::ostream& logStream();

template<typename FormatIterator>
void logFormat(FormatIterator first, FormatIterator last)
{
    if (first != last) {
        logStream().write(std::addressof(*first), last - first);
    }
}

template<typename FormatIterator, typename First, typename... Rest>
void logFormat(
    FormatIterator first, FormatIterator last, const First& arg,
    const Rest&... rest)
{
    const auto iter = std::find(first, last, '%');
    if (iter == last || std::next(iter) == last) {
        logFormat(first, iter);
        return;
    }
    logFormat(first, iter);
    logStream() << arg;
    logFormat(std::next(iter, 2), last, rest...);
}

}

/// \endcond

/** \brief Logging utility
 *
 * Log message if \p level is at least the minimum logging level set by
 * setupLogging().
 *
 * The \p format string resembles the C formatting string, but the type
 * specified by each specifier is ignored. Each \% sign and the character
 * following it is replaced by the next value of \p ts streamed as is. Values
 * with no matching specifier are not logged.
 *
 * \note This utility is not thread safe.
 *
 * \param level the logging level
 * \param format the formatting string
 * \param ts the values streamed to the placeholders in \p format
 */
template<typename String, typename... Ts>
void log(LogLevel level, const String& format, const Ts&... ts)
{
    if (Impl::startEntry(level)) {
        const auto first = std::begin(format);
        // String literals include the terminating null character
        auto last = std::find(first, std::end(format), '\0');
        Impl::logFormat(first, last, ts...);
        Impl::logStream() << '\n';
    }
}

/** \brief Map verbosity to logging level
 *
 * \param verbosity the number of times -v flag is given
 *
 * \return LogLevel corresponding the verbosity (0 warning, 1 info, >=2 debug)
 */
LogLevel getLogLevel(int verbosity);

/** \brief Setup logging utility
 *
 * This function sets up the (global) minimum logging level and the stream to
 * which the log is output.
 *
 * If this method is not called, the default logging level is LogLevel::WARNING
 * and the default stream is std::cerr. If the logging level is set to
 * LogLevel::NONE, no logs are produced.
 *
 * \param level the minimum logging level that causes log to be output
 * \param stream the output stream to which the logs are output
 */
void setupLogging(LogLevel level, std::ostream& stream);

}

#endif // BLACKJACK_LOGGING_HH_
