/** @file log.h  Per-thread log and log entries.
 *
 * @authors Copyright (c) 2004-2013 Jaakko Keränen <jaakko.keranen@iki.fi>
 * @authors Copyright (c) 2026 The libcal Authors
 *
 * @par License
 * LGPL: http://www.gnu.org/licenses/lgpl.html
 *
 * <small>This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation; either version 3 of the License, or (at your
 * option) any later version. This program is distributed in the hope that it
 * will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty
 * of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Lesser
 * General Public License for more details. You should have received a copy of
 * the GNU Lesser General Public License along with this program; if not, see:
 * http://www.gnu.org/licenses</small>
 */

#ifndef LIBCAL_LOG_H
#define LIBCAL_LOG_H

#include "string.h"

#include <QDateTime>
#include <QFlags>
#include <QList>
#include <QVariant>

/// The log of the current thread.
#define LOG()               cal::Log::threadLog()

/// Names the section of the log entries made in the enclosing scope.
#define LOG_AS(sectionName) cal::Log::Section __logSection(sectionName);

/**
 * Makes a log entry. Arguments for the format string are given with <<:
 * <pre>LOG_MSG("Parsed %s as %s") << text << date.asText();</pre>
 * The entry is added to the log when the statement ends. Nothing is
 * formatted if the level is disabled.
 */
#define LOG_AT_LEVEL(level, str)    cal::LogEntryStager(level, str)

#define LOG_TRACE(str)      LOG_AT_LEVEL(cal::LogEntry::TRACE,    str)
#define LOG_DEBUG(str)      LOG_AT_LEVEL(cal::LogEntry::DEBUG,    str)
#define LOG_VERBOSE(str)    LOG_AT_LEVEL(cal::LogEntry::VERBOSE,  str)
#define LOG_MSG(str)        LOG_AT_LEVEL(cal::LogEntry::MESSAGE,  str)
#define LOG_INFO(str)       LOG_AT_LEVEL(cal::LogEntry::INFO,     str)
#define LOG_WARNING(str)    LOG_AT_LEVEL(cal::LogEntry::WARNING,  str)
#define LOG_ERROR(str)      LOG_AT_LEVEL(cal::LogEntry::ERROR,    str)
#define LOG_CRITICAL(str)   LOG_AT_LEVEL(cal::LogEntry::CRITICAL, str)

namespace cal {

/**
 * Message in the log. The message is kept as a format string and its
 * arguments, and is only composed when the entry is converted to text.
 *
 * @ingroup core
 */
class CAL_PUBLIC LogEntry
{
public:
    enum Level
    {
        TRACE,      ///< Which functions are entered and why they fail.
        DEBUG,      ///< Details of interest when debugging.
        VERBOSE,    ///< Technical details for advanced users.
        MESSAGE,    ///< Normal messages.
        INFO,       ///< Noteworthy messages.
        WARNING,    ///< A problem that was recovered from.
        ERROR,      ///< The operation in progress failed.
        CRITICAL,   ///< The application cannot continue.
        MAX_LOG_LEVELS
    };

    static String levelToText(Level level);

    enum Flag
    {
        Simple      = 0x1,  ///< No timestamp or level.
        OmitSection = 0x2   ///< No section name.
    };
    Q_DECLARE_FLAGS(Flags, Flag)

    /**
     * Argument of an entry: an integer, a floating point number, or text.
     */
    class CAL_PUBLIC Arg : public String::IPatternArg
    {
    public:
        Arg(dint i);
        Arg(duint i);
        Arg(long i);
        Arg(unsigned long i);
        Arg(dint64 i);
        Arg(duint64 i);
        Arg(ddouble d);
        Arg(char const *utf8);
        Arg(QString const &text);

        bool isText() const;

        /// @throws TypeError  The argument is text.
        ddouble asNumber() const;

        String asText() const;

    private:
        QVariant _value;
    };

    typedef QList<Arg> Args;

public:
    LogEntry(Level level, String const &section, int sectionDepth,
             String const &format, Args const &args = Args());

    Level level() const { return _level; }
    QDateTime const &when() const { return _when; }

    /// Names of the sections active when the entry was made, joined with " > ".
    String const &section() const { return _section; }

    int sectionDepth() const { return _sectionDepth; }

    /**
     * Composes the text of the entry: "hh:mm:ss.zzz (lvl) Section: message".
     *
     * @throws String::IllegalPatternError  The format and the arguments
     * do not match.
     */
    String asText(Flags const &flags = 0) const;

private:
    QDateTime _when;
    Level _level;
    String _section;
    int _sectionDepth;
    String _format;
    Args _args;
};

Q_DECLARE_OPERATORS_FOR_FLAGS(LogEntry::Flags)

/**
 * Log of one thread. Keeps the stack of sections that name the entries;
 * the entries themselves go to the application's LogBuffer.
 *
 * @ingroup core
 */
class CAL_PUBLIC Log
{
public:
    /**
     * Section that is active for the lifetime of the object.
     */
    class CAL_PUBLIC Section
    {
        CAL_NO_COPY(Section)

    public:
        /// @param name  Not copied; must stay valid while the section is active.
        Section(char const *name);
        ~Section();

    private:
        Log &_log;
        char const *_name;
    };

public:
    Log();
    ~Log();

    void beginSection(char const *name);
    void endSection(char const *name);

    /// Number of active sections.
    int sectionDepth() const;

    /**
     * Adds an entry to the application's LogBuffer. Nothing is done if there
     * is no buffer or the level is disabled.
     */
    void enter(LogEntry::Level level, String const &format,
               LogEntry::Args const &args = LogEntry::Args());

public:
    /// Returns the log of the current thread, creating it if needed.
    static Log &threadLog();

    /// Determines whether the current thread has a log.
    static bool threadLogExists();

    /// Deletes the log of the current thread. Logs of other threads are
    /// deleted when the threads finish.
    static void disposeThreadLog();

private:
    CAL_PRIVATE(d)
};

/**
 * Collects the arguments of an entry and enters it when destroyed.
 * Used through the LOG_* macros.
 */
class CAL_PUBLIC LogEntryStager
{
public:
    LogEntryStager(LogEntry::Level level, String const &format);
    ~LogEntryStager();

    template <typename ValueType>
    LogEntryStager &operator << (ValueType const &value) {
        if(!_disabled) _args.append(LogEntry::Arg(value));
        return *this;
    }

private:
    bool _disabled;
    LogEntry::Level _level;
    String _format;
    LogEntry::Args _args;
};

} // namespace cal

#endif // LIBCAL_LOG_H
