/** @file log.cpp  Per-thread log and log entries.
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

#include "cal/log.h"
#include "cal/logbuffer.h"

#include <QStringList>
#include <QThreadStorage>

namespace cal {

/// Each thread's log is deleted by Qt when the thread finishes.
Q_GLOBAL_STATIC(QThreadStorage<Log *>, threadLogs)

/// Level indicators in the entry text, padded to this width.
static int const LEVEL_WIDTH = 5;

static char const *levelIndicator(LogEntry::Level level)
{
    switch(level)
    {
    case LogEntry::TRACE:    return "(...)";
    case LogEntry::DEBUG:    return "(vv)";
    case LogEntry::VERBOSE:  return "(v)";
    case LogEntry::INFO:     return "(i)";
    case LogEntry::WARNING:  return "(WRN)";
    case LogEntry::ERROR:    return "(ERR)";
    case LogEntry::CRITICAL: return "(!!!)";
    default:                 return "";
    }
}

static bool appBufferAccepts(LogEntry::Level level)
{
    return LogBuffer::appBufferExists() && LogBuffer::appBuffer().isEnabled(level);
}

String LogEntry::levelToText(Level level)
{
    switch(level)
    {
    case TRACE:    return "TRACE";
    case DEBUG:    return "DEBUG";
    case VERBOSE:  return "VERBOSE";
    case MESSAGE:  return "MESSAGE";
    case INFO:     return "INFO";
    case WARNING:  return "WARNING";
    case ERROR:    return "ERROR";
    case CRITICAL: return "CRITICAL";
    default:       return "";
    }
}

LogEntry::Arg::Arg(dint i) : _value(qlonglong(i)) {}
LogEntry::Arg::Arg(duint i) : _value(qlonglong(i)) {}
LogEntry::Arg::Arg(long i) : _value(qlonglong(i)) {}
LogEntry::Arg::Arg(unsigned long i) : _value(qulonglong(i)) {}
LogEntry::Arg::Arg(dint64 i) : _value(qlonglong(i)) {}
LogEntry::Arg::Arg(duint64 i) : _value(qulonglong(i)) {}
LogEntry::Arg::Arg(ddouble d) : _value(d) {}
LogEntry::Arg::Arg(char const *utf8) : _value(QString::fromUtf8(utf8)) {}
LogEntry::Arg::Arg(QString const &text) : _value(text) {}

bool LogEntry::Arg::isText() const
{
    return _value.type() == QVariant::String;
}

ddouble LogEntry::Arg::asNumber() const
{
    if(isText())
    {
        /// @throw TypeError Text is not converted to a number.
        throw TypeError("LogEntry::Arg::asNumber",
                        "Text argument \"" + _value.toString() + "\" is not a number");
    }
    return _value.toDouble();
}

String LogEntry::Arg::asText() const
{
    return _value.toString();
}

LogEntry::LogEntry(Level level, String const &section, int sectionDepth,
                   String const &format, Args const &args)
    : _when(QDateTime::currentDateTime()),
      _level(level),
      _section(section),
      _sectionDepth(sectionDepth),
      _format(format),
      _args(args)
{}

String LogEntry::asText(Flags const &flags) const
{
    QString text;

    if(!flags.testFlag(Simple))
    {
        text += _when.toString("hh:mm:ss.zzz");
        text += ' ';
        text += QString(levelIndicator(_level)).rightJustified(LEVEL_WIDTH);
        text += ' ';
    }

    if(!flags.testFlag(OmitSection) && !_section.isEmpty())
    {
        text += _section;
        text += ": ";
    }

    if(_args.isEmpty())
    {
        // Without arguments the format is used as is.
        text += _format;
    }
    else
    {
        String::PatternArgs patternArgs;
        for(int i = 0; i < _args.size(); ++i)
        {
            patternArgs << &_args.at(i);
        }
        text += _format % patternArgs;
    }
    return text;
}

Log::Section::Section(char const *name) : _log(threadLog()), _name(name)
{
    _log.beginSection(_name);
}

Log::Section::~Section()
{
    _log.endSection(_name);
}

CAL_PIMPL(Log)
{
    QList<char const *> sections;
};

Log::Log() : d(new Instance)
{}

Log::~Log()
{}

void Log::beginSection(char const *name)
{
    d->sections.append(name);
}

void Log::endSection(char const *name)
{
    CAL_ASSERT(!d->sections.isEmpty() && d->sections.last() == name);
    Q_UNUSED(name);
    d->sections.removeLast();
}

int Log::sectionDepth() const
{
    return d->sections.size();
}

void Log::enter(LogEntry::Level level, String const &format, LogEntry::Args const &args)
{
    if(!appBufferAccepts(level)) return;

    // A section entered again by a recursive call is named only once.
    QStringList names;
    char const *previous = 0;
    foreach(char const *name, d->sections)
    {
        if(previous && !qstrcmp(previous, name)) continue;
        names << QString::fromUtf8(name);
        previous = name;
    }

    LogBuffer::appBuffer().add(new LogEntry(level, names.join(" > "), names.size(), format, args));
}

Log &Log::threadLog()
{
    QThreadStorage<Log *> *logs = threadLogs();
    CAL_ASSERT(logs != 0);
    if(!logs->hasLocalData())
    {
        logs->setLocalData(new Log);
    }
    return *logs->localData();
}

bool Log::threadLogExists()
{
    QThreadStorage<Log *> *logs = threadLogs();
    return logs && logs->hasLocalData();
}

void Log::disposeThreadLog()
{
    QThreadStorage<Log *> *logs = threadLogs();
    if(logs && logs->hasLocalData())
    {
        // The previous log is deleted.
        logs->setLocalData(0);
    }
}

LogEntryStager::LogEntryStager(LogEntry::Level level, String const &format)
    : _disabled(!appBufferAccepts(level)), _level(level)
{
    if(!_disabled) _format = format;
}

LogEntryStager::~LogEntryStager()
{
    if(!_disabled)
    {
        LOG().enter(_level, _format, _args);
    }
}

} // namespace cal
