/** @file logbuffer.cpp  Buffer of the application's log entries.
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

#include "cal/logbuffer.h"
#include "cal/textstreamlogsink.h"

#include <QMutex>
#include <QMutexLocker>
#include <stdio.h>

namespace cal {

CAL_PIMPL(LogBuffer)
{
    QMutex mutex;
    LogEntry::Level enabledLevel;
    dint maxEntryCount;
    QList<LogEntry *> entries;
    TextStreamLogSink outSink;
    TextStreamLogSink errSink;
    QList<LogSink *> sinks;

    Instance(dint maxEntryCount)
        : mutex(QMutex::Recursive),
          enabledLevel(LogEntry::MESSAGE),
          maxEntryCount(maxEntryCount),
          outSink(new QTextStream(stdout)),
          errSink(new QTextStream(stderr))
    {
        outSink.setMode(LogSink::OnlyNormalEntries);
        errSink.setMode(LogSink::OnlyWarningEntries);
        sinks << &outSink << &errSink;
    }

    ~Instance()
    {
        qDeleteAll(entries);
    }

    void write(LogEntry const &entry)
    {
        foreach(LogSink *sink, sinks)
        {
            if(!sink->willAccept(entry)) continue;
            try
            {
                *sink << entry;
            }
            catch(Error const &er)
            {
                *sink << String("Log entry could not be formatted: " + er.asText());
            }
        }
    }

    void dropOldEntries()
    {
        while(entries.size() > maxEntryCount)
        {
            delete entries.takeFirst();
        }
    }
};

LogBuffer *LogBuffer::_appBuffer = 0;

LogBuffer::LogBuffer(dint maxEntryCount) : d(new Instance(maxEntryCount))
{}

LogBuffer::~LogBuffer()
{
    flush();
    if(_appBuffer == this) _appBuffer = 0;
}

void LogBuffer::enable(LogEntry::Level overLevel)
{
    QMutexLocker lock(&d->mutex);
    d->enabledLevel = overLevel;
}

bool LogBuffer::isEnabled(LogEntry::Level level) const
{
    QMutexLocker lock(&d->mutex);
    return level >= d->enabledLevel;
}

LogEntry::Level LogBuffer::enabledLevel() const
{
    QMutexLocker lock(&d->mutex);
    return d->enabledLevel;
}

void LogBuffer::enableStandardOutput(bool yes)
{
    QMutexLocker lock(&d->mutex);
    d->outSink.setMode(yes? LogSink::OnlyNormalEntries  : LogSink::Disabled);
    d->errSink.setMode(yes? LogSink::OnlyWarningEntries : LogSink::Disabled);
}

void LogBuffer::addSink(LogSink &sink)
{
    QMutexLocker lock(&d->mutex);
    if(!d->sinks.contains(&sink)) d->sinks.append(&sink);
}

void LogBuffer::removeSink(LogSink &sink)
{
    QMutexLocker lock(&d->mutex);
    d->sinks.removeAll(&sink);
}

void LogBuffer::setMaxEntryCount(dint maxEntryCount)
{
    QMutexLocker lock(&d->mutex);
    d->maxEntryCount = qMax(1, maxEntryCount);
    d->dropOldEntries();
}

dint LogBuffer::size() const
{
    QMutexLocker lock(&d->mutex);
    return d->entries.size();
}

void LogBuffer::latestEntries(Entries &entries, int count) const
{
    QMutexLocker lock(&d->mutex);
    entries.clear();
    for(int i = d->entries.size() - 1; i >= 0 && (!count || entries.size() < count); --i)
    {
        entries.append(d->entries.at(i));
    }
}

void LogBuffer::add(LogEntry *entry)
{
    QMutexLocker lock(&d->mutex);
    d->entries.append(entry);
    d->write(*entry);
    flush();
    d->dropOldEntries();
}

void LogBuffer::clear()
{
    QMutexLocker lock(&d->mutex);
    qDeleteAll(d->entries);
    d->entries.clear();
}

void LogBuffer::flush()
{
    QMutexLocker lock(&d->mutex);
    foreach(LogSink *sink, d->sinks)
    {
        sink->flush();
    }
}

void LogBuffer::setAppBuffer(LogBuffer &appBuffer)
{
    _appBuffer = &appBuffer;
}

LogBuffer &LogBuffer::appBuffer()
{
    CAL_ASSERT(_appBuffer != 0);
    return *_appBuffer;
}

bool LogBuffer::appBufferExists()
{
    return _appBuffer != 0;
}

} // namespace cal
