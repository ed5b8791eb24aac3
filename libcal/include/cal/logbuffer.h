/** @file logbuffer.h  Buffer of the application's log entries.
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

#ifndef LIBCAL_LOGBUFFER_H
#define LIBCAL_LOGBUFFER_H

#include "log.h"

#include <QList>

namespace cal {

class LogSink;

/**
 * Receives the entries of all threads' logs and sends them to sinks. By
 * default, entries below WARNING are written to standard output and the rest
 * to standard error. The most recent entries are kept in memory.
 *
 * The application installs its buffer with setAppBuffer(). Until then, and
 * for levels the buffer has not enabled, entries are discarded.
 *
 * @ingroup core
 */
class CAL_PUBLIC LogBuffer
{
public:
    typedef QList<LogEntry const *> Entries;

public:
    /// @param maxEntryCount  Number of entries kept in memory.
    LogBuffer(dint maxEntryCount = 1000);
    ~LogBuffer();

    /// Enables the entries of @a overLevel and above. MESSAGE is the default.
    void enable(LogEntry::Level overLevel = LogEntry::MESSAGE);

    bool isEnabled(LogEntry::Level level) const;
    LogEntry::Level enabledLevel() const;

    /// Enables or disables the standard output and standard error sinks.
    void enableStandardOutput(bool yes = true);

    void addSink(LogSink &sink);
    void removeSink(LogSink &sink);

    void setMaxEntryCount(dint maxEntryCount);

    /// Number of entries kept in memory.
    dint size() const;

    /**
     * Collects the latest entries, newest first.
     *
     * @param entries  Receives the entries. Valid until the buffer drops them.
     * @param count    Maximum number of entries; 0 for all.
     */
    void latestEntries(Entries &entries, int count = 0) const;

    /**
     * Adds an entry and writes it to the sinks that accept it. The buffer
     * takes ownership of @a entry.
     */
    void add(LogEntry *entry);

    void clear();

    /// Flushes all sinks.
    void flush();

public:
    static void setAppBuffer(LogBuffer &appBuffer);
    static LogBuffer &appBuffer();
    static bool appBufferExists();

private:
    CAL_PRIVATE(d)

    static LogBuffer *_appBuffer;
};

} // namespace cal

#endif // LIBCAL_LOGBUFFER_H
