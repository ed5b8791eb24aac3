/** @file memorylogsink.h  Log sink that keeps entries in memory.
 *
 * @authors Copyright (c) 2013 Jaakko Keränen <jaakko.keranen@iki.fi>
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

#ifndef LIBCAL_MEMORYLOGSINK_H
#define LIBCAL_MEMORYLOGSINK_H

#include "logsink.h"

#include <QList>
#include <QMutex>

namespace cal {

/**
 * Keeps copies of the entries it receives. Entries are not formatted until
 * they are asked for.
 *
 * @ingroup core
 */
class CAL_PUBLIC MemoryLogSink : public LogSink
{
public:
    MemoryLogSink();

    LogSink &operator << (LogEntry const &entry);
    LogSink &operator << (String const &plainText);
    void flush() {}

    int entryCount() const;
    LogEntry const &entry(int index) const;

    /// Text of an entry without the timestamp and level.
    String entryText(int index) const;

    void clear();

private:
    mutable QMutex _mutex;
    QList<LogEntry> _entries;
};

} // namespace cal

#endif // LIBCAL_MEMORYLOGSINK_H
