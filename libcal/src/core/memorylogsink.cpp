/** @file memorylogsink.cpp  Log sink that keeps entries in memory.
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

#include "cal/memorylogsink.h"

#include <QMutexLocker>

namespace cal {

MemoryLogSink::MemoryLogSink()
{}

LogSink &MemoryLogSink::operator << (LogEntry const &entry)
{
    QMutexLocker lock(&_mutex);
    _entries.append(entry);
    return *this;
}

LogSink &MemoryLogSink::operator << (String const &)
{
    return *this;
}

int MemoryLogSink::entryCount() const
{
    QMutexLocker lock(&_mutex);
    return _entries.size();
}

LogEntry const &MemoryLogSink::entry(int index) const
{
    QMutexLocker lock(&_mutex);
    return _entries.at(index);
}

String MemoryLogSink::entryText(int index) const
{
    return entry(index).asText(LogEntry::Simple);
}

void MemoryLogSink::clear()
{
    QMutexLocker lock(&_mutex);
    _entries.clear();
}

} // namespace cal
