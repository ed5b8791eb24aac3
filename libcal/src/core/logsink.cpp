/** @file logsink.cpp  Destination of log entries.
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

#include "cal/logsink.h"

namespace cal {

LogSink::LogSink() : _mode(Enabled)
{}

LogSink::~LogSink()
{}

bool LogSink::willAccept(LogEntry const &entry) const
{
    if(_mode == OnlyNormalEntries)  return entry.level() <  LogEntry::WARNING;
    if(_mode == OnlyWarningEntries) return entry.level() >= LogEntry::WARNING;
    return _mode == Enabled;
}

} // namespace cal
