/** @file textstreamlogsink.h  Log sink that writes to a text stream.
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

#ifndef LIBCAL_TEXTSTREAMLOGSINK_H
#define LIBCAL_TEXTSTREAMLOGSINK_H

#include "logsink.h"

#include <QTextStream>
#include <QScopedPointer>

namespace cal {

/**
 * Writes each entry as one line of UTF-8 text. Release builds leave out
 * the timestamp and the level.
 *
 * @ingroup core
 */
class CAL_PUBLIC TextStreamLogSink : public LogSink
{
public:
    /// @param ts  Stream to write to. The sink takes ownership.
    TextStreamLogSink(QTextStream *ts);

    LogSink &operator << (LogEntry const &entry);
    LogSink &operator << (String const &plainText);
    void flush();

private:
    QScopedPointer<QTextStream> _ts;
};

} // namespace cal

#endif // LIBCAL_TEXTSTREAMLOGSINK_H
