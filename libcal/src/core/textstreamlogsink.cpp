/** @file textstreamlogsink.cpp  Log sink that writes to a text stream.
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

#include "cal/textstreamlogsink.h"

namespace cal {

TextStreamLogSink::TextStreamLogSink(QTextStream *ts) : _ts(ts)
{
    _ts->setCodec("UTF-8");
}

LogSink &TextStreamLogSink::operator << (LogEntry const &entry)
{
    LogEntry::Flags flags;
#ifndef CAL_DEBUG
    flags |= LogEntry::Simple;
#endif
    // Compose first so a formatting error leaves no partial line.
    String const text = entry.asText(flags);
    *_ts << text << "\n";
    return *this;
}

LogSink &TextStreamLogSink::operator << (String const &plainText)
{
    *_ts << plainText << "\n";
    return *this;
}

void TextStreamLogSink::flush()
{
    _ts->flush();
}

} // namespace cal
