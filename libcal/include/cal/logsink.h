/** @file logsink.h  Destination of log entries.
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

#ifndef LIBCAL_LOGSINK_H
#define LIBCAL_LOGSINK_H

#include "log.h"

namespace cal {

/**
 * Destination where LogBuffer sends its entries.
 *
 * @ingroup core
 */
class CAL_PUBLIC LogSink
{
public:
    enum Mode
    {
        Disabled,
        Enabled,
        OnlyNormalEntries,  ///< Entries below WARNING.
        OnlyWarningEntries  ///< WARNING and above.
    };

public:
    LogSink();
    virtual ~LogSink();

    void setMode(Mode mode) { _mode = mode; }
    Mode mode() const { return _mode; }

    /// Determines whether the mode of the sink lets @a entry through.
    virtual bool willAccept(LogEntry const &entry) const;

    virtual LogSink &operator << (LogEntry const &entry) = 0;

    /// Outputs a message that is not an entry, e.g., an error in formatting one.
    virtual LogSink &operator << (String const &plainText) = 0;

    virtual void flush() = 0;

private:
    Mode _mode;
};

} // namespace cal

#endif // LIBCAL_LOGSINK_H
