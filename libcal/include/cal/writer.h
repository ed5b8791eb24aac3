/** @file writer.h  Writes values into a byte array.
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

#ifndef LIBCAL_WRITER_H
#define LIBCAL_WRITER_H

#include "libcal.h"
#include "iserializable.h"

#include <QByteArray>
#include <QSysInfo>

namespace cal {

/**
 * Appends values to a byte array in a fixed byte order. Little-endian is the
 * default.
 *
 * @ingroup data
 */
class CAL_PUBLIC Writer
{
public:
    /**
     * @param destination  Bytes are appended to this array.
     * @param byteOrder    Byte order of multi-byte values.
     */
    Writer(QByteArray &destination, QSysInfo::Endian byteOrder = QSysInfo::LittleEndian);

    Writer &operator << (dint8 value);
    Writer &operator << (duint8 value);
    Writer &operator << (dint16 value);
    Writer &operator << (duint16 value);
    Writer &operator << (dint32 value);
    Writer &operator << (duint32 value);
    Writer &operator << (dint64 value);
    Writer &operator << (duint64 value);

    /// Writes a serializable object.
    Writer &operator << (IWritable const &writable);

    QByteArray const &destination() const { return _destination; }

    /// Number of bytes in the destination, i.e., where the next value goes.
    dint offset() const { return _destination.size(); }

    QSysInfo::Endian byteOrder() const { return _byteOrder; }

private:
    template <typename Type>
    Writer &writeNumber(Type value);

    QByteArray &_destination;
    QSysInfo::Endian _byteOrder;
};

} // namespace cal

#endif // LIBCAL_WRITER_H
