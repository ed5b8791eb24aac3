/** @file reader.h  Reads values from a byte array.
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

#ifndef LIBCAL_READER_H
#define LIBCAL_READER_H

#include "libcal.h"
#include "iserializable.h"

#include <QByteArray>
#include <QSysInfo>

namespace cal {

/**
 * Reads values written by Writer from a byte array, starting at the
 * beginning of the array.
 *
 * @ingroup data
 */
class CAL_PUBLIC Reader
{
public:
    /// The source ends before the value being read. @ingroup errors
    CAL_SUB_ERROR(IReadable::DeserializationError, OffsetError);

public:
    /**
     * @param source     Bytes to read. Must exist as long as the Reader.
     * @param byteOrder  Byte order the values were written in.
     */
    Reader(QByteArray const &source, QSysInfo::Endian byteOrder = QSysInfo::LittleEndian);

    Reader &operator >> (dint8 &value);
    Reader &operator >> (duint8 &value);
    Reader &operator >> (dint16 &value);
    Reader &operator >> (duint16 &value);
    Reader &operator >> (dint32 &value);
    Reader &operator >> (duint32 &value);
    Reader &operator >> (dint64 &value);
    Reader &operator >> (duint64 &value);

    /// Restores a serializable object.
    Reader &operator >> (IReadable &readable);

    QByteArray const &source() const { return _source; }

    /// Position of the next value to read.
    dint offset() const { return _offset; }

    bool atEnd() const { return _offset >= _source.size(); }

    QSysInfo::Endian byteOrder() const { return _byteOrder; }

private:
    template <typename Type>
    Reader &readNumber(Type &value);

    QByteArray const &_source;
    dint _offset;
    QSysInfo::Endian _byteOrder;
};

} // namespace cal

#endif // LIBCAL_READER_H
