/** @file reader.cpp  Reads values from a byte array.
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

#include "cal/reader.h"

#include <QtEndian>

namespace cal {

Reader::Reader(QByteArray const &source, QSysInfo::Endian byteOrder)
    : _source(source), _offset(0), _byteOrder(byteOrder)
{}

template <typename Type>
Reader &Reader::readNumber(Type &value)
{
    if(_offset + dint(sizeof(Type)) > _source.size())
    {
        /// @throw OffsetError The value does not fit in the remaining bytes.
        throw OffsetError("Reader::operator >>",
                          QString("Reading %1 bytes at offset %2 goes past the end (%3 bytes)")
                          .arg(sizeof(Type)).arg(_offset).arg(_source.size()));
    }
    uchar const *bytes = reinterpret_cast<uchar const *>(_source.constData()) + _offset;
    if(_byteOrder == QSysInfo::BigEndian)
    {
        value = qFromBigEndian<Type>(bytes);
    }
    else
    {
        value = qFromLittleEndian<Type>(bytes);
    }
    _offset += dint(sizeof(Type));
    return *this;
}

Reader &Reader::operator >> (dint8 &value)
{
    duint8 byte = 0;
    *this >> byte;
    value = dint8(byte);
    return *this;
}

Reader &Reader::operator >> (duint8 &value)
{
    if(atEnd())
    {
        /// @throw OffsetError There are no bytes left.
        throw OffsetError("Reader::operator >>",
                          QString("Reading a byte at offset %1 goes past the end").arg(_offset));
    }
    value = duint8(_source.at(_offset++));
    return *this;
}

Reader &Reader::operator >> (dint16 &value)
{
    return readNumber(value);
}

Reader &Reader::operator >> (duint16 &value)
{
    return readNumber(value);
}

Reader &Reader::operator >> (dint32 &value)
{
    return readNumber(value);
}

Reader &Reader::operator >> (duint32 &value)
{
    return readNumber(value);
}

Reader &Reader::operator >> (dint64 &value)
{
    return readNumber(value);
}

Reader &Reader::operator >> (duint64 &value)
{
    return readNumber(value);
}

Reader &Reader::operator >> (IReadable &readable)
{
    readable << *this;
    return *this;
}

} // namespace cal
