/** @file writer.cpp  Writes values into a byte array.
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

#include "cal/writer.h"

#include <QtEndian>

namespace cal {

Writer::Writer(QByteArray &destination, QSysInfo::Endian byteOrder)
    : _destination(destination), _byteOrder(byteOrder)
{}

template <typename Type>
Writer &Writer::writeNumber(Type value)
{
    uchar bytes[sizeof(Type)];
    if(_byteOrder == QSysInfo::BigEndian)
    {
        qToBigEndian<Type>(value, bytes);
    }
    else
    {
        qToLittleEndian<Type>(value, bytes);
    }
    _destination.append(reinterpret_cast<char const *>(bytes), int(sizeof(Type)));
    return *this;
}

Writer &Writer::operator << (dint8 value)
{
    _destination.append(char(value));
    return *this;
}

Writer &Writer::operator << (duint8 value)
{
    _destination.append(char(value));
    return *this;
}

Writer &Writer::operator << (dint16 value)
{
    return writeNumber(value);
}

Writer &Writer::operator << (duint16 value)
{
    return writeNumber(value);
}

Writer &Writer::operator << (dint32 value)
{
    return writeNumber(value);
}

Writer &Writer::operator << (duint32 value)
{
    return writeNumber(value);
}

Writer &Writer::operator << (dint64 value)
{
    return writeNumber(value);
}

Writer &Writer::operator << (duint64 value)
{
    return writeNumber(value);
}

Writer &Writer::operator << (IWritable const &writable)
{
    writable >> *this;
    return *this;
}

} // namespace cal
