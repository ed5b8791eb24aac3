/** @file iserializable.h  Interfaces for objects that can be serialized.
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

#ifndef LIBCAL_ISERIALIZABLE_H
#define LIBCAL_ISERIALIZABLE_H

#include "libcal.h"

namespace cal {

class Writer;
class Reader;

/**
 * Object that can be written with a Writer.
 *
 * @ingroup data
 */
class CAL_PUBLIC IWritable
{
public:
    virtual ~IWritable() {}

    /// Writes the object to @a to.
    virtual void operator >> (Writer &to) const = 0;
};

/**
 * Object that can be restored with a Reader.
 *
 * @ingroup data
 */
class CAL_PUBLIC IReadable
{
public:
    /// The serialized data does not describe a valid object. @ingroup errors
    CAL_ERROR(DeserializationError);

public:
    virtual ~IReadable() {}

    /**
     * Restores the object from @a from. If an error is thrown, the object
     * keeps its previous state.
     */
    virtual void operator << (Reader &from) = 0;
};

/**
 * Object that can be both written and restored.
 *
 * @ingroup data
 */
class CAL_PUBLIC ISerializable : public IWritable, public IReadable
{};

} // namespace cal

#endif // LIBCAL_ISERIALIZABLE_H
