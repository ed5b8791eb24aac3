/** @file string.h  Text string with pattern formatting.
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

#ifndef LIBCAL_STRING_H
#define LIBCAL_STRING_H

#include "libcal.h"

#include <QString>
#include <QList>

namespace cal {

/**
 * QString with printf-like pattern formatting for the log.
 *
 * @ingroup core
 */
class CAL_PUBLIC String : public QString
{
public:
    /// The pattern has an unknown directive or too few arguments. @ingroup errors
    CAL_ERROR(IllegalPatternError);

    /**
     * Value that can be substituted into a pattern.
     */
    class IPatternArg
    {
    public:
        /// The value cannot be represented as the requested type. @ingroup errors
        CAL_ERROR(TypeError);

    public:
        virtual ~IPatternArg() {}

        virtual String asText() const = 0;
        virtual ddouble asNumber() const = 0;
    };

    typedef QList<IPatternArg const *> PatternArgs;

public:
    String();
    String(QString const &text);
    String(char const *nullTerminatedUtf8);

    /**
     * Compares two strings ignoring case.
     *
     * @return 0, if the strings are equal; negative, if this string sorts
     * before @a other; positive, if after.
     */
    dint compareWithoutCase(String const &other) const;

    /**
     * Substitutes @a args into the directives of the string. A directive is
     * written as <tt>%[-][min][.max]type</tt>, where @c type is one of:
     * - @c s  text
     * - @c i, @c d  signed integer
     * - @c u  unsigned integer
     *
     * @c - aligns the value to the left within @c min characters (the
     * default is right alignment), and @c .max cuts text longer than @c max
     * characters. "%%" is a literal percent sign. Arguments without a
     * directive are appended to the end, separated by spaces.
     */
    String operator % (PatternArgs const &args) const;
};

} // namespace cal

#endif // LIBCAL_STRING_H
