/** @file commandline.h  Command line arguments of an application.
 *
 * @authors Copyright (c) 2009-2013 Jaakko Keränen <jaakko.keranen@iki.fi>
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

#ifndef LIBCAL_COMMANDLINE_H
#define LIBCAL_COMMANDLINE_H

#include "string.h"

#include <QStringList>

namespace cal {

/**
 * Arguments given to an application at launch. The first argument is the
 * name of the program. Arguments beginning with a hyphen are options, except
 * negative numbers: in "-days -5" the "-5" is a parameter of "-days".
 *
 * Option names are matched without regard to case, and an option may have
 * aliases (e.g., "-v" for "-verbose").
 *
 * @ingroup core
 */
class CAL_PUBLIC CommandLine
{
public:
    /// There is no argument at the given position. @ingroup errors
    CAL_ERROR(OutOfRangeError);

public:
    CommandLine(int argc, char **argv);
    CommandLine(QStringList const &args);
    ~CommandLine();

    /// Number of arguments, including the program name.
    dint count() const;

    /// @throws OutOfRangeError  @a pos is not a valid position.
    String at(dint pos) const;

    /// @throws OutOfRangeError  @a pos is not a valid position.
    bool isOption(dint pos) const;

    static bool isOption(String const &arg);

    /**
     * Finds an option and checks that it is followed by parameters.
     *
     * @param arg        Option name or one of its aliases.
     * @param numParams  Number of parameters that must follow the option.
     *
     * @return Position of the option, or 0 if it is missing or has too few
     * parameters.
     */
    dint check(String const &arg, dint numParams = 0) const;

    /**
     * Gets the parameter that follows an option.
     *
     * @return @c true, if @a param was set.
     */
    bool getParameter(String const &arg, String &param) const;

    /// Number of times the option appears.
    dint has(String const &arg) const;

    void alias(String const &full, String const &alias);

    /// Determines whether @a fullOrAlias is @a full or one of its aliases.
    bool matches(String const &full, String const &fullOrAlias) const;

private:
    CAL_PRIVATE(d)
};

} // namespace cal

#endif // LIBCAL_COMMANDLINE_H
