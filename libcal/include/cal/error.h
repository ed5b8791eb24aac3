/** @file error.h  Base class for the exceptions of libcal.
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

#ifndef LIBCAL_ERROR_H
#define LIBCAL_ERROR_H

#include "libcal.h"

#include <QString>
#include <stdexcept>
#include <string>

namespace cal {

/**
 * Exception thrown when an operation of libcal cannot be completed.
 *
 * Error classes form a hierarchy declared with CAL_ERROR and CAL_SUB_ERROR,
 * so a caller may catch a whole group of errors or only a specific one.
 * what() returns "(where) message".
 */
class CAL_PUBLIC Error : public std::runtime_error
{
public:
    /**
     * @param where    Function where the error occurred.
     * @param message  Description of the problem.
     */
    Error(QString const &where, QString const &message);
    ~Error() throw();

    /**
     * Name of the error class. Sub-errors are joined to their parents with
     * underscores, e.g., "InvalidDateError_OutOfRangeError".
     */
    QString name() const;

    /// Returns the error as "[Name] (where) message".
    QString asText() const;

protected:
    void appendName(char const *name);

private:
    std::string _name;
};

} // namespace cal

/**
 * Declares the error class @a Name that is derived from @a Parent.
 * Must be followed by a semicolon.
 */
#define CAL_SUB_ERROR(Parent, Name) \
    class Name : public Parent { \
    public: \
        Name(QString const &where, QString const &message) \
            : Parent(where, message) { Parent::appendName(#Name); } \
    }

/// Declares the top-level error class @a Name. Must be followed by a semicolon.
#define CAL_ERROR(Name) CAL_SUB_ERROR(cal::Error, Name)

#endif // LIBCAL_ERROR_H
