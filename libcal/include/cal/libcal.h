/** @file libcal.h  Common definitions for libcal.
 *
 * @authors Copyright (c) 2011-2013 Jaakko Keränen <jaakko.keranen@iki.fi>
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

#ifndef LIBCAL_H
#define LIBCAL_H

/**
 * @defgroup core  Core
 * Logging and command line arguments.
 *
 * @defgroup data  Data
 * The calendar date and its binary serialization.
 */

/**
 * @mainpage libcal API
 *
 * libcal provides cal::Date, a calendar date in the proleptic Gregorian
 * calendar. Errors are reported with exceptions derived from cal::Error and
 * diagnostics go to the log (see cal::Log and cal::LogBuffer).
 */

#include <QtCore/qglobal.h>
#include <QScopedPointer>

#if (QT_VERSION < QT_VERSION_CHECK(5, 0, 0))
#  error "libcal requires Qt 5"
#endif

/*
 * CAL_PUBLIC marks the classes and functions exported from the library.
 */
#if defined(_WIN32) && defined(_MSC_VER)
#  ifdef __LIBCAL__
#    define CAL_PUBLIC __declspec(dllexport)
#  else
#    define CAL_PUBLIC __declspec(dllimport)
#  endif
#else
#  define CAL_PUBLIC
#endif

#ifndef NDEBUG
#  define CAL_DEBUG
#  define CAL_ASSERT(x) Q_ASSERT(x)
#else
#  define CAL_ASSERT(x)
#endif

/**
 * Starts the definition of the private implementation of a class. The
 * owning class declares it with CAL_PRIVATE and must define its destructor
 * in the source file, where the Instance type is complete.
 *
 * <pre>
 *    CAL_PIMPL(LogBuffer)
 *    {
 *        int maxEntryCount;
 *        Instance() : maxEntryCount(1000) {}
 *    };
 * </pre>
 */
#define CAL_PIMPL(ClassName) \
    struct ClassName::Instance

/**
 * Declares the owning pointer to the private implementation.
 */
#define CAL_PRIVATE(Var) \
    struct Instance; \
    QScopedPointer<Instance> Var;

#define CAL_NO_COPY(ClassName) \
    private: ClassName(ClassName const &); \
    ClassName &operator = (ClassName const &);

namespace cal {

//@{
/// Fixed-size integer types used in the serialized forms.
typedef qint8   dint8;
typedef quint8  duint8;
typedef qint16  dint16;
typedef quint16 duint16;
typedef qint32  dint32;
typedef quint32 duint32;
typedef qint64  dint64;
typedef quint64 duint64;
typedef dint32  dint;
typedef duint32 duint;
typedef double  ddouble;
//@}

} // namespace cal

#include "error.h"

#endif // LIBCAL_H
