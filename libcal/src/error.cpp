/** @file error.cpp  Base class for the exceptions of libcal.
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

#include "cal/error.h"

namespace cal {

static std::string composeWhat(QString const &where, QString const &message)
{
    return QString("(%1) %2").arg(where).arg(message).toUtf8().toStdString();
}

Error::Error(QString const &where, QString const &message)
    : std::runtime_error(composeWhat(where, message))
{}

Error::~Error() throw()
{}

QString Error::name() const
{
    return _name.empty()? QString("Error") : QString::fromStdString(_name);
}

QString Error::asText() const
{
    return QString("[%1] %2").arg(name()).arg(QString::fromUtf8(what()));
}

void Error::appendName(char const *name)
{
    if(!_name.empty()) _name += '_';
    _name += name;
}

} // namespace cal
