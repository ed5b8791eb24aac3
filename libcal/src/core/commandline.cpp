/** @file commandline.cpp  Command line arguments of an application.
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

#include "cal/commandline.h"

#include <QMap>

namespace cal {

CAL_PIMPL(CommandLine)
{
    QStringList arguments;

    /// Aliases of each option, keyed by the lowercase option name.
    QMap<QString, QStringList> aliases;

    void checkPosition(char const *where, dint pos) const
    {
        if(pos < 0 || pos >= arguments.size())
        {
            /// @throw OutOfRangeError @a pos is not a valid position.
            throw OutOfRangeError(where, QString("Position %1 is out of range (%2 arguments)")
                                  .arg(pos).arg(arguments.size()));
        }
    }
};

CommandLine::CommandLine(int argc, char **argv) : d(new Instance)
{
    for(int i = 0; i < argc; ++i)
    {
        d->arguments << QString::fromLocal8Bit(argv[i]);
    }
}

CommandLine::CommandLine(QStringList const &args) : d(new Instance)
{
    d->arguments = args;
}

CommandLine::~CommandLine()
{}

dint CommandLine::count() const
{
    return d->arguments.size();
}

String CommandLine::at(dint pos) const
{
    d->checkPosition("CommandLine::at", pos);
    return d->arguments.at(pos);
}

bool CommandLine::isOption(dint pos) const
{
    d->checkPosition("CommandLine::isOption", pos);
    return isOption(String(d->arguments.at(pos)));
}

bool CommandLine::isOption(String const &arg)
{
    if(!arg.startsWith('-')) return false;

    bool isNumber = false;
    arg.toDouble(&isNumber);
    return !isNumber;
}

dint CommandLine::check(String const &arg, dint numParams) const
{
    // The program name is not an option.
    for(int i = 1; i < d->arguments.size(); ++i)
    {
        if(!matches(arg, d->arguments.at(i))) continue;

        for(int k = 1; k <= numParams; ++k)
        {
            if(i + k >= d->arguments.size() || isOption(String(d->arguments.at(i + k))))
            {
                return 0;
            }
        }
        return i;
    }
    return 0;
}

bool CommandLine::getParameter(String const &arg, String &param) const
{
    dint const pos = check(arg, 1);
    if(!pos) return false;

    param = d->arguments.at(pos + 1);
    return true;
}

dint CommandLine::has(String const &arg) const
{
    dint found = 0;
    for(int i = 1; i < d->arguments.size(); ++i)
    {
        if(matches(arg, d->arguments.at(i))) found++;
    }
    return found;
}

void CommandLine::alias(String const &full, String const &alias)
{
    d->aliases[full.toLower()] << alias;
}

bool CommandLine::matches(String const &full, String const &fullOrAlias) const
{
    if(!full.compareWithoutCase(fullOrAlias)) return true;

    return d->aliases.value(full.toLower()).contains(fullOrAlias, Qt::CaseInsensitive);
}

} // namespace cal
