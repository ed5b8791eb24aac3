/** @file string.cpp  Text string with pattern formatting.
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

#include "cal/string.h"

namespace cal {

static int readWidth(String const &pattern, int &pos)
{
    int width = 0;
    while(pos < pattern.size() && pattern.at(pos).unicode() >= '0' && pattern.at(pos).unicode() <= '9')
    {
        width = width * 10 + (pattern.at(pos).unicode() - '0');
        ++pos;
    }
    return width;
}

/**
 * Formats one argument. @a pos points to the first character after the '%'
 * and is moved past the directive.
 */
static QString formatArg(String const &pattern, int &pos, String::IPatternArg const &arg)
{
    bool leftAlign = false;
    if(pos < pattern.size() && pattern.at(pos) == '-')
    {
        leftAlign = true;
        ++pos;
    }
    int const minWidth = readWidth(pattern, pos);
    int maxWidth = 0;
    if(pos < pattern.size() && pattern.at(pos) == '.')
    {
        ++pos;
        maxWidth = readWidth(pattern, pos);
    }
    if(pos >= pattern.size())
    {
        throw String::IllegalPatternError("String::operator %",
                                          "Directive at the end of \"" + pattern + "\" is incomplete");
    }

    QChar const type = pattern.at(pos++);
    QString text;
    switch(type.toLatin1())
    {
    case 's':
        text = arg.asText();
        break;

    case 'i':
    case 'd':
        text = QString::number(dint64(arg.asNumber()));
        break;

    case 'u':
        text = QString::number(duint64(arg.asNumber()));
        break;

    default:
        throw String::IllegalPatternError("String::operator %",
                                          QString("Unknown directive '%%1' in \"%2\"")
                                          .arg(type).arg(pattern));
    }

    if(maxWidth > 0 && text.size() > maxWidth)
    {
        text = (leftAlign? text.left(maxWidth) : text.right(maxWidth));
    }
    if(text.size() < minWidth)
    {
        text = (leftAlign? text.leftJustified(minWidth) : text.rightJustified(minWidth));
    }
    return text;
}

String::String()
{}

String::String(QString const &text) : QString(text)
{}

String::String(char const *nullTerminatedUtf8) : QString(QString::fromUtf8(nullTerminatedUtf8))
{}

dint String::compareWithoutCase(String const &other) const
{
    return compare(other, Qt::CaseInsensitive);
}

String String::operator % (PatternArgs const &args) const
{
    QString result;
    PatternArgs::const_iterator arg = args.begin();

    int pos = 0;
    while(pos < size())
    {
        int const mark = indexOf('%', pos);
        if(mark < 0)
        {
            result += mid(pos);
            break;
        }
        result += mid(pos, mark - pos);
        pos = mark + 1;

        if(pos < size() && at(pos) == '%')
        {
            result += '%';
            ++pos;
            continue;
        }
        if(arg == args.end())
        {
            throw IllegalPatternError("String::operator %",
                                      "Not enough arguments for \"" + *this + "\"");
        }
        result += formatArg(*this, pos, **arg);
        ++arg;
    }

    // Leftover arguments.
    for(; arg != args.end(); ++arg)
    {
        result += ' ';
        result += (*arg)->asText();
    }
    return result;
}

} // namespace cal
