/** @file main.cpp  Command line tool for calendar dates.
 *
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

#include <cal/date.h>
#include <cal/commandline.h>
#include <cal/logbuffer.h>
#include <cal/log.h>

#include <QList>
#include <QStringList>
#include <QTextStream>
#include <algorithm>
#include <stdio.h>

using namespace cal;

static int const EXIT_INVALID_INPUT = 1;
static int const EXIT_USAGE         = 2;

static void printUsage()
{
    QTextStream err(stderr);
    err << "Usage: caldate [-verbose|-v] [-quiet|-q] <command> [arguments]\n"
           "  today                       Print today's date.\n"
           "  info <YYYY-MM-DD>           Print the date, weekday and day of year.\n"
           "  add <YYYY-MM-DD> [-days N] [-months N] [-years N]\n"
           "                              Apply the offsets in the order years, months,\n"
           "                              days and print the result.\n"
           "  sort <YYYY-MM-DD>...        Print the dates in chronological order.\n";
}

/// Options that take a parameter.
static bool isOffsetOption(CommandLine const &args, String const &arg)
{
    return args.matches("-days", arg) || args.matches("-months", arg) || args.matches("-years", arg);
}

/**
 * Collects the arguments that are not options or option parameters.
 */
static QStringList positionalArguments(CommandLine const &args)
{
    QStringList result;
    for(int i = 1; i < args.count(); ++i)
    {
        if(args.isOption(i))
        {
            if(isOffsetOption(args, args.at(i))) ++i; // Skip the parameter.
            continue;
        }
        result << args.at(i);
    }
    return result;
}

static bool parseDate(String const &text, Date &date)
{
    if(!Date::tryParse(text, date))
    {
        LOG_ERROR("\"%s\" is not a valid date (expected YYYY-MM-DD)") << text;
        return false;
    }
    return true;
}

/**
 * Reads the integer parameter of an offset option.
 *
 * @return Exit code: zero if the offset was read or is absent.
 */
static int offsetOption(CommandLine const &args, String const &option, dint &offset)
{
    offset = 0;
    if(!args.has(option)) return 0;

    String param;
    if(!args.getParameter(option, param))
    {
        LOG_ERROR("Option %s requires a number") << option;
        return EXIT_USAGE;
    }
    bool ok = false;
    offset = param.toInt(&ok);
    if(!ok)
    {
        LOG_ERROR("\"%s\" is not a valid number for %s") << param << option;
        return EXIT_INVALID_INPUT;
    }
    return 0;
}

static int commandInfo(QTextStream &out, QStringList const &params)
{
    if(params.size() != 1)
    {
        printUsage();
        return EXIT_USAGE;
    }
    Date date;
    if(!parseDate(params.first(), date)) return EXIT_INVALID_INPUT;

    out << date << " " << Date::dayOfWeekName(date.dayOfWeek())
        << " (day " << date.dayOfYear() << " of "
        << (Date::isLeapYear(date.year())? 366 : 365) << ")\n";
    return 0;
}

static int commandAdd(QTextStream &out, CommandLine const &args, QStringList const &params)
{
    if(params.size() != 1)
    {
        printUsage();
        return EXIT_USAGE;
    }
    Date date;
    if(!parseDate(params.first(), date)) return EXIT_INVALID_INPUT;

    dint days = 0, months = 0, years = 0;
    int result;
    if((result = offsetOption(args, "-years",  years))  != 0) return result;
    if((result = offsetOption(args, "-months", months)) != 0) return result;
    if((result = offsetOption(args, "-days",   days))   != 0) return result;

    LOG_DEBUG("Adding %i years, %i months, %i days to %s")
            << years << months << days << date.asText();

    out << date.addYears(years).addMonths(months).addDays(days) << "\n";
    return 0;
}

static int commandSort(QTextStream &out, QStringList const &params)
{
    QList<Date> dates;
    foreach(QString const &text, params)
    {
        Date date;
        if(!parseDate(text, date)) return EXIT_INVALID_INPUT;
        dates << date;
    }
    std::sort(dates.begin(), dates.end());

    LOG_DEBUG("Sorted %i dates") << dates.size();

    foreach(Date const &date, dates)
    {
        out << date << "\n";
    }
    return 0;
}

static int run(CommandLine const &args)
{
    QStringList positional = positionalArguments(args);
    if(positional.isEmpty())
    {
        printUsage();
        return EXIT_USAGE;
    }

    String const command = positional.takeFirst();
    LOG_DEBUG("Command: %s") << command;

    QTextStream out(stdout);
    int result = EXIT_USAGE;

    if(command == "today" && positional.isEmpty())
    {
        out << Date::today() << "\n";
        result = 0;
    }
    else if(command == "info")
    {
        result = commandInfo(out, positional);
    }
    else if(command == "add")
    {
        result = commandAdd(out, args, positional);
    }
    else if(command == "sort")
    {
        result = commandSort(out, positional);
    }
    else
    {
        printUsage();
    }
    out.flush();
    return result;
}

int main(int argc, char **argv)
{
    LogBuffer logBuffer;
    logBuffer.enableStandardOutput();
    LogBuffer::setAppBuffer(logBuffer);

    CommandLine args(argc, argv);
    args.alias("-verbose", "-v");
    args.alias("-quiet", "-q");

    if(args.has("-verbose"))
    {
        logBuffer.enable(LogEntry::DEBUG);
    }
    else if(args.has("-quiet"))
    {
        logBuffer.enable(LogEntry::WARNING);
    }

    int result = 0;
    try
    {
        LOG_AS("caldate");
        result = run(args);
    }
    catch(Date::InvalidDateError const &err)
    {
        LOG_ERROR("%s") << err.asText();
        result = EXIT_INVALID_INPUT;
    }
    catch(Error const &err)
    {
        LOG_CRITICAL("%s") << err.asText();
        result = EXIT_USAGE;
    }

    Log::disposeThreadLog();
    return result;
}
