/** @file date.cpp  Calendar date.
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

#include "cal/date.h"
#include "cal/writer.h"
#include "cal/reader.h"
#include "cal/log.h"
#include "cal/logbuffer.h"

#include <QHash>

namespace cal {

dint const Date::MIN_YEAR;
dint const Date::MAX_YEAR;

/// Length of the YYYY-MM-DD format.
static int const TEXT_LENGTH = 10;

static bool rejectText(String const &text, char const *reason)
{
    // Entering a section creates the thread's log, so only do it when the
    // entry will be kept.
    if(!LogBuffer::appBufferExists() || !LogBuffer::appBuffer().isEnabled(LogEntry::TRACE))
    {
        return false;
    }
    LOG_AS("Date::tryParse");
    LOG_TRACE("Rejected \"%s\": %s") << text << reason;
    return false;
}

/**
 * Reads a number of ASCII digits from @a text.
 *
 * @return @c false, if a character is not an ASCII digit.
 */
static bool parseDigits(String const &text, int pos, int count, dint &number)
{
    number = 0;
    for(int i = pos; i < pos + count; ++i)
    {
        ushort const ch = text.at(i).unicode();
        if(ch < '0' || ch > '9') return false;
        number = number * 10 + (ch - '0');
    }
    return true;
}

static qint64 julianDayOfFirstSupportedDate()
{
    return QDate(Date::MIN_YEAR, 1, 1).toJulianDay();
}

static qint64 julianDayOfLastSupportedDate()
{
    return QDate(Date::MAX_YEAR, 12, 31).toJulianDay();
}

Date::Date() : _date(MIN_YEAR, 1, 1)
{}

Date::Date(dint year, dint month, dint day)
{
    if(!isValid(year, month, day))
    {
        /// @throw InvalidDateError The year, month and day are not a valid date.
        throw InvalidDateError("Date::Date",
                               QString("Year %1, month %2, day %3 is not a valid date")
                               .arg(year).arg(month).arg(day));
    }
    _date = QDate(year, month, day);
}

Date::Date(QDate const &date) : _date(date)
{
    CAL_ASSERT(isValid(_date.year(), _date.month(), _date.day()));
}

Date Date::today()
{
    return Date(QDate::currentDate());
}

bool Date::tryParse(String const &text, Date &date)
{
    if(text.size() != TEXT_LENGTH)
    {
        return rejectText(text, "length is not 10 characters");
    }
    if(text.at(4) != '-' || text.at(7) != '-')
    {
        return rejectText(text, "expected hyphens between year, month and day");
    }

    dint year, month, day;
    if(!parseDigits(text, 0, 4, year) ||
       !parseDigits(text, 5, 2, month) ||
       !parseDigits(text, 8, 2, day))
    {
        return rejectText(text, "fields must be ASCII digits");
    }
    if(!isValid(year, month, day))
    {
        return rejectText(text, "not a valid date");
    }

    date = Date(year, month, day);
    return true;
}

String Date::asText() const
{
    return QString("%1-%2-%3")
            .arg(year(),  4, 10, QChar('0'))
            .arg(month(), 2, 10, QChar('0'))
            .arg(day(),   2, 10, QChar('0'));
}

dint Date::year() const
{
    return _date.year();
}

dint Date::month() const
{
    return _date.month();
}

dint Date::day() const
{
    return _date.day();
}

void Date::decompose(dint &year, dint &month, dint &day) const
{
    year  = _date.year();
    month = _date.month();
    day   = _date.day();
}

Date::DayOfWeek Date::dayOfWeek() const
{
    // QDate numbers the days from Monday (1) to Sunday (7).
    return DayOfWeek(_date.dayOfWeek() % 7);
}

dint Date::dayOfYear() const
{
    return _date.dayOfYear();
}

Date Date::addDays(dint days) const
{
    qint64 const julianDay = _date.toJulianDay() + days;
    if(julianDay < julianDayOfFirstSupportedDate() || julianDay > julianDayOfLastSupportedDate())
    {
        /// @throw OutOfRangeError The result is outside the supported years.
        throw OutOfRangeError("Date::addDays",
                              QString("Adding %1 days to %2 goes past the supported years")
                              .arg(days).arg(asText()));
    }
    return Date(QDate::fromJulianDay(julianDay));
}

Date Date::addMonths(dint months) const
{
    // Months counted from the beginning of year zero.
    dint64 const target = dint64(year()) * 12 + (month() - 1) + months;
    if(target < dint64(MIN_YEAR) * 12 || target > dint64(MAX_YEAR) * 12 + 11)
    {
        /// @throw OutOfRangeError The result is outside the supported years.
        throw OutOfRangeError("Date::addMonths",
                              QString("Adding %1 months to %2 goes past the supported years")
                              .arg(months).arg(asText()));
    }
    // QDate uses the last day of the month if the day would be invalid.
    return Date(_date.addMonths(months));
}

Date Date::addYears(dint years) const
{
    dint64 const target = dint64(year()) + years;
    if(target < MIN_YEAR || target > MAX_YEAR)
    {
        /// @throw OutOfRangeError The result is outside the supported years.
        throw OutOfRangeError("Date::addYears",
                              QString("Adding %1 years to %2 goes past the supported years")
                              .arg(years).arg(asText()));
    }
    // February 29th becomes the 28th if needed.
    return Date(_date.addYears(years));
}

dint Date::compare(Date const &other) const
{
    if(_date < other._date) return -1;
    if(_date > other._date) return 1;
    return 0;
}

void Date::operator >> (Writer &to) const
{
    to << dint16(year()) << duint8(month()) << duint8(day());
}

void Date::operator << (Reader &from)
{
    dint16 y = 0;
    duint8 m = 0;
    duint8 d = 0;
    from >> y >> m >> d;

    if(!isValid(y, m, d))
    {
        /// @throw DeserializationError The serialized fields are not a valid date.
        throw DeserializationError("Date::operator <<",
                                   QString("Year %1, month %2, day %3 is not a valid date")
                                   .arg(y).arg(m).arg(d));
    }
    _date = QDate(y, m, d);
}

bool Date::isValid(dint year, dint month, dint day)
{
    if(year < MIN_YEAR || year > MAX_YEAR) return false;
    if(month < 1 || month > 12) return false;
    return day >= 1 && day <= daysInMonth(year, month);
}

bool Date::isLeapYear(dint year)
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

dint Date::daysInMonth(dint year, dint month)
{
    static dint const days[12] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };

    if(month < 1 || month > 12)
    {
        /// @throw InvalidDateError @a month is not between 1 and 12.
        throw InvalidDateError("Date::daysInMonth", QString("Month %1 is invalid").arg(month));
    }
    if(month == 2 && isLeapYear(year)) return 29;
    return days[month - 1];
}

String Date::dayOfWeekName(DayOfWeek dayOfWeek)
{
    switch(dayOfWeek)
    {
    case Sunday:    return "Sunday";
    case Monday:    return "Monday";
    case Tuesday:   return "Tuesday";
    case Wednesday: return "Wednesday";
    case Thursday:  return "Thursday";
    case Friday:    return "Friday";
    case Saturday:  return "Saturday";
    }
    return "";
}

QTextStream &operator << (QTextStream &os, Date const &date)
{
    os << date.asText();
    return os;
}

uint qHash(Date const &date, uint seed)
{
    return ::qHash(date.asQDate().toJulianDay(), seed);
}

} // namespace cal
