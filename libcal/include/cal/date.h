/** @file date.h  Calendar date.
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

#ifndef LIBCAL_DATE_H
#define LIBCAL_DATE_H

#include "libcal.h"
#include "string.h"
#include "iserializable.h"

#include <QDate>
#include <QTextStream>
#include <functional>

namespace cal {

/**
 * Calendar date in the proleptic Gregorian calendar, without a time of day
 * or a time zone. Dates are immutable values: the arithmetic methods return
 * a new Date and leave the original untouched.
 *
 * Every Date is valid. The supported years are MIN_YEAR...MAX_YEAR;
 * operations that would produce a date outside this range throw.
 *
 * @ingroup data
 */
class CAL_PUBLIC Date : public ISerializable
{
public:
    /// The year, month and day do not form a valid date. @ingroup errors
    CAL_ERROR(InvalidDateError);

    /// Arithmetic produced a date outside the supported years. @ingroup errors
    CAL_SUB_ERROR(InvalidDateError, OutOfRangeError);

    enum DayOfWeek
    {
        Sunday    = 0,
        Monday    = 1,
        Tuesday   = 2,
        Wednesday = 3,
        Thursday  = 4,
        Friday    = 5,
        Saturday  = 6
    };

    static dint const MIN_YEAR = 1;
    static dint const MAX_YEAR = 9999;

public:
    /**
     * Constructs the earliest supported date, January 1st of MIN_YEAR.
     */
    Date();

    /**
     * Constructs a date.
     *
     * @param year   Year (MIN_YEAR...MAX_YEAR).
     * @param month  Month (1...12).
     * @param day    Day of the month (1...31, depending on the month).
     */
    Date(dint year, dint month, dint day);

    /**
     * Returns the current local calendar date.
     */
    static Date today();

    /**
     * Parses a date in the format YYYY-MM-DD. Only that exact format is
     * accepted: a four-digit year, a two-digit month and a two-digit day,
     * separated by hyphens.
     *
     * @param text  Text to parse.
     * @param date  The parsed date is written here. Not modified if the
     *              text is not a valid date.
     *
     * @return @c true, if @a text was a valid date.
     */
    static bool tryParse(String const &text, Date &date);

    /**
     * Converts the date to text in the format YYYY-MM-DD.
     */
    String asText() const;

    dint year() const;
    dint month() const;
    dint day() const;

    /**
     * Returns the year, month and day.
     */
    void decompose(dint &year, dint &month, dint &day) const;

    DayOfWeek dayOfWeek() const;

    /**
     * Returns the day of the year, 1 for January 1st.
     */
    dint dayOfYear() const;

    /**
     * Returns a date that is @a days days later (or earlier, if negative).
     */
    Date addDays(dint days) const;

    /**
     * Returns a date that is @a months months later (or earlier, if
     * negative). If the day does not exist in the resulting month, the
     * last day of that month is used.
     */
    Date addMonths(dint months) const;

    /**
     * Returns a date that is @a years years later (or earlier, if
     * negative). February 29th becomes February 28th in a year that is
     * not a leap year.
     */
    Date addYears(dint years) const;

    /**
     * Compares two dates in calendar order.
     *
     * @return -1, if this date is earlier than @a other; 0, if the dates
     * are the same; 1, if this date is later.
     */
    dint compare(Date const &other) const;

    bool operator == (Date const &other) const { return _date == other._date; }
    bool operator != (Date const &other) const { return _date != other._date; }
    bool operator <  (Date const &other) const { return _date <  other._date; }
    bool operator <= (Date const &other) const { return _date <= other._date; }
    bool operator >  (Date const &other) const { return _date >  other._date; }
    bool operator >= (Date const &other) const { return _date >= other._date; }

    /// Returns the date as a QDate.
    QDate asQDate() const { return _date; }

    // Implements ISerializable.
    void operator >> (Writer &to) const;
    void operator << (Reader &from);

public:
    /**
     * Determines whether a year, month and day form a valid date within
     * the supported years.
     */
    static bool isValid(dint year, dint month, dint day);

    /**
     * Determines whether @a year is a leap year in the proleptic Gregorian
     * calendar.
     */
    static bool isLeapYear(dint year);

    /**
     * Returns the number of days in a month.
     *
     * @param year   Year.
     * @param month  Month (1...12).
     */
    static dint daysInMonth(dint year, dint month);

    /// Returns the English name of a day of the week, e.g., "Monday".
    static String dayOfWeekName(DayOfWeek dayOfWeek);

private:
    Date(QDate const &date);

    QDate _date;
};

CAL_PUBLIC QTextStream &operator << (QTextStream &os, Date const &date);

/// Hash for Qt containers.
CAL_PUBLIC uint qHash(Date const &date, uint seed = 0);

} // namespace cal

namespace std {

template <>
struct hash<cal::Date>
{
    std::size_t operator () (cal::Date const &date) const {
        return std::hash<qint64>()(date.asQDate().toJulianDay());
    }
};

} // namespace std

#endif // LIBCAL_DATE_H
