/** @file main.cpp  Tests for comparing and sorting dates.
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
#include <cal/log.h>

#include <QDebug>
#include <QHash>
#include <QList>
#include <QMap>
#include <QSet>
#include <algorithm>
#include <map>
#include <unordered_map>
#include <unordered_set>

#include "../testapp.h"

using namespace cal;

static void testOperators()
{
    Date const a(2001, 1, 1);
    Date const b(2001, 1, 1);
    Date const c(2002, 1, 1);

    CHECK(a == b);
    CHECK(!(a != b));
    CHECK(a <= b);
    CHECK(a >= b);
    CHECK(!(a < b));
    CHECK(!(a > b));

    CHECK(a != c);
    CHECK(!(a == c));
    CHECK(a < c);
    CHECK(a <= c);
    CHECK(c > a);
    CHECK(c >= a);
    CHECK(!(c < a));
    CHECK(!(a > c));

    CHECK(a.compare(b) == 0);
    CHECK(a.compare(c) == -1);
    CHECK(c.compare(a) == 1);

    // Each field affects the order.
    CHECK(Date(2001, 1, 2) > Date(2001, 1, 1));
    CHECK(Date(2001, 2, 1) > Date(2001, 1, 31));
    CHECK(Date(2002, 1, 1) > Date(2001, 12, 31));
    CHECK(Date(2001, 1, 2) != Date(2001, 1, 1));
    CHECK(Date(2001, 2, 1) != Date(2001, 1, 1));
    CHECK(Date(2002, 1, 1) != Date(2001, 1, 1));
}

static void testSorting()
{
    LOG_AS("testSorting");

    QList<Date> dates;
    dates << Date(2001, 1, 1) << Date(2010, 1, 1) << Date(2005, 1, 1);
    std::sort(dates.begin(), dates.end());

    CHECK(dates.size() == 3);
    CHECK(dates[0] == Date(2001, 1, 1));
    CHECK(dates[1] == Date(2005, 1, 1));
    CHECK(dates[2] == Date(2010, 1, 1));

    for(int i = 0; i < dates.size(); ++i)
    {
        LOG_DEBUG("%i: %s") << i << dates[i].asText();
    }
}

static void testHashing()
{
    Date const a(2001, 1, 1);
    Date const b(2001, 1, 1);
    Date parsed;
    CHECK(Date::tryParse("2001-01-01", parsed));

    // Equal dates hash equally regardless of how they were made.
    CHECK(qHash(a) == qHash(b));
    CHECK(qHash(a) == qHash(parsed));
    CHECK(qHash(a, 42) == qHash(b, 42));
    CHECK(std::hash<Date>()(a) == std::hash<Date>()(b));
    CHECK(std::hash<Date>()(a) == std::hash<Date>()(Date(2000, 12, 31).addDays(1)));

    // Dates differing in one field.
    Date const others[] = { Date(2001, 1, 2), Date(2001, 2, 1), Date(2002, 1, 1) };
    for(int i = 0; i < 3; ++i)
    {
        CHECK(qHash(a) != qHash(others[i]));
        CHECK(std::hash<Date>()(a) != std::hash<Date>()(others[i]));
    }
}

static void testContainers()
{
    Date const a(2001, 1, 1);
    Date const c(2002, 1, 1);

    QHash<Date, QString> qtHash;
    qtHash.insert(a, "first");
    qtHash.insert(c, "second");
    qtHash.insert(Date(2001, 1, 1), "replaced");
    CHECK(qtHash.size() == 2);
    CHECK(qtHash.value(a) == "replaced");
    CHECK(qtHash.contains(Date(2002, 1, 1)));

    QSet<Date> qtSet;
    qtSet << a << Date(2001, 1, 1) << c;
    CHECK(qtSet.size() == 2);
    CHECK(qtSet.contains(c));

    QMap<Date, int> qtMap;
    qtMap.insert(c, 2);
    qtMap.insert(a, 1);
    CHECK(qtMap.firstKey() == a);
    CHECK(qtMap.lastKey() == c);

    std::unordered_map<Date, int> stdHash;
    stdHash[a] = 1;
    stdHash[Date(2001, 1, 1)] += 1;
    stdHash[c] = 5;
    CHECK(stdHash.size() == 2);
    CHECK(stdHash[a] == 2);

    std::unordered_set<Date> stdSet;
    stdSet.insert(a);
    stdSet.insert(Date(a));
    CHECK(stdSet.size() == 1);

    std::map<Date, int> stdMap;
    stdMap[c] = 2;
    stdMap[a] = 1;
    CHECK(stdMap.begin()->first == a);
    CHECK(stdMap.size() == 2);
}

int main(int argc, char **argv)
{
    TestApp app(argc, argv);
    try
    {
        LOG_AS("test_datecompare");

        testOperators();
        testSorting();
        testHashing();
        testContainers();
    }
    catch(Error const &err)
    {
        app.fail(err);
    }

    qDebug() << "Exiting main()...";
    return app.exitCode();
}
