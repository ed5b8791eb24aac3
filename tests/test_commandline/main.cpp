/** @file main.cpp  Tests for command line arguments.
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

#include <cal/commandline.h>

#include <QDebug>
#include <QStringList>

#include "../testapp.h"

using namespace cal;

static void testOptions()
{
    CommandLine cmdLine(QStringList() << "caldate" << "add" << "2001-01-31"
                        << "-months" << "1" << "-days" << "-5" << "-verbose");

    CHECK(cmdLine.count() == 8);
    CHECK(cmdLine.at(0) == "caldate");
    CHECK(cmdLine.check("-months") == 3);
    CHECK(cmdLine.check("-months", 1) == 3);
    CHECK(cmdLine.check("-months", 2) == 0);
    CHECK(cmdLine.check("-years") == 0);

    // A negative number is a parameter rather than an option.
    CHECK(cmdLine.check("-days", 1) == 5);
    CHECK(!cmdLine.isOption(6));
    CHECK(cmdLine.isOption(5));
    CHECK(!cmdLine.isOption(1));
    CHECK(CommandLine::isOption("-x"));
    CHECK(!CommandLine::isOption("-2.5"));
    CHECK(!CommandLine::isOption(""));

    String param;
    CHECK(cmdLine.getParameter("-days", param));
    CHECK(param == "-5");
    CHECK(cmdLine.getParameter("-months", param));
    CHECK(param == "1");
    CHECK(!cmdLine.getParameter("-verbose", param));
    CHECK(param == "1");

    // The program name is never matched.
    CHECK(cmdLine.has("caldate") == 0);
    CHECK(cmdLine.has("-VERBOSE") == 1);
}

static void testAliases()
{
    CommandLine cmdLine(QStringList() << "caldate" << "-v" << "today" << "-V");
    cmdLine.alias("-verbose", "-v");

    CHECK(cmdLine.matches("-verbose", "-v"));
    CHECK(cmdLine.matches("-Verbose", "-V"));
    CHECK(cmdLine.matches("-verbose", "-verbose"));
    CHECK(!cmdLine.matches("-v", "-verbose"));
    CHECK(!cmdLine.matches("-verbose", "-q"));
    CHECK(cmdLine.check("-verbose") == 1);
    CHECK(cmdLine.has("-verbose") == 2);
}

static void testRange()
{
    CommandLine cmdLine(QStringList() << "caldate" << "sort");
    CHECK(cmdLine.count() == 2);
    CHECK(cmdLine.at(1) == "sort");

    CHECK_THROWS(CommandLine::OutOfRangeError, cmdLine.at(2));
    CHECK_THROWS(CommandLine::OutOfRangeError, cmdLine.at(-1));
    CHECK_THROWS(CommandLine::OutOfRangeError, cmdLine.isOption(10));
    CHECK_THROWS(Error, cmdLine.at(100));

    CommandLine empty((QStringList()));
    CHECK(empty.count() == 0);
    CHECK(empty.check("-x") == 0);
    CHECK(empty.has("-x") == 0);
}

static void testProgramArguments()
{
    CommandLine const &cmdLine = TestApp::app().commandLine();
    CHECK(cmdLine.count() >= 1);
    CHECK(!cmdLine.at(0).isEmpty());
}

int main(int argc, char **argv)
{
    TestApp app(argc, argv);
    try
    {
        LOG_AS("test_commandline");

        testOptions();
        testAliases();
        testRange();
        testProgramArguments();
    }
    catch(Error const &err)
    {
        app.fail(err);
    }

    qDebug() << "Exiting main()...";
    return app.exitCode();
}
