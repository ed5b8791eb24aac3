/** @file main.cpp  Tests for the log.
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

#include <cal/log.h>
#include <cal/logbuffer.h>
#include <cal/memorylogsink.h>
#include <cal/date.h>

#include <QDebug>
#include <QThread>

#include "../testapp.h"

using namespace cal;

static void testSections(MemoryLogSink &sink)
{
    sink.clear();
    int const depth = LOG().sectionDepth();
    {
        LOG_AS("Outer");
        LOG_MSG("First");
        {
            LOG_AS("Inner");
            CHECK(LOG().sectionDepth() == depth + 2);
            LOG_MSG("Second");
        }
        LOG_MSG("Third");
    }
    CHECK(LOG().sectionDepth() == depth);

    CHECK(sink.entryCount() == 3);
    CHECK(sink.entryText(0) == "test_log > Outer: First");
    CHECK(sink.entryText(1) == "test_log > Outer > Inner: Second");
    CHECK(sink.entryText(2) == "test_log > Outer: Third");
    CHECK(sink.entry(1).sectionDepth() == 3);
}

static void testLevels(MemoryLogSink &sink)
{
    LogBuffer &buf = TestApp::app().logBuffer();

    for(int i = LogEntry::TRACE; i < LogEntry::MAX_LOG_LEVELS; ++i)
    {
        LogEntry::Level const level = LogEntry::Level(i);
        buf.enable(level);
        sink.clear();

        for(int k = LogEntry::TRACE; k < LogEntry::MAX_LOG_LEVELS; ++k)
        {
            LogEntry::Level const other = LogEntry::Level(k);
            LOG_AT_LEVEL(other, "%s entry while %s is enabled")
                    << LogEntry::levelToText(other) << LogEntry::levelToText(level);
        }

        // Only the enabled levels reach the sink.
        CHECK(sink.entryCount() == LogEntry::MAX_LOG_LEVELS - i);
        if(sink.entryCount() > 0)
        {
            CHECK(sink.entry(0).level() == level);
        }
    }

    buf.enable(LogEntry::DEBUG);
    CHECK(!buf.isEnabled(LogEntry::TRACE));
    CHECK(buf.isEnabled(LogEntry::DEBUG));
    CHECK(buf.isEnabled(LogEntry::CRITICAL));
    CHECK(buf.enabledLevel() == LogEntry::DEBUG);
}

static void testFormatting(MemoryLogSink &sink)
{
    sink.clear();

    LOG_MSG("Escaped %%: arg %i") << 1;
    LOG_MSG("String: '%s'") << "Hello World";
    LOG_MSG("Min width 8: '%8s'") << "Hello";
    LOG_MSG("Max width .8: '%.8s'") << "Hello World";
    LOG_MSG("Left align: '%-8s' '%-.5s'") << "Hello" << "Hello World";
    LOG_MSG("Integer (64-bit signed): %i") << dint64(0x1000000000LL);
    LOG_MSG("Unsigned: %u, negative: %d") << 42u << -7;
    LOG_MSG("Number as text: %s") << 2.5;
    LOG_MSG("Extra:") << 1 << "two";
    LOG_MSG("Verbatim without arguments: 100%");
    LOG_MSG("Date: %s") << Date(2001, 1, 1).asText();

    CHECK(sink.entryCount() == 11);
    CHECK(sink.entryText(0)  == "test_log: Escaped %: arg 1");
    CHECK(sink.entryText(1)  == "test_log: String: 'Hello World'");
    CHECK(sink.entryText(2)  == "test_log: Min width 8: '   Hello'");
    CHECK(sink.entryText(3)  == "test_log: Max width .8: 'lo World'");
    CHECK(sink.entryText(4)  == "test_log: Left align: 'Hello   ' 'Hello'");
    CHECK(sink.entryText(5)  == "test_log: Integer (64-bit signed): 68719476736");
    CHECK(sink.entryText(6)  == "test_log: Unsigned: 42, negative: -7");
    CHECK(sink.entryText(7)  == "test_log: Number as text: 2.5");
    CHECK(sink.entryText(8)  == "test_log: Extra: 1 two");
    CHECK(sink.entryText(9)  == "test_log: Verbatim without arguments: 100%");
    CHECK(sink.entryText(10) == "test_log: Date: 2001-01-01");

    // The full text has the level indicator.
    sink.clear();
    LOG_WARNING("Careful");
    CHECK(sink.entry(0).asText().contains("(WRN) test_log: Careful"));
    CHECK(sink.entry(0).asText(LogEntry::Simple | LogEntry::OmitSection) == "Careful");
}

static void testBadPattern(MemoryLogSink &sink)
{
    sink.clear();

    // The standard output sink cannot format these, but the other sinks
    // still receive them.
    LOG_MSG("Not enough arguments: %i %i") << 1;
    LOG_MSG("Text as a number: %i") << "text";
    LOG_MSG("Unknown directive: %x") << 255;
    LOG_MSG("Incomplete directive: %-") << 1;

    CHECK(sink.entryCount() == 4);
    if(sink.entryCount() == 4)
    {
        CHECK_THROWS(String::IllegalPatternError, sink.entry(0).asText());
        CHECK_THROWS(String::IPatternArg::TypeError, sink.entry(1).asText());
        CHECK_THROWS(String::IllegalPatternError, sink.entry(2).asText());
        CHECK_THROWS(String::IllegalPatternError, sink.entry(3).asText());
    }
    sink.clear();
}

static void testBuffer()
{
    LogBuffer &buf = TestApp::app().logBuffer();
    buf.clear();
    buf.setMaxEntryCount(3);

    for(int i = 0; i < 5; ++i)
    {
        LOG_MSG("Entry %i") << i;
    }
    CHECK(buf.size() == 3);

    LogBuffer::Entries latest;
    buf.latestEntries(latest);
    CHECK(latest.size() == 3);
    CHECK(latest.first()->asText(LogEntry::Simple) == "test_log: Entry 4");
    CHECK(latest.last()->asText(LogEntry::Simple) == "test_log: Entry 2");

    buf.latestEntries(latest, 1);
    CHECK(latest.size() == 1);

    buf.setMaxEntryCount(1000);
}

class LoggingThread : public QThread
{
public:
    LoggingThread() : hadLogBeforeParse(true), hadLogAfterParse(true) {}

    bool hadLogBeforeParse;
    bool hadLogAfterParse;

protected:
    void run() {
        // Failed parses only log when tracing is enabled.
        hadLogBeforeParse = Log::threadLogExists();
        Date date;
        Date::tryParse("not a date", date);
        hadLogAfterParse = Log::threadLogExists();

        LOG_AS("LoggingThread");
        LOG_MSG("Hello from another thread");
    }
};

static void testThreads(MemoryLogSink &sink)
{
    sink.clear();
    CHECK(!TestApp::app().logBuffer().isEnabled(LogEntry::TRACE));

    LoggingThread thread;
    thread.start();
    thread.wait();

    CHECK(!thread.hadLogBeforeParse);
    CHECK(!thread.hadLogAfterParse);

    // The other thread has its own sections.
    CHECK(sink.entryCount() == 1);
    if(sink.entryCount() == 1)
    {
        CHECK(sink.entryText(0) == "LoggingThread: Hello from another thread");
    }
}

static void testTracedParse(MemoryLogSink &sink)
{
    LogBuffer &buf = TestApp::app().logBuffer();
    buf.enable(LogEntry::TRACE);
    sink.clear();

    Date date;
    CHECK(!Date::tryParse("2001-02-30", date));
    CHECK(sink.entryCount() == 1);
    if(sink.entryCount() == 1)
    {
        CHECK(sink.entry(0).level() == LogEntry::TRACE);
        CHECK(sink.entryText(0).startsWith("test_log > Date::tryParse: Rejected \"2001-02-30\""));
    }

    buf.enable(LogEntry::DEBUG);
}

static void testOtherBuffer()
{
    // Entries only go to the application's buffer.
    LogBuffer other;
    MemoryLogSink sink;
    other.addSink(sink);
    LOG_MSG("Goes to the application buffer");
    CHECK(sink.entryCount() == 0);
    CHECK(other.size() == 0);
    other.removeSink(sink);
}

int main(int argc, char **argv)
{
    TestApp app(argc, argv);
    MemoryLogSink sink;
    app.logBuffer().addSink(sink);
    try
    {
        LOG_AS("test_log");

        testSections(sink);
        testLevels(sink);
        testFormatting(sink);
        testBadPattern(sink);
        testBuffer();
        testThreads(sink);
        testTracedParse(sink);
        testOtherBuffer();
    }
    catch(Error const &err)
    {
        app.fail(err);
    }
    app.logBuffer().removeSink(sink);

    qDebug() << "Exiting main()...";
    return app.exitCode();
}
