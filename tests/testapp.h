/** @file testapp.h  Test harness shared by the test programs.
 *
 * @authors Copyright (c) 2013 Jaakko Keränen <jaakko.keranen@iki.fi>
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

#ifndef TESTAPP_H
#define TESTAPP_H

#include <cal/logbuffer.h>
#include <cal/log.h>
#include <cal/commandline.h>

/**
 * Sets up logging for a test program and keeps count of failed checks.
 * Each test program has exactly one TestApp.
 */
class TestApp
{
public:
    TestApp(int argc, char **argv) : _cmdLine(argc, argv), _failures(0) {
        _logBuffer.enable(cal::LogEntry::DEBUG);
        _logBuffer.enableStandardOutput();
        cal::LogBuffer::setAppBuffer(_logBuffer);
        instance() = this;
        LOG_MSG("TestApp constructed.");
    }

    ~TestApp() {
        LOG_MSG("TestApp destroyed with %i failed checks.") << _failures;
        instance() = 0;
        cal::Log::disposeThreadLog();
    }

    cal::LogBuffer &logBuffer() { return _logBuffer; }
    cal::CommandLine const &commandLine() const { return _cmdLine; }

    void check(bool passed, char const *condition, char const *file, int line) {
        if(!passed) {
            _failures++;
            LOG_ERROR("%s:%i: Check failed: %s") << file << line << condition;
        }
    }

    void fail(cal::Error const &err) {
        _failures++;
        LOG_ERROR("Unexpected error: %s") << err.asText();
    }

    int failures() const { return _failures; }

    /// Exit code of the test program.
    int exitCode() const { return _failures? 1 : 0; }

    static TestApp &app() {
        CAL_ASSERT(instance() != 0);
        return *instance();
    }

private:
    static TestApp *&instance() {
        static TestApp *theApp = 0;
        return theApp;
    }

    cal::LogBuffer _logBuffer;
    cal::CommandLine _cmdLine;
    int _failures;
};

/// Checks that @a cond is true. A failed check is logged and makes the test fail.
#define CHECK(cond) TestApp::app().check((cond), #cond, __FILE__, __LINE__)

/// Checks that evaluating the expression throws @a ErrorType.
#define CHECK_THROWS(ErrorType, ...) { \
    bool thrown_ = false; \
    try { __VA_ARGS__; } catch(ErrorType const &) { thrown_ = true; } \
    TestApp::app().check(thrown_, #__VA_ARGS__ " throws " #ErrorType, __FILE__, __LINE__); }

#endif // TESTAPP_H
