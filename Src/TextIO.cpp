/// @file       TextIO.cpp
/// @brief      Output to the log
/// @details    Format log output strings\n
///             Implements the LBError exception handling class\n
/// @author     Logbook authors
/// @copyright  (c) 2024 Logbook authors
/// @copyright  Permission is hereby granted, free of charge, to any person obtaining a
///             copy of this software and associated documentation files (the "Software"),
///             to deal in the Software without restriction, including without limitation
///             the rights to use, copy, modify, merge, publish, distribute, sublicense,
///             and/or sell copies of the Software, and to permit persons to whom the
///             Software is furnished to do so, subject to the following conditions:\n
///             The above copyright notice and this permission notice shall be included in
///             all copies or substantial portions of the Software.\n
///             THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
///             IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
///             FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
///             AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
///             LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
///             OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
///             THE SOFTWARE.

#include "Logbook.h"

//
// MARK: Log message storage
//

/// The global list of log messages
LogMsgListTy gLog;

/// The global counter
static unsigned long gLogCnt = 0;

/// Controls access to the log list
static std::recursive_mutex gLogMutex;

/// Where log lines go to
static LogOutputFnTy gLogOutFn = nullptr;

/// Optional additional log file
static std::ofstream gLogFile;

static char gBuf[4048];

const char* LOG_LEVEL[] = {
    "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL", "MSG  "
};

// forward declaration: returns ptr to static buffer filled with log string
const char* GetLogString (const LogMsgTy& l);


// Constructor fills all fields
LogMsgTy::LogMsgTy (const char* _fn, int _ln, const char* _func,
                    logLevelTy _lvl, const char* _msg) :
counter(++gLogCnt),
wallTime(std::chrono::system_clock::now()),
fileName(_fn), ln(_ln), func(_func), lvl(_lvl), msg(_msg), bFlushed(false)
{}

// returns ptr to static buffer filled with log string
const char* GetLogString (const LogMsgTy& l)
{
    // Access to static buffer and list guarded by a lock
    std::lock_guard<std::recursive_mutex> lock(gLogMutex);
    
    // Wall clock time as Zulu time string
    const double sysT = double(std::chrono::duration_cast<std::chrono::microseconds>(l.wallTime.time_since_epoch()).count()) / 1000000.0;
    const std::string wallT = ts2string(sysT);

    // prepare timestamp
    if (l.lvl < logMSG)                             // normal messages without, all other with location info
    {
        snprintf(gBuf, sizeof(gBuf)-1, "%s " LOGBOOK " %s %s:%d/%s: %s",
                 wallT.c_str(),                     // wall time (string)
                 LOG_LEVEL[l.lvl],                  // logging level
                 l.fileName.c_str(), l.ln,          // source file and line number
                 l.func.c_str(),                    // function name
                 l.msg.c_str());                    // actual message
    }
    else
        snprintf(gBuf, sizeof(gBuf)-1, "%s " LOGBOOK ": %s",
                 wallT.c_str(),                     // wall time (string)
                 l.msg.c_str());                    // actual message
    
    // ensure there's a trailing CR
    size_t sl = strlen(gBuf);
    if (sl == 0 || gBuf[sl-1] != '\n')
    {
        gBuf[sl]   = '\n';
        gBuf[sl+1] = 0;
    }

    // return the static buffer
    return gBuf;
}

/// Actually adds an entry to the log list and flushes it
static LogMsgListTy::iterator AddLogMsg (const char* szPath, int ln, const char* szFunc,
                                         logLevelTy lvl, const char* szMsg, va_list args)
{
    std::lock_guard<std::recursive_mutex> lock(gLogMutex);
    
    // Cut off path from file name
    const char* szFile = strrchr(szPath, PATH_DELIM);  // extract file from path
    if (!szFile) szFile = szPath; else szFile++;

    // Prepare the formatted string
    vsnprintf(gBuf, sizeof(gBuf), szMsg, args);

    // Add the list entry
    gLog.emplace_front(szFile, ln, szFunc, lvl, gBuf);

    // We are not running in anybody else's main loop, so write out right away
    FlushMsg();
    
    // was added to the front
    return gLog.begin();
}

// Add a message to the list, flush immediately
void LogMsg ( const char* szPath, int ln, const char* szFunc, logLevelTy lvl, const char* szMsg, ... )
{
    std::lock_guard<std::recursive_mutex> lock(gLogMutex);

    // Prepare the formatted message
    va_list args;
    va_start (args, szMsg);
    AddLogMsg(szPath, ln, szFunc, lvl, szMsg, args);
    va_end (args);
}

// Defines where log lines go to
void LogSetOutput (LogOutputFnTy pfnOut)
{
    std::lock_guard<std::recursive_mutex> lock(gLogMutex);
    gLogOutFn = pfnOut;
}

// Additionally write all log lines into this file
bool LogSetFile (const std::string& path)
{
    std::lock_guard<std::recursive_mutex> lock(gLogMutex);
    if (gLogFile.is_open())
        gLogFile.close();
    if (path.empty())
        return true;
    gLogFile.open(path, std::ios_base::out | std::ios_base::app);
    return gLogFile.is_open();
}

// Force writing of all not yet flushed messages
/// @details As new messages are added to the front, we start searching from
///          the front and go forward until we find either the end or
///          an already flushed message. Then we go back and actually write
///          message in sequence
void FlushMsg ()
{
    std::lock_guard<std::recursive_mutex> lock(gLogMutex);

    // Quick exit if empty or nothing to write
    if (gLog.empty() || gLog.front().bFlushed)
        return;
    
    // Move forward to first flushed msg or end
    LogMsgListTy::iterator logIter = gLog.begin();
    while (logIter != gLog.end() && !logIter->bFlushed)
        logIter++;
    
    // Now move back and on the way write out the messages
    do {
        logIter--;
        const char* szLine = GetLogString(*logIter);
        if (gLogOutFn)
            gLogOutFn(szLine);
        else {
            fputs(szLine, stderr);
            fflush(stderr);
        }
        if (gLogFile.is_open()) {
            gLogFile << szLine;
            gLogFile.flush();
        }
        logIter->bFlushed = true;
    } while (logIter != gLog.begin());
    
    // don't let the list grow forever
    PurgeMsgList();
}

// Remove old messages
void PurgeMsgList (size_t nKeep)
{
    std::lock_guard<std::recursive_mutex> lock(gLogMutex);
    if (gLog.size() > nKeep)
        gLog.resize(nKeep);
}

//
// MARK: Logbook Exception classes
//

// standard constructor
LBError::LBError (const char* _szFile, int _ln, const char* _szFunc,
                  logLevelTy _lvl,
                  const char* _szMsg, ...) :
std::logic_error(_szMsg)
{
    std::lock_guard<std::recursive_mutex> lock(gLogMutex);
    va_list args;
    va_start (args, _szMsg);
    msg = AddLogMsg(_szFile, _ln, _szFunc, _lvl, _szMsg, args)->msg;
    va_end (args);
}

const char* LBError::what() const noexcept
{
    return msg.c_str();
}
