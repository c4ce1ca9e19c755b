/// @file       TextIO.h
/// @brief      Error handling, macros for output to the log
/// @details    Defines central logging macro `LOG_MSG` et al\n
///             Defines exception handling class LBError\n
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

#ifndef TextIO_h
#define TextIO_h

#include <stdexcept>

/// @brief To apply printf-style warnings to our functions.
/// @see Taken from imgui.h's definition of IM_FMTARGS
#if defined(__clang__) || defined(__GNUC__)
#define LB_FMTARGS(FMT)  __attribute__((format(printf, FMT, FMT+1)))
#else
#define LB_FMTARGS(FMT)
#endif

// MARK: Log Level:
// 4 - Fatal Errors only
// 3 - Errors
// 2 - Warnings
// 1 - Infos
// 0 - Debug Output
enum logLevelTy {
    logDEBUG = 0,
    logINFO,
    logWARN,
    logERR,
    logFATAL,
    logMSG              // will always be output
};

//
// MARK: Log message storage
//

/// A single log message
struct LogMsgTy {
    unsigned long                           counter = 0;    ///< monotonic counter
    std::chrono::system_clock::time_point   wallTime;       ///< system time of message
    std::string                             fileName;       ///< source file name where message was produced
    int                                     ln = 0;         ///< line number if `fileName`
    std::string                             func;           ///< function in which message was produced
    logLevelTy                              lvl = logMSG;   ///< message severity
    std::string                             msg;            ///< message text
    bool                                    bFlushed = false;   ///< written to the log output?
    
    /// Constructor fills all fields
    LogMsgTy (const char* _fn, int _ln, const char* _func,
              logLevelTy _lvl, const char* _msg);
    /// Standard constructor does nothing much, only needed for std::list::resize
    LogMsgTy () {}
};

/// A list of log messages
typedef std::list<LogMsgTy> LogMsgListTy;

/// The global list of recent log messages, newest first
extern LogMsgListTy gLog;

/// Function, which receives one formatted log line
typedef void (*LogOutputFnTy)(const char* szLine);

/// @brief Defines where log lines go to
/// @param pfnOut Receives each line, `nullptr` resets to `stderr`
void LogSetOutput (LogOutputFnTy pfnOut);

/// @brief Additionally write all log lines into this file
/// @return `false` if the file could not be opened
bool LogSetFile (const std::string& path);

/// Add a message to the list and flush it
void LogMsg ( const char* szFile, int ln, const char* szFunc, logLevelTy lvl, const char* szMsg, ... ) LB_FMTARGS(5);

/// Force writing of all not yet flushed messages
void FlushMsg ();

/// @brief Remove old messages, keeping `nKeep` most recent ones
void PurgeMsgList (size_t nKeep = 100);

/// Return text for log level

// Log a message if lvl is greater or equal currently defined log level
// Note: First parameter after lvl must be the message text,
//       which can be a format string with its parameters following like in sprintf
#define LOG_MSG(lvl,...)  {                                         \
    if ((lvl) >= lbConfig.GetLogLevel())                            \
    {LogMsg(__FILE__, __LINE__, __func__, lvl, __VA_ARGS__);}       \
}

// Throw in an assert-style (logging takes place in LBError constructor)
#define LOG_ASSERT(cond)                                            \
    if (!(cond)) {                                                  \
        THROW_ERROR(logFATAL,ERR_ASSERT,#cond);                     \
    }

// MARK: Logbook Exception class
class LBError : public std::logic_error {
protected:
    std::string msg;            ///< the formatted message text
public:
    LBError (const char* szFile, int ln, const char* szFunc, logLevelTy lvl,
             const char* szMsg, ...) LB_FMTARGS(6);
public:
    /// returns the formatted message text
    const char* what() const noexcept override;
    
public:
    // copy/move constructor/assignment as per default
    LBError (const LBError& o) = default;
    LBError (LBError&& o) = default;
    LBError& operator = (const LBError& o) = default;
    LBError& operator = (LBError&& o) = default;
};

#define THROW_ERROR(lvl,...)                                        \
throw LBError(__FILE__, __LINE__, __func__, lvl, __VA_ARGS__);

#endif /* TextIO_h */
