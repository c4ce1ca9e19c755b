/// @file       Logbook.cpp
/// @brief      Program entry point of the logbook
/// @details    Evaluates the command line and the config file, then runs the main loop
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

int main (int argc, const char* argv[])
{
    std::string cfgPath;
    if (!lbConfig.ParseArgs(argc, argv, cfgPath)) {
        fprintf(stderr, MSG_USAGE "\n", argc > 0 ? argv[0] : LOGBOOK);
        return 1;
    }
    
    try {
        LOG_MSG(logMSG, MSG_STARTUP, LOGBOOK_VERSION);
        if (!lbConfig.LoadConfigFile(cfgPath))
            return 1;
        
        // additional log file
        if (!lbConfig.GetLogFile().empty() &&
            !LogSetFile(lbConfig.GetLogFile()))
        {
            char sErr[SERR_LEN];
            strerror_s(sErr, sizeof(sErr), errno);
            LOG_MSG(logERR, ERR_LOG_FILE_OPEN, lbConfig.GetLogFile().c_str(), sErr);
        }
        
        return LBMainRun(lbConfig);
    }
    catch (const std::exception& e) {
        LOG_MSG(logFATAL, ERR_TOP_LEVEL_EXCEPTION, e.what());
        return 1;
    }
}
