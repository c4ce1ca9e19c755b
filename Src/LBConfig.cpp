/// @file       LBConfig.cpp
/// @brief      Configuration: command line and config file settings
/// @details    The config file's first line is `Logbook <version>`,
///             followed by lines of `key value`.
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

/// The one global configuration object
LBConfig lbConfig;

// Evaluates the command line
bool LBConfig::ParseArgs (int argc, const char* const argv[], std::string& cfgPath)
{
    cfgPath = PATH_CONFIG_FILE;
    if (argc < 2 || argc > 3)
        return false;
    if (!SetSim(argv[1])) {
        LOG_MSG(logFATAL, ERR_CFG_UNKNOWN_SIM, argv[1]);
        return false;
    }
    if (argc == 3)
        cfgPath = argv[2];
    return true;
}

// Sets the simulator by its name
bool LBConfig::SetSim (const std::string& simName)
{
    const std::string s = str_toupper_c(simName);
    if (s == SIM_NAME_MSFS)         sim = SIM_MSFS;
    else if (s == SIM_NAME_XP12)    sim = SIM_XP12;
    else return false;
    return true;
}

// Name of the simulator as used on the command line
const char* LBConfig::SimName (simTypeE _sim)
{
    switch (_sim) {
        case SIM_MSFS:  return SIM_NAME_MSFS;
        case SIM_XP12:  return SIM_NAME_XP12;
        case SIM_NONE:  break;
    }
    return "?";
}

// navdata path defaults to a per-simulator database
std::string LBConfig::GetNavdataPath () const
{
    if (!navdataPath.empty())
        return navdataPath;
    return sim == SIM_MSFS ? PATH_NAVDATA_MSFS : PATH_NAVDATA_XP12;
}

/// Converts to an integer within the given range
static bool cfgToInt (const std::string& sFileName, const std::string& key,
                      const std::string& val, int lo, int hi, int& out)
{
    try {
        size_t pos = 0;
        const int i = std::stoi(val, &pos);
        if (pos != val.size() || !between(i, lo, hi)) {
            LOG_MSG(logWARN, ERR_CFG_VAL_INVALID, sFileName.c_str(), key.c_str(), val.c_str());
            return false;
        }
        out = i;
        return true;
    }
    catch (const std::logic_error& e) {         // std::invalid_argument, std::out_of_range
        LOG_MSG(logWARN, ERR_CFG_FILE_VALUE, key.c_str(), val.c_str(), e.what());
        return false;
    }
}

// Sets one config value from its textual representation
bool LBConfig::SetCfgValue (const std::string& key, const std::string& val,
                            const std::string& sFileName)
{
    int i = 0;
    if (key == CFG_LOG_LEVEL) {
        if (!cfgToInt(sFileName, key, val, logDEBUG, logMSG, i)) return false;
        logLevel = i;
    }
    else if (key == CFG_LOG_FILE)           logFile = val;
    else if (key == CFG_NAVDATA_PATH)       navdataPath = val;
    else if (key == CFG_NAVDATA_BUILD_IDX) {
        if (!cfgToInt(sFileName, key, val, 0, 1, i)) return false;
        bBuildAptIdx = i != 0;
    }
    else if (key == CFG_LOGBOOK_PATH)       logbookPath = val;
    else if (key == CFG_XP_HOST)            xpHost = val;
    else if (key == CFG_XP_PORT) {
        if (!cfgToInt(sFileName, key, val, 1, 65535, i)) return false;
        xpPort = i;
    }
    else if (key == CFG_XP_TIMEOUT) {
        if (!cfgToInt(sFileName, key, val, XP_TIMEOUT_MIN_MS, XP_TIMEOUT_MAX_MS, i)) return false;
        xpTimeout_ms = i;
    }
    else if (key == CFG_MSFS_POLL_INTVL) {
        if (!cfgToInt(sFileName, key, val, MSFS_POLL_MIN_MS, MSFS_POLL_MAX_MS, i)) return false;
        msfsPollIntvl_ms = i;
    }
    else {
        // unknown config entry, ignore
        LOG_MSG(logWARN,ERR_CFG_FILE_IGNORE, key.c_str(), sFileName.c_str());
        return false;
    }
    return true;
}

// Reads the config file
bool LBConfig::LoadConfigFile (const std::string& sFileName)
{
    std::ifstream fIn (sFileName);
    if (!fIn) {
        // if there is no config file just return...that's no problem, we use defaults
        if (errno == ENOENT) {
            LOG_MSG(logINFO, MSG_CFG_DEFAULTS, sFileName.c_str());
            return true;
        }
        
        // something else happened
        char sErr[SERR_LEN];
        strerror_s(sErr, sizeof(sErr), errno);
        LOG_MSG(logERR, ERR_CFG_FILE_OPEN_IN,
                sFileName.c_str(), sErr);
        return false;
    }
    
    // *** VERSION ***
    // first line is supposed to be the version, read entire line
    std::vector<std::string> ln;
    std::string lnBuf;
    if (!safeGetline(fIn, lnBuf) ||                     // read a line
        (ln = str_tokenize(lnBuf, " ")).size() != 2 ||  // split into two words
        ln[0] != LOGBOOK)                               // 1. is Logbook
    {
        LOG_MSG(logERR, ERR_CFG_FILE_VER, sFileName.c_str(), lnBuf.c_str());
        return false;
    }
    if (ln[1] != LOGBOOK_VERSION)
        LOG_MSG(logWARN, ERR_CFG_FILE_VER_UNEXP, sFileName.c_str(),
                ln[1].c_str(), LOGBOOK_VERSION);
    
    // then follow the config entries 'key <space> value'
    int errCnt = 0;
    while (fIn && errCnt <= ERR_CFG_FILE_MAXWARN) {
        safeGetline(fIn, lnBuf);
        trim(lnBuf);
        // skip empty lines and comments without warning
        if (lnBuf.empty() || lnBuf.front() == '#') continue;
        
        // key is the first word, value is the rest of the line (paths may contain spaces)
        const size_t sep = lnBuf.find_first_of(" \t");
        if (sep == std::string::npos) {
            LOG_MSG(logWARN,ERR_CFG_FILE_WORDS, sFileName.c_str(), lnBuf.c_str());
            errCnt++;
            continue;
        }
        const std::string key = lnBuf.substr(0, sep);
        std::string val = lnBuf.substr(sep+1);
        trim(val);
        
        if (!SetCfgValue(key, val, sFileName))
            errCnt++;
    }
    
    // problem was not just EOF?
    if (!fIn && !fIn.eof()) {
        char sErr[SERR_LEN];
        strerror_s(sErr, sizeof(sErr), errno);
        LOG_MSG(logERR, ERR_CFG_FILE_READ,
                sFileName.c_str(), sErr);
        return false;
    }
    
    // too many warnings?
    if (errCnt > ERR_CFG_FILE_MAXWARN) {
        LOG_MSG(logERR, ERR_CFG_FILE_TOOMANY);
        return false;
    }
    
    LOG_MSG(logINFO, MSG_CFG_READ, sFileName.c_str());
    return true;
}
