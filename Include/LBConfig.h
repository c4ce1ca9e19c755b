/// @file       LBConfig.h
/// @brief      Configuration: command line and config file settings
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

#ifndef LBConfig_h
#define LBConfig_h

/// Supported simulators
enum simTypeE {
    SIM_NONE = 0,       ///< not yet chosen
    SIM_MSFS,           ///< Microsoft Flight Simulator via SimConnect
    SIM_XP12,           ///< X-Plane 12 via the Logbook XP12 plugin's TCP stream
};

/// All configurable values, defaults are set here
class LBConfig
{
protected:
    simTypeE    sim             = SIM_NONE;
    int         logLevel        = 1;                ///< logINFO
    std::string logFile;                            ///< additional log file, empty: none
    std::string navdataPath;                        ///< empty: default per simulator
    bool        bBuildAptIdx    = true;             ///< create/fill the airport R-tree at startup?
    std::string logbookPath     = PATH_LOGBOOK_CSV;
    std::string xpHost          = XP_LISTEN_ADDR;
    int         xpPort          = XP_DEFAULT_PORT;
    int         xpTimeout_ms    = XP_TIMEOUT_MS;
    int         msfsPollIntvl_ms = MSFS_POLL_INTVL_MS;

public:
    /// @brief Evaluates the command line `<prog> <SIM> [config file]`
    /// @param[out] cfgPath Path to the config file, defaults to PATH_CONFIG_FILE
    /// @return `false` if the command line is invalid
    bool ParseArgs (int argc, const char* const argv[], std::string& cfgPath);
    
    /// @brief Reads the config file
    /// @return `true` if read or not existing, `false` on errors
    bool LoadConfigFile (const std::string& sFileName);
    
    /// @brief Sets one config value from its textual representation
    /// @return `false` if key unknown or value invalid
    bool SetCfgValue (const std::string& key, const std::string& val,
                      const std::string& sFileName);

    /// Sets the simulator by its name, `false` if unknown
    bool SetSim (const std::string& simName);
    
    // attribute access
    simTypeE            GetSim () const                 { return sim; }
    int                 GetLogLevel () const            { return logLevel; }
    void                SetLogLevel (int lvl)           { logLevel = lvl; }
    const std::string&  GetLogFile () const             { return logFile; }
    std::string         GetNavdataPath () const;
    bool                ShallBuildAptIndex () const     { return bBuildAptIdx; }
    const std::string&  GetLogbookPath () const         { return logbookPath; }
    const std::string&  GetXPHost () const              { return xpHost; }
    int                 GetXPPort () const              { return xpPort; }
    int                 GetXPTimeout () const           { return xpTimeout_ms; }
    int                 GetMsfsPollIntvl () const       { return msfsPollIntvl_ms; }
    
    /// Name of the simulator as used on the command line
    static const char* SimName (simTypeE _sim);
};

/// The one global configuration object
extern LBConfig lbConfig;

#endif /* LBConfig_h */
