/// @file       Constants.h
/// @brief      Constant values, mostly message texts and unit conversions
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

#ifndef Constants_h
#define Constants_h

//
// MARK: Version Information (CHANGE VERSION IN CMakeLists.txt)
//

#ifndef LOGBOOK_VER_MAJOR
#define LOGBOOK_VER_MAJOR   1
#define LOGBOOK_VER_MINOR   0
#define LOGBOOK_VER_PATCH   0
#endif

#define LB_STR(x)           #x
#define LB_XSTR(x)          LB_STR(x)
/// Version as text, like "1.2.3"
#define LOGBOOK_VERSION     LB_XSTR(LOGBOOK_VER_MAJOR) "." LB_XSTR(LOGBOOK_VER_MINOR) "." LB_XSTR(LOGBOOK_VER_PATCH)

//MARK: Unit conversions
constexpr int M_per_NM      = 1852;     // meter per 1 nautical mile = 1/60 of a lat degree
constexpr double PI         = 3.1415926535897932384626433832795028841971693993751;
constexpr double EARTH_D_M  = 6371.0 * 2 * 1000;    // earth diameter in meter

//MARK: WGS84 ellipsoid
constexpr double WGS84_A    = 6378137.0;                    ///< [m] semi-major axis
constexpr double WGS84_F    = 1.0 / 298.257223563;          ///< flattening
constexpr double WGS84_B    = WGS84_A * (1.0 - WGS84_F);    ///< [m] semi-minor axis
constexpr int    VINCENTY_MAX_ITER = 200;                   ///< iteration limit of Vincenty's formulae
constexpr double VINCENTY_EPS      = 1e-12;                 ///< convergence criterion [rad]

//MARK: Telemetry
constexpr int    XP_DEFAULT_PORT     = 52000;       ///< TCP port the X-Plane producer listens on
#define XP_LISTEN_ADDR          "127.0.0.1"         ///< the X-Plane producer only accepts local clients
constexpr int    XP_TIMEOUT_MS       = 1000;        ///< [ms] default receive timeout of the streaming connection
constexpr int    XP_TIMEOUT_MIN_MS   = 100;
constexpr int    XP_TIMEOUT_MAX_MS   = 10000;
constexpr int    MSFS_POLL_INTVL_MS  = 1000;        ///< [ms] polling window of the native connection
constexpr int    MSFS_POLL_MIN_MS    = 50;
constexpr int    MSFS_POLL_MAX_MS    = 5000;
constexpr int    MSFS_IDLE_SLEEP_MS  = 50;          ///< [ms] sleep between two empty native dispatches
constexpr size_t NET_BUF_SIZE        = 4096;        ///< receive buffer size
constexpr size_t FRAME_MAX_LEN       = 0xFFFF;      ///< longest record a 2-byte length prefix can carry
constexpr int    SIM_DATA_NUM_FIELDS = 7;           ///< fields in a telemetry record
constexpr float  XP_FLIGHT_LOOP_INTVL = 1.0f;       ///< [s] producer plugin's publishing interval
constexpr int    XP_MAX_ENGINES      = 16;          ///< size of sim/flightmodel/engine/ENGN_running

//MARK: MSFS native record layout
constexpr size_t MSFS_TITLE_LEN      = 128;         ///< SIMCONNECT_DATATYPE_STRING128
constexpr size_t MSFS_ATC_ID_LEN     = 32;          ///< SIMCONNECT_DATATYPE_STRING32
constexpr size_t MSFS_NUM_ENGINES    = 4;
constexpr size_t MSFS_RECORD_LEN     = MSFS_TITLE_LEN + (MSFS_NUM_ENGINES + 3) * sizeof(double) + MSFS_ATC_ID_LEN;
constexpr unsigned MSFS_DEFINE_ID    = 0;           ///< data definition id of our record
#define MSFS_ICAO_UNKNOWN       "N/A"

//MARK: Texts
#define LOGBOOK                 "Logbook"
#define LOGBOOK_XP              "Logbook XP12"
#define LOGBOOK_XP_SIG          "logbook.xp12"
#define LOGBOOK_XP_DESCRIPTION  "Publishes aircraft telemetry to Logbook clients via TCP"
#define WHITESPACE              " \t\f\v\r\n"
#define SIM_NAME_MSFS           "MSFS"
#define SIM_NAME_XP12           "XP12"
#define CSV_TRUE                "true"
#define CSV_FALSE               "false"
constexpr char CSV_COMMA_REPL   = ';';  ///< replaces commas in text fields of telemetry records
#define LOGBOOK_CSV_HEADER      { "Aircraft Name", "Aircraft ICAO", "Registration", \
                                  "Taxi Time", "Departure ICAO", "Departure Time", \
                                  "Arrival ICAO", "Arrival Time", "Shutdown Time" }

//MARK: File paths
#define PATH_CONFIG_FILE        "Logbook.prf"
#define PATH_LOGBOOK_CSV        "logbook.csv"
#define PATH_NAVDATA_MSFS       "navdata/msfs.sqlite"
#define PATH_NAVDATA_XP12       "navdata/xp12.sqlite"
#if IBM
#define PATH_DELIM '\\'                         ///< Windows path delimiter
#else
#define PATH_DELIM '/'                          ///< MacOS/Linux path delimiter
#endif

//MARK: Config file keys
#define CFG_LOG_LEVEL           "log_level"
#define CFG_LOG_FILE            "log_file"
#define CFG_NAVDATA_PATH        "navdata_path"
#define CFG_NAVDATA_BUILD_IDX   "navdata_build_index"
#define CFG_LOGBOOK_PATH        "logbook_path"
#define CFG_XP_HOST             "xp_host"
#define CFG_XP_PORT             "xp_port"
#define CFG_XP_TIMEOUT          "xp_timeout_ms"
#define CFG_MSFS_POLL_INTVL     "msfs_poll_interval_ms"

//MARK: Messages
#define MSG_STARTUP             LOGBOOK " %s starting up..."
#define MSG_USAGE               "USAGE: %s <SIM NAME> [config file], valid sim names: " SIM_NAME_MSFS ", " SIM_NAME_XP12
#define MSG_CFG_READ            "Read config file '%s'"
#define MSG_CFG_DEFAULTS        "No config file '%s', using defaults"
#define MSG_NAVDATA_OPEN        "Opened navigation data '%s'"
#define MSG_NAVDATA_INDEX       "Spatial airport index ready, %d airports added"
#define MSG_LOGBOOK_OPEN        "Writing flights to '%s'"
#define MSG_SIM_CONNECTING      "%s: Connecting to %s"
#define MSG_SIM_OPEN            "%s: Simulator connection open"
#define MSG_SIM_QUIT            "%s: Simulator closed the connection"
#define MSG_FLIGHT_NEW          "New flight tracked for %s"
#define MSG_FLIGHT_STATE        "%s: %s -> %s"
#define MSG_FLIGHT_DEPARTED     "Departed %s at %s"
#define MSG_FLIGHT_ARRIVED      "Arrived at %s at %s"
#define MSG_FLIGHT_LOGGED       "Flight logged: %s"
#define MSG_FLIGHT_DROPPED      "Dropping incomplete flight of %s (state %s)"
#define MSG_XP_LISTENING        "Listening for " LOGBOOK " clients on %s:%d"
#define MSG_XP_CLIENT_NEW       "Client connected from %s (%d clients)"
#define MSG_XP_CLIENT_GONE      "Client dropped (%d clients left)"
#define MSG_BENCH_RESULT        "Client %d: %ld frames, %ld malformed"

//MARK: Error Texts
constexpr int SERR_LEN = 100;                   // size of buffer for IO error texts (strerror_s)
constexpr int ERR_CFG_FILE_MAXWARN = 10;        // maximum number of warnings while reading config file, then: dead
#define ERR_ASSERT              "ASSERT FAILED: %s"
#define ERR_TOP_LEVEL_EXCEPTION "Caught top-level exception! %s"
#define ERR_CFG_FILE_OPEN_IN    "Could not open '%s': %s"
#define ERR_CFG_FILE_VER        "Config file '%s' first line: Unsupported format or version: %s"
#define ERR_CFG_FILE_VER_UNEXP  "Config file '%s' first line: Unexpected version %s, expected %s...trying to continue"
#define ERR_CFG_FILE_IGNORE     "Ignoring unknown entry '%s' from config file '%s'"
#define ERR_CFG_FILE_WORDS      "Expected two words (key, value) in config file '%s', line '%s': ignored"
#define ERR_CFG_FILE_READ       "Could not read from '%s': %s"
#define ERR_CFG_FILE_TOOMANY    "Too many warnings"
#define ERR_CFG_FILE_VALUE      "%s: Could not convert '%s' to a number: %s"
#define ERR_CFG_VAL_INVALID     "Value invalid in '%s' for '%s': %s"
#define ERR_CFG_UNKNOWN_SIM     "Invalid sim provided: %s"
#define ERR_LOG_FILE_OPEN       "Could not open log file '%s': %s"
#define ERR_NAVDATA_OPEN        "Could not open navigation data '%s': %s"
#define ERR_NAVDATA_SQL         "Navigation data '%s': %s failed: %s"
#define ERR_APT_NOT_FOUND       "%s: No airport found at %s, staying in state %s"
#define ERR_FLIGHT_IDENT_CHANGE "Aircraft identity changed during flight from '%s' to '%s', keeping the first one"
#define ERR_LOGBOOK_OPEN        "Could not open logbook '%s': %s"
#define ERR_LOGBOOK_WRITE       "Could not write to logbook '%s': %s"
#define ERR_FRAME_TOO_LONG      "Record of %lu bytes is too long for a frame"
#define ERR_RECORD_FIELDS       "Expected %d fields, found %lu"
#define ERR_RECORD_FIELD        "Field '%s' cannot be parsed: '%s'"
#define ERR_RECORD_MALFORMED    "%s: Skipping malformed record: %s"
#define ERR_MSFS_RECORD_LEN     "Native record of %lu bytes is shorter than the expected %lu bytes"
#define ERR_MSFS_RECORD_STR     "Native record field '%s' is not zero-terminated"
#define ERR_MSFS_UNHANDLED      "%s: Unhandled dispatch message %u"
#define ERR_MSFS_UNAVAIL        "SimConnect is only available on Windows"
#define ERR_MSFS_CONNECT        "Could not connect to SimConnect: 0x%08lx"
#define ERR_MSFS_DEFINE         "SimConnect data definition for '%s' failed: 0x%08lx"
#define ERR_TCP_LISTENACCEPT    "%s: Error opening the TCP port on %s:%d: %s"
#define ERR_DATAREF_FIND        "Could not find DataRef: %s"

//MARK: Debug Texts
#define DBG_RECEIVED_BYTES      "%s: Received %ld bytes"
#define DBG_SIM_UNKNOWN         "%s: Ignoring unknown message"
#define DBG_APT_FOUND           "Airport %s found at %s"
#define DBG_FRAME_SENT          "Sent %lu byte frame to %d clients"

#endif /* Constants_h */
