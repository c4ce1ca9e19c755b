// Tests for command line and config file handling

#include <gtest/gtest.h>
#include "Logbook.h"

class ConfigTest : public ::testing::Test {
protected:
    LBConfig cfg;
    std::string path;
    
    void SetUp() override {
        path = ::testing::TempDir() + "logbook_cfg_" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".prf";
        std::remove(path.c_str());
    }
    
    void TearDown() override {
        std::remove(path.c_str());
    }
    
    void WriteCfg (const std::string& content) {
        std::ofstream f(path, std::ios_base::binary);
        f << content;
    }
};

TEST_F(ConfigTest, Defaults) {
    EXPECT_EQ(SIM_NONE, cfg.GetSim());
    EXPECT_EQ(PATH_LOGBOOK_CSV, cfg.GetLogbookPath());
    EXPECT_EQ("127.0.0.1", cfg.GetXPHost());
    EXPECT_EQ(XP_DEFAULT_PORT, cfg.GetXPPort());
    EXPECT_EQ(XP_TIMEOUT_MS, cfg.GetXPTimeout());
    EXPECT_EQ(MSFS_POLL_INTVL_MS, cfg.GetMsfsPollIntvl());
    EXPECT_TRUE(cfg.ShallBuildAptIndex());
    EXPECT_TRUE(cfg.GetLogFile().empty());
}

TEST_F(ConfigTest, ParseArgs) {
    std::string cfgPath;
    const char* argv1[] = { "logbook", "XP12" };
    EXPECT_TRUE(cfg.ParseArgs(2, argv1, cfgPath));
    EXPECT_EQ(SIM_XP12, cfg.GetSim());
    EXPECT_EQ(PATH_CONFIG_FILE, cfgPath);
    EXPECT_EQ(PATH_NAVDATA_XP12, cfg.GetNavdataPath());
    
    const char* argv2[] = { "logbook", "msfs", "my.prf" };
    EXPECT_TRUE(cfg.ParseArgs(3, argv2, cfgPath));
    EXPECT_EQ(SIM_MSFS, cfg.GetSim());
    EXPECT_EQ("my.prf", cfgPath);
    EXPECT_EQ(PATH_NAVDATA_MSFS, cfg.GetNavdataPath());
}

TEST_F(ConfigTest, ParseArgsInvalid) {
    std::string cfgPath;
    const char* argv1[] = { "logbook" };
    EXPECT_FALSE(cfg.ParseArgs(1, argv1, cfgPath));
    
    const char* argv2[] = { "logbook", "P3D" };
    EXPECT_FALSE(cfg.ParseArgs(2, argv2, cfgPath));
    
    const char* argv3[] = { "logbook", "XP12", "a.prf", "extra" };
    EXPECT_FALSE(cfg.ParseArgs(4, argv3, cfgPath));
}

TEST_F(ConfigTest, MissingFileMeansDefaults) {
    EXPECT_TRUE(cfg.LoadConfigFile(path));
    EXPECT_EQ(XP_DEFAULT_PORT, cfg.GetXPPort());
}

TEST_F(ConfigTest, ReadAllValues) {
    WriteCfg(LOGBOOK " " LOGBOOK_VERSION "\n"
             "# streaming connection\n"
             "xp_host 192.168.1.20\n"
             "xp_port 52001\r\n"
             "xp_timeout_ms 500\n"
             "\n"
             "msfs_poll_interval_ms 250\n"
             "navdata_path  /data/little navmap.sqlite \n"
             "navdata_build_index 0\n"
             "logbook_path flights.csv\n"
             "log_file logbook.log\n"
             "log_level 2\n");
    EXPECT_TRUE(cfg.LoadConfigFile(path));
    EXPECT_EQ("192.168.1.20", cfg.GetXPHost());
    EXPECT_EQ(52001, cfg.GetXPPort());
    EXPECT_EQ(500, cfg.GetXPTimeout());
    EXPECT_EQ(250, cfg.GetMsfsPollIntvl());
    EXPECT_EQ("/data/little navmap.sqlite", cfg.GetNavdataPath());
    EXPECT_FALSE(cfg.ShallBuildAptIndex());
    EXPECT_EQ("flights.csv", cfg.GetLogbookPath());
    EXPECT_EQ("logbook.log", cfg.GetLogFile());
    EXPECT_EQ(logWARN, cfg.GetLogLevel());
}

TEST_F(ConfigTest, InvalidValuesKeepDefaults) {
    WriteCfg(LOGBOOK " " LOGBOOK_VERSION "\n"
             "xp_port 99999\n"
             "xp_timeout_ms fast\n"
             "unknown_key 1\n"
             "lonely\n");
    EXPECT_TRUE(cfg.LoadConfigFile(path));
    EXPECT_EQ(XP_DEFAULT_PORT, cfg.GetXPPort());
    EXPECT_EQ(XP_TIMEOUT_MS, cfg.GetXPTimeout());
}

TEST_F(ConfigTest, TimeoutRange) {
    EXPECT_FALSE(cfg.SetCfgValue(CFG_XP_TIMEOUT, "50", path));
    EXPECT_TRUE(cfg.SetCfgValue(CFG_XP_TIMEOUT, "100", path));
    EXPECT_EQ(100, cfg.GetXPTimeout());
}

TEST_F(ConfigTest, PollIntervalRange) {
    EXPECT_FALSE(cfg.SetCfgValue(CFG_MSFS_POLL_INTVL, "20", path));
    EXPECT_FALSE(cfg.SetCfgValue(CFG_MSFS_POLL_INTVL, "6000", path));
    EXPECT_EQ(MSFS_POLL_INTVL_MS, cfg.GetMsfsPollIntvl());
    EXPECT_TRUE(cfg.SetCfgValue(CFG_MSFS_POLL_INTVL, "50", path));
    EXPECT_EQ(50, cfg.GetMsfsPollIntvl());
    EXPECT_TRUE(cfg.SetCfgValue(CFG_MSFS_POLL_INTVL, "5000", path));
    EXPECT_EQ(5000, cfg.GetMsfsPollIntvl());
}

TEST_F(ConfigTest, TooManyErrors) {
    std::string content = LOGBOOK " " LOGBOOK_VERSION "\n";
    for (int i = 0; i <= ERR_CFG_FILE_MAXWARN; ++i)
        content += "xp_port invalid\n";
    WriteCfg(content);
    EXPECT_FALSE(cfg.LoadConfigFile(path));
}

TEST_F(ConfigTest, WrongFirstLine) {
    WriteCfg("xp_port 52001\n");
    EXPECT_FALSE(cfg.LoadConfigFile(path));
    EXPECT_EQ(XP_DEFAULT_PORT, cfg.GetXPPort());
}

TEST_F(ConfigTest, OtherVersionStillRead) {
    WriteCfg(LOGBOOK " 0.9.0\nxp_port 52002\n");
    EXPECT_TRUE(cfg.LoadConfigFile(path));
    EXPECT_EQ(52002, cfg.GetXPPort());
}
