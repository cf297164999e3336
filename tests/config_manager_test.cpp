#include <gtest/gtest.h>

#include "config_manager.hpp"
#include "xml_loader.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace
{

    std::filesystem::path writeTempConfig(const std::string& name, const std::string& xml)
    {
        auto          path = std::filesystem::temp_directory_path() / name;
        std::ofstream ofs(path);
        ofs << xml;
        ofs.close();
        return path;
    }

} // namespace

TEST(ConfigManager, ParsesSampleConfig)
{
    const auto configPath =
        std::filesystem::path(__FILE__).parent_path().parent_path() / "config" / "sample_hub.xml";
    config::XmlConfigurationLoader loader;
    auto                           cfg = loader.load(configPath.string());

    EXPECT_EQ(cfg.name, "livelink-dev");
    EXPECT_EQ(cfg.server.host, "0.0.0.0");
    EXPECT_EQ(cfg.server.port, 8080);
    EXPECT_EQ(cfg.server.threads, 4u);
    EXPECT_EQ(cfg.realtime.broadcastQueue, 1000u);
    EXPECT_EQ(cfg.realtime.keepaliveSec, 54u);
    EXPECT_EQ(cfg.realtime.readTimeoutSec, 60u);
    EXPECT_EQ(cfg.realtime.refreshSec, 30u);
    EXPECT_EQ(cfg.realtime.initialWindowDays, 30u);
    EXPECT_EQ(cfg.realtime.refreshWindowDays, 1u);
    EXPECT_EQ(cfg.realtime.sendBufferBytes, 1048576u);
    EXPECT_EQ(cfg.analytics.baseUrl, "http://127.0.0.1:8081");
    EXPECT_EQ(cfg.analytics.cacheTtlSec, 300u);
    ASSERT_TRUE(cfg.debug);
    EXPECT_EQ(cfg.debug->fileName, "logs/livelink.log");
    EXPECT_EQ(cfg.debug->level, 'I');
}

TEST(ConfigManager, AppliesDefaultsForOmittedSections)
{
    auto path = writeTempConfig("livelink_minimal.xml",
                                "<Hub><Analytics baseUrl=\"https://analytics.internal\"/></Hub>");
    config::ConfigManager mgr;
    auto                  cfg = mgr.loadHubConfigFromXml(path.string());
    mgr.validateHubConfig(cfg);

    EXPECT_EQ(cfg.name, "livelink");
    EXPECT_EQ(cfg.server.port, 8080);
    EXPECT_EQ(cfg.realtime.broadcastQueue, 1000u);
    EXPECT_EQ(cfg.realtime.writeTimeoutMs, 1000u);
    EXPECT_EQ(cfg.realtime.keepaliveSec, 54u);
    EXPECT_EQ(cfg.realtime.readTimeoutSec, 60u);
    EXPECT_EQ(cfg.realtime.fetchWorkers, 4u);
    EXPECT_EQ(cfg.realtime.sendBufferBytes, 1048576u);
    EXPECT_EQ(cfg.analytics.timeoutMs, 5000u);
    EXPECT_EQ(cfg.analytics.cacheTtlSec, 0u);
    EXPECT_TRUE(cfg.analytics.apiKey.empty());
    EXPECT_FALSE(cfg.debug);
}

TEST(ConfigManager, SchemaValidationReportsEveryIssueWithLines)
{
    auto path = writeTempConfig("livelink_issues.xml",
                                "<Hub>\n"
                                "  <Server port=\"8080\" colour=\"blue\"/>\n"
                                "  <Cluster nodes=\"3\"/>\n"
                                "  <Debug level=\"D\"/>\n"
                                "</Hub>\n");
    config::ConfigManager mgr;
    auto                  issues = mgr.validateXmlSchema(path.string());

    ASSERT_EQ(issues.size(), 4u);
    EXPECT_EQ(issues[0].line, 2);
    EXPECT_NE(issues[0].message.find("colour"), std::string::npos);
    EXPECT_EQ(issues[1].line, 3);
    EXPECT_NE(issues[1].message.find("Cluster"), std::string::npos);
    EXPECT_NE(issues[2].message.find("Analytics"), std::string::npos);
    EXPECT_EQ(issues[3].line, 4);
    EXPECT_NE(issues[3].message.find("fileName"), std::string::npos);
}
