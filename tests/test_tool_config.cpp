#include <gtest/gtest.h>
#include "finegeo/tool_config.hpp"
#include "finegeo/geohash.hpp"
#include "finegeo/log.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace finegeo;

class ToolConfigTest : public ::testing::Test {
protected:
    std::ostringstream out;
    std::ostringstream err;
    Logger logger{"test", out, err};
    ConfigParser parser;
};

// ============================================================================
// Logger
// ============================================================================

TEST_F(ToolConfigTest, LoggerPrefixesComponent) {
    logger.log("hello");
    logger.warn("careful");
    logger.error("broken");

    EXPECT_EQ(out.str(), "[test] hello\n");
    EXPECT_EQ(err.str(), "[test] WARNING: careful\n[test] ERROR: broken\n");
}

TEST_F(ToolConfigTest, LoggerDebugIsOptIn) {
    logger.debug("hidden");
    EXPECT_TRUE(err.str().empty());

    logger.setDebugEnabled(true);
    logger.debug("shown");
    EXPECT_EQ(err.str(), "[test] DEBUG: shown\n");
}

// ============================================================================
// ToolConfig
// ============================================================================

TEST_F(ToolConfigTest, Defaults) {
    ToolConfig config = ToolConfig::fromDocument(parser.parseString(""), logger);

    EXPECT_EQ(config.precision, 12);
    EXPECT_EQ(config.bits, 64);
    EXPECT_EQ(config.decodePolicy, DecodePolicy::Round);
    EXPECT_FALSE(config.debug);
    EXPECT_TRUE(err.str().empty());
}

TEST_F(ToolConfigTest, ReadsAllKeys) {
    auto doc = parser.parseString(
        "encode.precision: 7\n"
        "encode.bits: 35\n"
        "decode.policy: center\n"
        "log.debug: true\n"
    );
    ToolConfig config = ToolConfig::fromDocument(doc, logger);

    EXPECT_EQ(config.precisionChars(), 7u);
    EXPECT_EQ(config.precisionBits(), 35u);
    EXPECT_EQ(config.decodePolicy, DecodePolicy::Center);
    EXPECT_TRUE(config.debug);
}

TEST_F(ToolConfigTest, ClampsOutOfRange) {
    auto doc = parser.parseString(
        "encode.precision: 20\n"
        "encode.bits: 0\n"
    );
    ToolConfig config = ToolConfig::fromDocument(doc, logger);

    EXPECT_EQ(config.precision, 12);
    EXPECT_EQ(config.bits, 1);
    EXPECT_NE(err.str().find("encode.precision 20 out of range, using 12"), std::string::npos);
    EXPECT_NE(err.str().find("encode.bits 0 out of range, using 1"), std::string::npos);
}

TEST_F(ToolConfigTest, OversizedPrecisionIsClamped) {
    auto doc = parser.parseString("encode.precision: 4294967297\n");
    ToolConfig config = ToolConfig::fromDocument(doc, logger);

    EXPECT_EQ(config.precision, 12);
    EXPECT_NE(err.str().find("encode.precision 2147483647 out of range, using 12"),
              std::string::npos);
}

TEST_F(ToolConfigTest, UnknownDecodePolicyWarns) {
    auto doc = parser.parseString(
        "# policy\n"
        "decode.policy: nearest\n"
    );
    ToolConfig config = ToolConfig::fromDocument(doc, logger);

    EXPECT_EQ(config.decodePolicy, DecodePolicy::Round);
    EXPECT_NE(err.str().find("Line 2: unknown decode.policy 'nearest'"), std::string::npos);
}

TEST_F(ToolConfigTest, WarningNamesIncludedFile) {
    auto dir = std::filesystem::temp_directory_path() / "finegeo_tool_config_test";
    std::filesystem::create_directories(dir);
    auto sharedPath = dir / "shared.conf";
    {
        std::ofstream out(sharedPath);
        out << "# shared\n"
            << "decode.policy: middle\n";
    }

    auto doc = parser.parseString("include: shared.conf\n", dir.string() + "/");
    ToolConfig config = ToolConfig::fromDocument(doc, logger);

    EXPECT_EQ(config.decodePolicy, DecodePolicy::Round);
    std::string expected = (dir.string() + "/shared.conf") + ":2: unknown decode.policy 'middle'";
    EXPECT_NE(err.str().find(expected), std::string::npos) << err.str();

    std::filesystem::remove_all(dir);
}

TEST_F(ToolConfigTest, PolicyNames) {
    EXPECT_EQ(decodePolicyName(DecodePolicy::Round), "round");
    EXPECT_EQ(decodePolicyName(DecodePolicy::Center), "center");
    EXPECT_EQ(parseDecodePolicy("center"), DecodePolicy::Center);
    EXPECT_FALSE(parseDecodePolicy("CENTER").has_value());
}

TEST_F(ToolConfigTest, PickFollowsPolicy) {
    Box box = boundingBox("ezs42");
    ToolConfig config;

    EXPECT_EQ(config.pick(box), decode("ezs42"));
    config.decodePolicy = DecodePolicy::Center;
    EXPECT_EQ(config.pick(box), decodeCenter("ezs42"));
}
