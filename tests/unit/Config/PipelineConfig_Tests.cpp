/*
 * ClusterSig - PE Header Clustering and Signature Synthesis
 * Copyright (C) 2026 ShadowStrike Security
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * @file PipelineConfig_Tests.cpp
 * @brief Configuration defaults, JSON loading, overrides and validation.
 */

#include <gtest/gtest.h>
#include "../../../src/Config/PipelineConfig.hpp"
#include "../TestHelpers.hpp"

#include <string>

using namespace ClusterSig::Config;
using ClusterSig::Utils::JSON::Json;

// ============================================================================
// Test Fixture
// ============================================================================

class PipelineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_config = PipelineConfig{};
        m_err = ConfigError{};
    }

    void TearDown() override {
    }

    PipelineConfig m_config;
    ConfigError m_err;
};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(PipelineConfigTest, Defaults_AreValid) {
    EXPECT_EQ(m_config.author, "ClusterSig");
    EXPECT_EQ(m_config.clusterType, "dbscan");
    EXPECT_EQ(m_config.outputDirectory, std::filesystem::path("rules"));
    EXPECT_EQ(m_config.extension, "yar");
    EXPECT_FALSE(m_config.experimental);
    EXPECT_TRUE(m_config.validateRules);
    EXPECT_TRUE(m_config.preprocess.scale);
    EXPECT_FALSE(m_config.preprocess.components.has_value());
    EXPECT_TRUE(Validate(m_config, &m_err));
}

// ============================================================================
// FromJson
// ============================================================================

TEST_F(PipelineConfigTest, FromJson_ReadsAllSections) {
    const Json doc = Json::parse(R"({
        "author": "Team",
        "contact": "team@example.org",
        "clusterType": "kmeans",
        "experimental": true,
        "validateRules": false,
        "output": { "directory": "out/rules", "extension": "yara" },
        "preprocess": { "scale": false, "components": 12 },
        "log": { "level": "warn", "toFile": true, "directory": "var/log", "jsonLines": true }
    })");
    ASSERT_TRUE(FromJson(doc, m_config, &m_err)) << m_err.message;

    EXPECT_EQ(m_config.author, "Team");
    EXPECT_EQ(m_config.contact, "team@example.org");
    EXPECT_EQ(m_config.clusterType, "kmeans");
    EXPECT_TRUE(m_config.experimental);
    EXPECT_FALSE(m_config.validateRules);
    EXPECT_EQ(m_config.outputDirectory, std::filesystem::path("out/rules"));
    EXPECT_EQ(m_config.extension, "yara");
    EXPECT_FALSE(m_config.preprocess.scale);
    ASSERT_TRUE(m_config.preprocess.components.has_value());
    EXPECT_EQ(*m_config.preprocess.components, 12u);
    EXPECT_EQ(m_config.log.level, "warn");
    EXPECT_TRUE(m_config.log.toFile);
    EXPECT_TRUE(m_config.log.jsonLines);
    EXPECT_TRUE(m_config.log.toConsole);
}

TEST_F(PipelineConfigTest, FromJson_MissingKeysKeepDefaults) {
    ASSERT_TRUE(FromJson(Json::object(), m_config, &m_err));
    EXPECT_EQ(m_config.author, "ClusterSig");
    EXPECT_EQ(m_config.log.level, "info");
}

TEST_F(PipelineConfigTest, FromJson_WrongTypesAreFormatErrors) {
    EXPECT_FALSE(FromJson(Json::parse(R"({"author": 5})"), m_config, &m_err));
    EXPECT_EQ(m_err.kind, ConfigErrorKind::Format);

    m_err = ConfigError{};
    EXPECT_FALSE(FromJson(Json::parse(R"({"log": "debug"})"), m_config, &m_err));
    EXPECT_EQ(m_err.kind, ConfigErrorKind::Format);

    m_err = ConfigError{};
    EXPECT_FALSE(FromJson(Json::parse(R"({"preprocess": {"components": 0}})"), m_config, &m_err));
    EXPECT_EQ(m_err.kind, ConfigErrorKind::Format);

    EXPECT_FALSE(FromJson(Json::parse("[1, 2]"), m_config));
}

TEST_F(PipelineConfigTest, FromJson_AutoComponents) {
    m_config.preprocess.components = 4;
    ASSERT_TRUE(FromJson(Json::parse(R"({"preprocess": {"components": "auto"}})"), m_config));
    EXPECT_FALSE(m_config.preprocess.components.has_value());
}

// ============================================================================
// LoadConfig
// ============================================================================

TEST_F(PipelineConfigTest, Load_FromFile) {
    ClusterSigTest::ScratchDir dir;
    ClusterSigTest::WriteText(dir / "config.json",
        "{\n  // comments are allowed\n  \"author\": \"FromFile\"\n}\n");
    ASSERT_TRUE(LoadConfig(dir / "config.json", m_config, &m_err)) << m_err.message;
    EXPECT_EQ(m_config.author, "FromFile");
}

TEST_F(PipelineConfigTest, Load_MissingFileIsIoError) {
    ClusterSigTest::ScratchDir dir;
    EXPECT_FALSE(LoadConfig(dir / "none.json", m_config, &m_err));
    EXPECT_EQ(m_err.kind, ConfigErrorKind::Io);
}

TEST_F(PipelineConfigTest, Load_InvalidJsonIsFormatError) {
    ClusterSigTest::ScratchDir dir;
    ClusterSigTest::WriteText(dir / "config.json", "{ \"author\": ");
    EXPECT_FALSE(LoadConfig(dir / "config.json", m_config, &m_err));
    EXPECT_EQ(m_err.kind, ConfigErrorKind::Format);
}

// ============================================================================
// Overrides and validation
// ============================================================================

TEST_F(PipelineConfigTest, Overrides_ReplaceOnlyGivenValues) {
    m_config.experimental = true;
    ConfigOverrides overrides;
    overrides.author = "cli";
    overrides.outputDirectory = "cli-rules";
    overrides.verbose = true;
    ApplyOverrides(overrides, m_config);

    EXPECT_EQ(m_config.author, "cli");
    EXPECT_EQ(m_config.outputDirectory, std::filesystem::path("cli-rules"));
    EXPECT_EQ(m_config.clusterType, "dbscan");
    EXPECT_EQ(m_config.log.level, "debug");
    EXPECT_TRUE(m_config.experimental);
}

TEST_F(PipelineConfigTest, Validate_UnsupportedClusterTypeIsUsage) {
    m_config.clusterType = "hdbscan";
    EXPECT_FALSE(Validate(m_config, &m_err));
    EXPECT_EQ(m_err.kind, ConfigErrorKind::Usage);

    m_config.clusterType = "meanshift";
    EXPECT_TRUE(Validate(m_config));
}

TEST_F(PipelineConfigTest, Validate_BadLevelAndExtension) {
    m_config.log.level = "chatty";
    EXPECT_FALSE(Validate(m_config, &m_err));
    EXPECT_EQ(m_err.kind, ConfigErrorKind::Format);

    m_config.log.level = "WARNING";
    m_config.extension = "../yar";
    m_err = ConfigError{};
    EXPECT_FALSE(Validate(m_config, &m_err));
    EXPECT_EQ(m_err.kind, ConfigErrorKind::Format);
}

// ============================================================================
// Conversions
// ============================================================================

TEST_F(PipelineConfigTest, Convert_CarriesSettingsThrough) {
    m_config.experimental = true;
    m_config.author = "a";
    m_config.clusterType = "kmeans";
    m_config.validateRules = false;

    EXPECT_TRUE(m_config.ToParseOptions().experimental);
    const auto synthesis = m_config.ToSynthesisOptions();
    EXPECT_EQ(synthesis.author, "a");
    EXPECT_EQ(synthesis.clusterType, "kmeans");
    EXPECT_TRUE(synthesis.experimental);
    EXPECT_FALSE(m_config.ToRuleOutputOptions().validate);

    ClusterSig::Utils::LoggerConfig logger;
    m_config.log.level = "error";
    ASSERT_TRUE(m_config.ToLoggerConfig(logger));
    EXPECT_EQ(logger.minimalLevel, ClusterSig::Utils::LogLevel::Error);

    m_config.log.level = "loud";
    EXPECT_FALSE(m_config.ToLoggerConfig(logger, &m_err));
}
