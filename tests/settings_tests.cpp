#include <gtest/gtest.h>

#include "bytes/standard.hpp"
#include "io/settings.hpp"
#include "util/result.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include <yaml-cpp/yaml.h>

TEST(SettingsTest, Defaults) {
    Settings settings = getDefaultSettings();
    EXPECT_EQ(settings.inputStandard, &getBinaryStandard());
    EXPECT_EQ(settings.outputStandard, nullptr);
    EXPECT_FALSE(settings.outputUnit.has_value());
    EXPECT_EQ(settings.jsonIndent, 4);
    EXPECT_EQ(&getOutputStandard(settings), &getBinaryStandard());
}

TEST(SettingsTest, MinimalSettings) {
    Result<Settings> settings = loadSettings(YAML::Load("input-standard: si"));
    ASSERT_TRUE(settings.isValue());
    EXPECT_EQ(settings.getValue().inputStandard, &getDecimalStandard());
    EXPECT_EQ(&getOutputStandard(settings.getValue()), &getDecimalStandard());
    EXPECT_FALSE(settings.getValue().outputUnit.has_value());
    EXPECT_EQ(settings.getValue().jsonIndent, 4);
}

TEST(SettingsTest, FullSettings) {
    const std::string Text =
        "input-standard: MEM\n"
        "output:\n"
        "  standard: iec\n"
        "  unit: GiB\n"
        "json-indent: 2\n";

    Result<Settings> settings = loadSettings(YAML::Load(Text));
    ASSERT_TRUE(settings.isValue());
    EXPECT_EQ(settings.getValue().inputStandard, &getLegacyBinaryStandard());
    EXPECT_EQ(settings.getValue().outputStandard, &getBinaryStandard());
    EXPECT_EQ(settings.getValue().outputUnit.value(), "GiB");
    EXPECT_EQ(settings.getValue().jsonIndent, 2);
}

TEST(SettingsTest, AutoUnit) {
    Result<Settings> settings = loadSettings(YAML::Load("input-standard: iec\noutput:\n  unit: auto\n"));
    ASSERT_TRUE(settings.isValue());
    EXPECT_FALSE(settings.getValue().outputUnit.has_value());
}

TEST(SettingsTest, MissingInputStandard) {
    Result<Settings> settings = loadSettings(YAML::Load("json-indent: 2"));
    ASSERT_TRUE(settings.isError());
    EXPECT_EQ(settings.getErrorKind(), ErrorKind::Configuration);
    EXPECT_NE(settings.getError().message.find("input-standard"), std::string::npos);
}

TEST(SettingsTest, InvalidFields) {
    Result<Settings> unknownStandard = loadSettings(YAML::Load("input-standard: metric"));
    ASSERT_TRUE(unknownStandard.isError());
    EXPECT_EQ(unknownStandard.getErrorKind(), ErrorKind::Configuration);
    EXPECT_NE(unknownStandard.getError().message.find("input-standard"), std::string::npos);

    // The unit is checked against the output standard, not the input standard
    Result<Settings> wrongUnit = loadSettings(YAML::Load("input-standard: iec\noutput:\n  standard: si\n  unit: GiB\n"));
    ASSERT_TRUE(wrongUnit.isError());
    EXPECT_NE(wrongUnit.getError().message.find("output::unit"), std::string::npos);

    Result<Settings> badIndent = loadSettings(YAML::Load("input-standard: iec\njson-indent: 40\n"));
    ASSERT_TRUE(badIndent.isError());
    EXPECT_NE(badIndent.getError().message.find("json-indent"), std::string::npos);
}

TEST(SettingsTest, LoadFromFile) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / "byteunits_settings_test.yaml";
    {
        std::ofstream file(path);
        file << "input-standard: si\noutput:\n  standard: mem\n";
    }

    Result<Settings> settings = loadSettingsFile(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(settings.isValue());
    EXPECT_EQ(settings.getValue().inputStandard, &getDecimalStandard());
    EXPECT_EQ(settings.getValue().outputStandard, &getLegacyBinaryStandard());
}

TEST(SettingsTest, MissingFile) {
    Result<Settings> settings = loadSettingsFile("does/not/exist/settings.yaml");
    ASSERT_TRUE(settings.isError());
    EXPECT_EQ(settings.getErrorKind(), ErrorKind::Configuration);
    EXPECT_NE(settings.getError().message.find("does/not/exist/settings.yaml"), std::string::npos);
}
