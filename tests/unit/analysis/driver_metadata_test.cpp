/// @file driver_metadata_test.cpp
/// @brief Tests for driver metadata providers

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>

#include "analysis/driver_metadata.h"
#include "common/error.h"

namespace rootscope::analysis {
namespace {

using json = nlohmann::json;

const char* kMetadataJson = R"({
    "drivers": {
        "speed": {"description": "Line speed", "unit": "m/min", "normal_range": [40, 60]},
        "temperature": {"description": "Oven temperature"},
        "broken": "not an object"
    }
})";

TEST(DriverMetadataTest, BaseNameStripsValuePrefix) {
    EXPECT_EQ(DriverBaseName("value_speed"), "speed");
    EXPECT_EQ(DriverBaseName("speed"), "speed");
    EXPECT_EQ(DriverBaseName("values_speed"), "values_speed");
}

TEST(DriverMetadataTest, LookupByBaseName) {
    auto provider = JsonDriverMetadataProvider::FromJson(json::parse(kMetadataJson));
    ASSERT_TRUE(provider.ok()) << provider.status().message();
    EXPECT_EQ(provider->Size(), 2u);

    auto speed = provider->Lookup("value_speed");
    ASSERT_TRUE(speed.has_value());
    EXPECT_EQ(speed->description, "Line speed");
    EXPECT_EQ(speed->unit, "m/min");
    ASSERT_TRUE(speed->normal_range.has_value());
    EXPECT_EQ(*speed->normal_range, json({40, 60}));

    auto plain = provider->Lookup("temperature");
    ASSERT_TRUE(plain.has_value());
    EXPECT_TRUE(plain->unit.empty());
    EXPECT_FALSE(plain->normal_range.has_value());

    EXPECT_FALSE(provider->Lookup("value_humidity").has_value());
}

TEST(DriverMetadataTest, EnrichDriverNames) {
    auto provider = JsonDriverMetadataProvider::FromJson(json::parse(kMetadataJson));
    ASSERT_TRUE(provider.ok());

    auto names = provider->EnrichDriverNames({"value_speed", "value_temperature", "value_humidity"});
    EXPECT_EQ(names["value_speed"], "Line speed (m/min)");
    EXPECT_EQ(names["value_temperature"], "Oven temperature");
    EXPECT_EQ(names["value_humidity"], "Driver humidity");
}

TEST(DriverMetadataTest, DocumentWithoutDriversIsEmpty) {
    auto provider = JsonDriverMetadataProvider::FromJson(json::object());
    ASSERT_TRUE(provider.ok());
    EXPECT_EQ(provider->Size(), 0u);
}

TEST(DriverMetadataTest, DriversMustBeAnObject) {
    auto provider = JsonDriverMetadataProvider::FromJson(json::parse(R"({"drivers": [1, 2]})"));
    ASSERT_FALSE(provider.ok());
    EXPECT_EQ(GetErrorCode(provider.status()), ErrorCode::kTypeMismatch);
}

TEST(DriverMetadataTest, LoadFromFile) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("rootscope_metadata_" + std::to_string(std::random_device{}()) + ".json");
    {
        std::ofstream out(path);
        out << kMetadataJson;
    }

    auto provider = JsonDriverMetadataProvider::LoadFromFile(path);
    ASSERT_TRUE(provider.ok()) << provider.status().message();
    EXPECT_TRUE(provider->Lookup("speed").has_value());

    std::filesystem::remove(path);

    auto missing = JsonDriverMetadataProvider::LoadFromFile(path);
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(GetErrorCode(missing.status()), ErrorCode::kFileNotFound);
}

TEST(DriverMetadataTest, LoadInvalidJsonIsCorrupt) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("rootscope_metadata_bad_" + std::to_string(std::random_device{}()) + ".json");
    {
        std::ofstream out(path);
        out << "{ drivers: ";
    }

    auto provider = JsonDriverMetadataProvider::LoadFromFile(path);
    ASSERT_FALSE(provider.ok());
    EXPECT_EQ(GetErrorCode(provider.status()), ErrorCode::kDataLoss);

    std::filesystem::remove(path);
}

}  // namespace
}  // namespace rootscope::analysis
