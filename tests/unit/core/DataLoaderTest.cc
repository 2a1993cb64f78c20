#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "stride/core/DataLoader.hh"

namespace stride {

class DataLoaderTest : public ::testing::Test {
  protected:
    // Write a temp TOML file for file-based tests
    std::filesystem::path writeTempFile(const std::string& content, const std::string& name = "test.toml") {
        auto dir = std::filesystem::temp_directory_path() / "stride_dataloader_test";
        std::filesystem::create_directories(dir);
        auto path = dir / name;
        std::ofstream ofs(path);
        ofs << content;
        ofs.close();
        return path;
    }

    void TearDown() override {
        auto dir = std::filesystem::temp_directory_path() / "stride_dataloader_test";
        std::filesystem::remove_all(dir);
    }
};

// -- DataLoader::parse --

TEST_F(DataLoaderTest, ParseValidToml) {
    auto result = DataLoader::parse(R"(
        [mover]
        colliderKind = "capsule"
        sensorArrayRows = 3
        colliderHeight = 1.8
        sensorArrayRowsAreOffset = true
    )");
    ASSERT_TRUE(result.isOk());
    auto& loader = result.value();

    EXPECT_EQ(loader.getString("mover.colliderKind").value(), "capsule");
    EXPECT_EQ(loader.getInt("mover.sensorArrayRows").value(), 3);
    EXPECT_DOUBLE_EQ(loader.getFloat("mover.colliderHeight").value(), 1.8);
    EXPECT_TRUE(loader.getBool("mover.sensorArrayRowsAreOffset").value());
}

TEST_F(DataLoaderTest, ParseMalformedToml) {
    auto result = DataLoader::parse("[invalid\nno_closing_bracket", "broken.toml");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::InvalidArgument);
    EXPECT_NE(result.message().find("broken.toml:"), std::string::npos);
}

TEST_F(DataLoaderTest, MissingKey) {
    auto result = DataLoader::parse("[section]\nkey = 1");
    ASSERT_TRUE(result.isOk());
    auto& loader = result.value();

    auto missing = loader.getInt("section.other");
    ASSERT_TRUE(missing.isError());
    EXPECT_EQ(missing.code(), ErrorCode::NotFound);

    EXPECT_TRUE(loader.getInt("nosection.key").isError());
    EXPECT_FALSE(loader.hasKey("section.other"));
    EXPECT_TRUE(loader.hasKey("section.key"));
    EXPECT_TRUE(loader.hasKey("section"));
}

TEST_F(DataLoaderTest, TypeMismatch) {
    auto result = DataLoader::parse(R"(
        [controller]
        gravity = "strong"
        useAutoJump = 1
    )");
    ASSERT_TRUE(result.isOk());
    auto& loader = result.value();

    auto gravity = loader.getFloat("controller.gravity");
    ASSERT_TRUE(gravity.isError());
    EXPECT_EQ(gravity.code(), ErrorCode::TypeMismatch);
    EXPECT_NE(gravity.message().find("controller.gravity"), std::string::npos);

    EXPECT_EQ(loader.getBool("controller.useAutoJump").code(), ErrorCode::TypeMismatch);
    EXPECT_EQ(loader.getString("controller.useAutoJump").code(), ErrorCode::TypeMismatch);
}

TEST_F(DataLoaderTest, FloatAcceptsInteger) {
    auto result = DataLoader::parse("[controller]\ngravity = 30");
    ASSERT_TRUE(result.isOk());
    EXPECT_DOUBLE_EQ(result.value().getFloat("controller.gravity").value(), 30.0);
}

TEST_F(DataLoaderTest, KeyThroughNonTableFails) {
    auto result = DataLoader::parse("value = 5");
    ASSERT_TRUE(result.isOk());
    EXPECT_FALSE(result.value().hasKey("value.inner"));
}

// -- getVec3 --

TEST_F(DataLoaderTest, Vec3MixedNumbers) {
    auto result = DataLoader::parse("offset = [0, 0.5, -1]");
    ASSERT_TRUE(result.isOk());
    auto v = result.value().getVec3("offset");
    ASSERT_TRUE(v.isOk());
    EXPECT_FLOAT_EQ(v.value().x, 0.0f);
    EXPECT_FLOAT_EQ(v.value().y, 0.5f);
    EXPECT_FLOAT_EQ(v.value().z, -1.0f);
}

TEST_F(DataLoaderTest, Vec3RejectsWrongShape) {
    auto result = DataLoader::parse(R"(
        short = [1, 2]
        text = [1, "two", 3]
        scalar = 4
    )");
    ASSERT_TRUE(result.isOk());
    auto& loader = result.value();

    EXPECT_EQ(loader.getVec3("short").code(), ErrorCode::TypeMismatch);
    EXPECT_EQ(loader.getVec3("text").code(), ErrorCode::TypeMismatch);
    EXPECT_EQ(loader.getVec3("scalar").code(), ErrorCode::TypeMismatch);
    EXPECT_EQ(loader.getVec3("absent").code(), ErrorCode::NotFound);
}

// -- DataLoader::load --

TEST_F(DataLoaderTest, LoadFromFile) {
    auto path = writeTempFile("[controller]\nmovementSpeed = 9.5\n");
    auto result = DataLoader::load(path);
    ASSERT_TRUE(result.isOk());
    EXPECT_DOUBLE_EQ(result.value().getFloat("controller.movementSpeed").value(), 9.5);
    EXPECT_EQ(result.value().sourceName(), path.string());
}

TEST_F(DataLoaderTest, LoadMissingFile) {
    auto result = DataLoader::load("/nonexistent/stride/character.toml");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::NotFound);
}

TEST_F(DataLoaderTest, LoadMalformedFile) {
    auto path = writeTempFile("[mover\n");
    auto result = DataLoader::load(path);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::InvalidArgument);
}

} // namespace stride
