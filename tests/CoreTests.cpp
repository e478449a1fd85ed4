#include <gtest/gtest.h>
#include <volk.h>
#include <glm/glm.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
import Error;
import Flycam;
import FrameCounter;
import Logger;
import Settings;
import Voxels;

namespace {
uint32_t voxelAt(const std::vector<uint32_t>& voxels, uint32_t x, uint32_t y, uint32_t z) {
  return voxels[x + Luminary::kVoxelGridSize * y + Luminary::kVoxelGridSize * Luminary::kVoxelGridSize * z];
}

class CapturingLogger final : public Luminary::Logger {
 protected:
  void _write(Luminary::LogLevel level, std::string_view category, std::string_view message) const override {
    messages.push_back(std::string(Luminary::toString(level)) + " " + std::string(category) + ": " +
                       std::string(message));
  }

 public:
  mutable std::vector<std::string> messages;

  CapturingLogger(Luminary::LogLevel level) : Luminary::Logger(level) {}
};

class SettingsTest : public ::testing::Test {
 protected:
  void TearDown() override {
    for (auto name : {"LUMINARY_LOG_LEVEL", "LUMINARY_VALIDATION", "LUMINARY_WIDTH", "LUMINARY_HEIGHT",
                      "LUMINARY_SHADER"})
      unsetenv(name);
  }
};
}  // namespace

TEST(VoxelSceneTest, Size) {
  auto voxels = Luminary::generateVoxelScene();
  EXPECT_EQ(voxels.size(), 32u * 32u * 32u);
  EXPECT_TRUE(std::ranges::all_of(voxels, [](uint32_t voxel) { return voxel <= 3; }));
}

TEST(VoxelSceneTest, Corners) {
  auto voxels = Luminary::generateVoxelScene();
  EXPECT_EQ(voxelAt(voxels, 0, 0, 0), 1u);
  // i = 32767, 1 + 32767 % 3
  EXPECT_EQ(voxelAt(voxels, 31, 31, 31), 2u);
  EXPECT_NE(voxelAt(voxels, 31, 0, 0), 0u);
  EXPECT_EQ(voxelAt(voxels, 1, 1, 1), 0u);
}

TEST(VoxelSceneTest, BallWithTunnels) {
  auto voxels = Luminary::generateVoxelScene();
  // i = 17044, 1 + 17044 % 3
  EXPECT_EQ(voxelAt(voxels, 20, 20, 16), 2u);
  EXPECT_EQ(voxelAt(voxels, 16, 16, 16), 0u);
  EXPECT_EQ(voxelAt(voxels, 21, 16, 16), 0u);
  EXPECT_EQ(voxelAt(voxels, 17, 15, 26), 0u);
  // |p - 16|^2 = 121 is just outside the ball, 120 is on its surface
  EXPECT_EQ(voxelAt(voxels, 22, 22, 23), 0u);
  EXPECT_NE(voxelAt(voxels, 18, 20, 26), 0u);
}

TEST(FlycamTest, InitialState) {
  Luminary::Flycam flycam(0.001f);
  EXPECT_EQ(flycam.getPosition(), glm::vec3(-5.f));
  auto direction = flycam.getDirection();
  EXPECT_FLOAT_EQ(direction.x, 0.f);
  EXPECT_FLOAT_EQ(direction.y, 0.f);
  EXPECT_FLOAT_EQ(direction.z, 1.f);

  auto constants = flycam.getConstants();
  EXPECT_FLOAT_EQ(constants.position.w, 1.f);
  EXPECT_NEAR(constants.right.x, 1.f, 1e-6f);
  EXPECT_NEAR(constants.up.y, -1.f, 1e-6f);
  EXPECT_EQ(sizeof(Luminary::CameraConstants), 64u);
}

TEST(FlycamTest, MoveFollowsYaw) {
  Luminary::Flycam flycam(0.01f);
  flycam.move({0.f, 0.f, 1.f});
  EXPECT_NEAR(flycam.getPosition().z, -4.f, 1e-5f);

  // quarter turn to the left
  flycam.rotate({-std::acos(-1.f) / 2.f / 0.01f, 0.f});
  EXPECT_NEAR(flycam.getYaw(), std::acos(-1.f) / 2.f, 1e-5f);
  flycam.move({0.f, 0.f, 1.f});
  EXPECT_NEAR(flycam.getPosition().x, -4.f, 1e-5f);
  EXPECT_NEAR(flycam.getPosition().z, -4.f, 1e-5f);
  // vertical movement isn't affected by yaw
  flycam.move({0.f, -2.f, 0.f});
  EXPECT_NEAR(flycam.getPosition().y, -7.f, 1e-5f);
}

TEST(FlycamTest, PitchIsClamped) {
  Luminary::Flycam flycam(0.001f);
  flycam.rotate({0.f, 1e6f});
  EXPECT_LT(flycam.getPitch(), std::acos(-1.f) / 2.f);
  EXPECT_GT(flycam.getPitch(), 1.5f);
  flycam.rotate({0.f, -2e6f});
  EXPECT_GT(flycam.getPitch(), -std::acos(-1.f) / 2.f);

  auto constants = flycam.getConstants();
  EXPECT_TRUE(std::isfinite(constants.right.x));
  EXPECT_NEAR(glm::dot(glm::vec3(constants.forward), glm::vec3(constants.right)), 0.f, 1e-4f);
  EXPECT_NEAR(glm::dot(glm::vec3(constants.forward), glm::vec3(constants.up)), 0.f, 1e-4f);
}

TEST(FrameCounterTest, ReportsOncePerInterval) {
  auto start = std::chrono::steady_clock::time_point{};
  Luminary::FrameCounter counter(std::chrono::seconds(1), start);

  EXPECT_FALSE(counter.next(start + std::chrono::milliseconds(250)).has_value());
  EXPECT_FALSE(counter.next(start + std::chrono::milliseconds(500)).has_value());
  EXPECT_FALSE(counter.next(start + std::chrono::milliseconds(750)).has_value());
  auto fps = counter.next(start + std::chrono::seconds(1));
  ASSERT_TRUE(fps.has_value());
  EXPECT_FLOAT_EQ(*fps, 4.f);

  EXPECT_FALSE(counter.next(start + std::chrono::milliseconds(1500)).has_value());
  fps = counter.next(start + std::chrono::seconds(3));
  ASSERT_TRUE(fps.has_value());
  EXPECT_FLOAT_EQ(*fps, 1.f);
}

TEST(LoggerTest, ParseLevel) {
  EXPECT_EQ(Luminary::parseLogLevel("debug"), Luminary::LogLevel::Debug);
  EXPECT_EQ(Luminary::parseLogLevel("WARN"), Luminary::LogLevel::Warning);
  EXPECT_EQ(Luminary::parseLogLevel("Trace"), Luminary::LogLevel::Trace);
  EXPECT_FALSE(Luminary::parseLogLevel("verbose").has_value());
  EXPECT_EQ(Luminary::toString(Luminary::LogLevel::Error), "error");
}

TEST(LoggerTest, FiltersByLevel) {
  CapturingLogger logger(Luminary::LogLevel::Info);
  logger.debug("device", "hidden");
  logger.info("swapchain", "{}x{}", 1280, 720);
  logger.error("frame", "failed");
  EXPECT_EQ(logger.messages, (std::vector<std::string>{"info swapchain: 1280x720", "error frame: failed"}));

  logger.setLevel(Luminary::LogLevel::Error);
  EXPECT_FALSE(logger.isEnabled(Luminary::LogLevel::Warning));
  logger.log(Luminary::LogLevel::Warning, "validation", "hidden");
  EXPECT_EQ(logger.messages.size(), 2u);
}

TEST(ErrorTest, CarriesResult) {
  Luminary::DrawTimeout error("frame didn't finish", VK_TIMEOUT);
  EXPECT_EQ(error.getResult(), VK_TIMEOUT);
  EXPECT_EQ(std::string(error.what()), "frame didn't finish (VK_TIMEOUT)");
  EXPECT_EQ(Luminary::toString(VK_ERROR_OUT_OF_DATE_KHR), "VK_ERROR_OUT_OF_DATE_KHR");

  const Luminary::RendererError& base = error;
  EXPECT_EQ(base.getResult(), VK_TIMEOUT);
}

TEST_F(SettingsTest, Defaults) {
  auto settings = Luminary::Settings::fromEnvironment();
  EXPECT_EQ(settings.resolution, glm::ivec2(1280, 720));
  EXPECT_TRUE(settings.validation);
  EXPECT_EQ(settings.logLevel, Luminary::LogLevel::Info);
  EXPECT_EQ(settings.fenceTimeout, 1'000'000'000u);
}

TEST_F(SettingsTest, EnvironmentOverrides) {
  setenv("LUMINARY_LOG_LEVEL", "debug", 1);
  setenv("LUMINARY_VALIDATION", "off", 1);
  setenv("LUMINARY_WIDTH", "800", 1);
  setenv("LUMINARY_HEIGHT", "600", 1);
  setenv("LUMINARY_SHADER", "/tmp/raymarch.spv", 1);

  auto settings = Luminary::Settings::fromEnvironment();
  EXPECT_EQ(settings.logLevel, Luminary::LogLevel::Debug);
  EXPECT_FALSE(settings.validation);
  EXPECT_EQ(settings.resolution, glm::ivec2(800, 600));
  EXPECT_EQ(settings.shaderPath.string(), "/tmp/raymarch.spv");
}

TEST_F(SettingsTest, InvalidValues) {
  setenv("LUMINARY_WIDTH", "wide", 1);
  EXPECT_THROW(Luminary::Settings::fromEnvironment(), std::invalid_argument);
  setenv("LUMINARY_WIDTH", "-5", 1);
  EXPECT_THROW(Luminary::Settings::fromEnvironment(), std::invalid_argument);
  unsetenv("LUMINARY_WIDTH");

  setenv("LUMINARY_LOG_LEVEL", "loud", 1);
  EXPECT_THROW(Luminary::Settings::fromEnvironment(), std::invalid_argument);
}
