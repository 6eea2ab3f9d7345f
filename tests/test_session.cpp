#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include "FakeGateway.hpp"
#include "../src/core/Errors.hpp"
#include "../src/session/RemoteSession.hpp"

namespace fs = std::filesystem;

class RemoteSessionTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto fake = std::make_unique<FakeGateway>();
    gw = fake.get();
    session = std::make_unique<RemoteSession>(std::move(fake));
  }

  FakeGateway* gw = nullptr;
  std::unique_ptr<RemoteSession> session;
};

TEST_F(RemoteSessionTest, ConnectReportsPotato) {
  EXPECT_EQ(session->connect(), DeviceType::Potato);
  EXPECT_TRUE(session->connected());
  EXPECT_EQ(session->state(), SessionState::Connected);
  EXPECT_EQ(session->loginCount(), 1u);
  EXPECT_EQ(session->topology().strips(), 8u);
  EXPECT_EQ(session->topology().buses(), 8u);
}

TEST_F(RemoteSessionTest, DoubleConnectIsIdempotent) {
  session->connect();
  EXPECT_EQ(session->connect(), DeviceType::Potato);
  EXPECT_EQ(gw->loginCalls, 1);
  EXPECT_EQ(session->loginCount(), 1u);
}

TEST_F(RemoteSessionTest, ConnectWhenHostNotRunningLogsOut) {
  gw->loginCode = VendorCode::LoginHostNotRunning;
  EXPECT_THROW(session->connect(), ConnectionError);
  EXPECT_EQ(gw->logoutCalls, 1);
  EXPECT_EQ(session->state(), SessionState::Disconnected);
  EXPECT_FALSE(session->deviceType().has_value());
}

TEST_F(RemoteSessionTest, ConnectWhenLoginAlreadyHeld) {
  gw->loginCode = VendorCode::NoServer;
  EXPECT_THROW(session->connect(), ConnectionError);
  EXPECT_FALSE(session->connected());
}

TEST_F(RemoteSessionTest, ConnectWithoutLibrary) {
  gw->loadSucceeds = false;
  try {
    session->connect();
    FAIL() << "expected ConnectionError";
  } catch (const ConnectionError& e) {
    EXPECT_NE(std::string(e.what()).find("no library"), std::string::npos);
  }
  EXPECT_EQ(gw->loginCalls, 0);
}

TEST_F(RemoteSessionTest, DisconnectWhileDisconnectedIsNoop) {
  EXPECT_FALSE(session->disconnect());
  EXPECT_EQ(gw->logoutCalls, 0);
  session->connect();
  EXPECT_TRUE(session->disconnect());
  EXPECT_EQ(gw->logoutCalls, 1);
  EXPECT_FALSE(session->connected());
}

TEST_F(RemoteSessionTest, SetThenGetMute) {
  session->connect();
  session->setParameterFloat("Strip[0].mute", 1.0f);
  EXPECT_FLOAT_EQ(session->getParameterFloat("Strip[0].mute"), 1.0f);
}

TEST_F(RemoteSessionTest, GainIsClampedByDevice) {
  session->connect();
  session->setParameterFloat("Bus[2].gain", 40.0f);
  EXPECT_FLOAT_EQ(session->getParameterFloat("Bus[2].gain"), 12.0f);
  session->setParameterFloat("Strip[1].gain", -100.0f);
  EXPECT_FLOAT_EQ(session->getParameterFloat("Strip[1].gain"), -60.0f);
  session->setParameterFloat("Strip[1].gain", -6.5f);
  EXPECT_FLOAT_EQ(session->getParameterFloat("Strip[1].gain"), -6.5f);
}

TEST_F(RemoteSessionTest, StringParameterRoundTrip) {
  session->connect();
  session->setParameterString("Strip[3].label", "Mic");
  EXPECT_EQ(session->getParameterString("Strip[3].label"), "Mic");
}

TEST_F(RemoteSessionTest, OverlongStringIsRejectedBeforeTheDevice) {
  session->connect();
  EXPECT_THROW(session->setParameterString("Strip[0].label", std::string(600, 'x')), RequestError);
  EXPECT_EQ(gw->setCalls, 0);
}

TEST_F(RemoteSessionTest, UnknownParameterIsDeviceError) {
  session->connect();
  try {
    session->getParameterFloat("Strip[0].nonsense");
    FAIL() << "expected DeviceError";
  } catch (const DeviceError& e) {
    EXPECT_EQ(e.vendorCode(), VendorCode::UnknownParameter);
  }
}

TEST_F(RemoteSessionTest, TypeMismatchIsDeviceError) {
  session->connect();
  try {
    session->getParameterFloat("Strip[0].label");
    FAIL() << "expected DeviceError";
  } catch (const DeviceError& e) {
    EXPECT_EQ(e.vendorCode(), VendorCode::StructureMismatch);
  }
}

TEST_F(RemoteSessionTest, IndexBeyondTopologyNeverReachesDevice) {
  gw->deviceType = static_cast<long>(DeviceType::Voicemeeter);
  session->connect();
  EXPECT_THROW(session->getParameterFloat("Strip[3].mute"), DeviceError);
  EXPECT_THROW(session->setParameterFloat("Bus[2].mute", 1.0f), DeviceError);
  EXPECT_EQ(gw->setCalls, 0);
  EXPECT_NO_THROW(session->setParameterFloat("Strip[2].mute", 1.0f));
}

TEST_F(RemoteSessionTest, ParameterCallsWhileDisconnected) {
  EXPECT_THROW(session->getParameterFloat("Strip[0].mute"), ConnectionError);
  EXPECT_THROW(session->getParameterString("Strip[0].label"), ConnectionError);
  EXPECT_THROW(session->setParameterFloat("Strip[0].mute", 1.0f), ConnectionError);
  EXPECT_THROW(session->setParameterString("Strip[0].label", "x"), ConnectionError);
  EXPECT_THROW(session->getLevels(LevelType::PostFaderOutput, {0, 1, 2, 3}), ConnectionError);
  EXPECT_THROW(session->version(), ConnectionError);
  EXPECT_THROW(session->topology(), ConnectionError);
  EXPECT_FALSE(session->parametersDirty());
  EXPECT_EQ(gw->setCalls, 0);
  EXPECT_EQ(gw->levelCalls, 0);
}

TEST_F(RemoteSessionTest, LevelsForRequestedChannels) {
  session->connect();
  gw->levels[4] = 0.25f;
  gw->levels[5] = 0.5f;
  const auto v = session->getLevels(LevelType::PreFaderInput, {4, 5, 6});
  ASSERT_EQ(v.size(), 3u);
  EXPECT_FLOAT_EQ(v[0], 0.25f);
  EXPECT_FLOAT_EQ(v[1], 0.5f);
  EXPECT_FLOAT_EQ(v[2], 0.0f);
}

TEST_F(RemoteSessionTest, EmptyChannelListGivesEmptyLevels) {
  session->connect();
  EXPECT_TRUE(session->getLevels(LevelType::PostMuteOutput, {}).empty());
  EXPECT_EQ(gw->levelCalls, 0);
}

TEST_F(RemoteSessionTest, LevelFailuresAreDeviceErrors) {
  session->connect();
  EXPECT_THROW(session->getLevels(LevelType::PreFaderInput, {1000}), DeviceError);
  gw->unavailableLevelTypes.insert(static_cast<long>(LevelType::PreFaderOutput));
  EXPECT_THROW(session->getLevels(LevelType::PreFaderOutput, {0}), DeviceError);
  EXPECT_TRUE(session->connected());
}

TEST_F(RemoteSessionTest, LostConnectionDropsToDisconnected) {
  session->connect();
  gw->connectionDropped = true;
  EXPECT_THROW(session->getParameterFloat("Strip[0].mute"), ConnectionError);
  EXPECT_FALSE(session->connected());
  EXPECT_EQ(gw->logoutCalls, 1);
  gw->connectionDropped = false;
  EXPECT_THROW(session->getParameterFloat("Strip[0].mute"), ConnectionError);
  session->connect();
  EXPECT_EQ(session->loginCount(), 2u);
}

TEST_F(RemoteSessionTest, LostConnectionDuringLevels) {
  session->connect();
  gw->connectionDropped = true;
  EXPECT_THROW(session->getLevels(LevelType::PreFaderInput, {0}), ConnectionError);
  EXPECT_FALSE(session->connected());
}

TEST_F(RemoteSessionTest, RunPotatoTwiceSucceeds) {
  EXPECT_NO_THROW(session->runApplication(DeviceType::Potato));
  EXPECT_NO_THROW(session->runApplication(DeviceType::Potato));
  EXPECT_EQ(gw->runCalls, 2);
}

TEST_F(RemoteSessionTest, RunNotInstalled) {
  gw->runCode = VendorCode::Error;
  EXPECT_THROW(session->runApplication(DeviceType::Banana), DeviceError);
}

TEST_F(RemoteSessionTest, VersionIsDotted) {
  session->connect();
  EXPECT_EQ(session->version(), "3.0.2.8");
}

TEST_F(RemoteSessionTest, DirtyFlag) {
  session->connect();
  EXPECT_FALSE(session->parametersDirty());
  gw->dirtyCode = 1;
  EXPECT_TRUE(session->parametersDirty());
}

class PresetFileTest : public RemoteSessionTest {
protected:
  void SetUp() override {
    RemoteSessionTest::SetUp();
    dir = fs::temp_directory_path() / ("vmmcp_preset_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                                        "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::create_directories(dir);
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }
  fs::path write(const std::string& name, size_t bytes) {
    const fs::path p = dir / name;
    std::ofstream out(p, std::ios::binary);
    out << std::string(bytes, ' ');
    return p;
  }

  fs::path dir;
};

TEST_F(PresetFileTest, LoadsXmlThroughCommandLoad) {
  const fs::path p = write("studio.xml", 64);
  session->connect();
  session->loadPreset(p.string());
  EXPECT_EQ(gw->lastLoadCommand, fs::absolute(p).string());
}

TEST_F(PresetFileTest, UppercaseExtensionAccepted) {
  const fs::path p = write("studio.XML", 64);
  EXPECT_EQ(checkPresetFile(p.string()), fs::absolute(p).string());
}

TEST_F(PresetFileTest, MissingFile) {
  EXPECT_THROW(checkPresetFile((dir / "nope.xml").string()), RequestError);
}

TEST_F(PresetFileTest, WrongExtension) {
  const fs::path p = write("studio.json", 10);
  EXPECT_THROW(checkPresetFile(p.string()), RequestError);
}

TEST_F(PresetFileTest, Directory) {
  fs::create_directories(dir / "folder.xml");
  EXPECT_THROW(checkPresetFile((dir / "folder.xml").string()), RequestError);
}

TEST_F(PresetFileTest, TooLarge) {
  const fs::path p = write("huge.xml", static_cast<size_t>(kMaxPresetBytes) + 1);
  EXPECT_THROW(checkPresetFile(p.string()), RequestError);
}

TEST_F(PresetFileTest, FileIsCheckedBeforeConnection) {
  EXPECT_THROW(session->loadPreset((dir / "nope.xml").string()), RequestError);
  const fs::path p = write("ok.xml", 8);
  EXPECT_THROW(session->loadPreset(p.string()), ConnectionError);
  EXPECT_TRUE(gw->lastLoadCommand.empty());
}
