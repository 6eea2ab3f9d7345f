#include <gtest/gtest.h>
#include <string>
#include "../src/session/ParameterRef.hpp"

TEST(ParameterRefTest, ParsesStripAndBus) {
  ParameterRef ref;
  ASSERT_TRUE(parseParameterRef("Strip[3].gain", ref));
  EXPECT_EQ(ref.kind, EntityKind::Strip);
  EXPECT_EQ(ref.index, 3u);
  EXPECT_EQ(ref.field, "gain");

  ASSERT_TRUE(parseParameterRef("Bus[12].eq.on", ref));
  EXPECT_EQ(ref.kind, EntityKind::Bus);
  EXPECT_EQ(ref.index, 12u);
  EXPECT_EQ(ref.field, "eq.on");
  EXPECT_EQ(ref.toString(), "Bus[12].eq.on");
}

TEST(ParameterRefTest, RejectsMalformed) {
  ParameterRef ref;
  EXPECT_FALSE(parseParameterRef("", ref));
  EXPECT_FALSE(parseParameterRef("Strip[].mute", ref));
  EXPECT_FALSE(parseParameterRef("Strip[-1].mute", ref));
  EXPECT_FALSE(parseParameterRef("Strip[0]mute", ref));
  EXPECT_FALSE(parseParameterRef("Strip[0].", ref));
  EXPECT_FALSE(parseParameterRef("Strip[0].1st", ref));
  EXPECT_FALSE(parseParameterRef("Strip[0].mu te", ref));
  EXPECT_FALSE(parseParameterRef("strip[0].mute", ref));
  EXPECT_FALSE(parseParameterRef("Strip[99999999999].mute", ref));
  EXPECT_FALSE(parseParameterRef("Strip[0]." + std::string(120, 'a'), ref));
}

TEST(ParameterRefTest, VendorKeysAreNotStripBusRefs) {
  ParameterRef ref;
  EXPECT_FALSE(parseParameterRef("Command.Restart", ref));
  EXPECT_FALSE(parseParameterRef("Command.Load", ref));
}

TEST(ParameterRefTest, FormatMatchesParse) {
  EXPECT_EQ(formatParameterRef(EntityKind::Strip, 0, "A1"), "Strip[0].A1");
  EXPECT_EQ(formatParameterRef(EntityKind::Bus, 7, "label"), "Bus[7].label");
}

TEST(FieldTableTest, GainRangeAndClamp) {
  const FieldDef* gain = findField(kStripFieldMap, "gain");
  ASSERT_NE(gain, nullptr);
  EXPECT_FLOAT_EQ(gain->minValue, -60.0f);
  EXPECT_FLOAT_EQ(gain->maxValue, 12.0f);
  EXPECT_FLOAT_EQ(clampToField(*gain, 20.0f), 12.0f);
  EXPECT_FLOAT_EQ(clampToField(*gain, -80.0f), -60.0f);
  EXPECT_FLOAT_EQ(clampToField(*gain, -3.0f), -3.0f);

  const FieldDef* label = findField(kBusFieldMap, "label");
  ASSERT_NE(label, nullptr);
  EXPECT_EQ(label->value, FieldValue::String);
  EXPECT_EQ(findField(kBusFieldMap, "comp"), nullptr);
}

TEST(FieldTableTest, PhysicalOnlyFields) {
  const FieldDef* comp = findField(kStripFieldMap, "comp");
  ASSERT_NE(comp, nullptr);
  EXPECT_TRUE(fieldApplies(*comp, true));
  EXPECT_FALSE(fieldApplies(*comp, false));
  EXPECT_TRUE(fieldApplies(*findField(kStripFieldMap, "mute"), false));
}

TEST(FieldTableTest, RoutingFlagsPerVariant) {
  const auto basic = stripRoutingFields(topologyFor(DeviceType::Voicemeeter));
  EXPECT_EQ(basic, (std::vector<std::string>{"A1", "A2", "B1"}));
  const auto potato = stripRoutingFields(topologyFor(DeviceType::Potato));
  ASSERT_EQ(potato.size(), 8u);
  EXPECT_EQ(potato.front(), "A1");
  EXPECT_EQ(potato.back(), "B3");
}

TEST(TopologyTest, ChannelOffsets) {
  const Topology t = topologyFor(DeviceType::Banana);
  EXPECT_EQ(t.stripChannelOffset(0), 0u);
  EXPECT_EQ(t.stripChannelOffset(2), 4u);
  EXPECT_EQ(t.stripChannelOffset(3), 6u);
  EXPECT_EQ(t.stripChannelOffset(4), 14u);
  EXPECT_EQ(t.inputChannels(), 22u);
  EXPECT_EQ(t.outputChannels(), 40u);
}

TEST(TopologyTest, VendorTypeMapping) {
  DeviceType t = DeviceType::Voicemeeter;
  EXPECT_TRUE(deviceTypeFromVendor(2, t));
  EXPECT_EQ(t, DeviceType::Banana);
  EXPECT_FALSE(deviceTypeFromVendor(7, t));
  EXPECT_TRUE(parseDeviceType("potato", t));
  EXPECT_EQ(std::string(displayName(t)), "VOICEMEETER_POTATO");
  EXPECT_FALSE(parseDeviceType("Potato", t));
  EXPECT_EQ(formatVersion(0x02010305), "2.1.3.5");
}
