#include <gtest/gtest.h>

#include "command_table.hpp"
#include "test_helpers.hpp"

using namespace bebop;
using namespace bebop::testing;

// ═══════════════════════════════════════════════════════════════════════════
// Builtin Resolution
// ═══════════════════════════════════════════════════════════════════════════

TEST(CommandTableTest, ResolveTakeOff) {
  auto table = CommandTable::Builtin();
  auto r = table.Resolve("ardrone3", "Piloting", "TakeOff");

  ASSERT_TRUE(IsOk(r)) << "TakeOff should be in the builtin table";
  EXPECT_EQ(GetValue(r), (CommandDescriptor{1, 0, 1}));
}

TEST(CommandTableTest, ResolveIsDeterministic) {
  auto table = CommandTable::Builtin();
  auto a = table.Resolve("ardrone3", "Piloting", "Landing");
  auto b = table.Resolve("ardrone3", "Piloting", "Landing");

  ASSERT_TRUE(IsOk(a));
  ASSERT_TRUE(IsOk(b));
  EXPECT_EQ(GetValue(a), GetValue(b));
}

TEST(CommandTableTest, UnknownCommand) {
  auto table = CommandTable::Builtin();
  ExpectError(table.Resolve("ardrone3", "Piloting", "Teleport"),
              LookupError::UnknownCommand);
  ExpectError(table.Resolve("minidrone", "Piloting", "TakeOff"),
              LookupError::UnknownCommand);
}

TEST(CommandTableTest, NamesAreCaseSensitive) {
  auto table = CommandTable::Builtin();
  ExpectError(table.Resolve("ardrone3", "piloting", "takeoff"),
              LookupError::UnknownCommand);
}

TEST(CommandTableTest, WrongArgumentShape) {
  auto table = CommandTable::Builtin();
  ExpectError(table.Resolve("ardrone3", "Piloting", "PCMD"),
              LookupError::WrongArgumentShape);
  ExpectError(table.Resolve("ardrone3", "Piloting", "TakeOff", ArgShape::Pcmd),
              LookupError::WrongArgumentShape);

  auto pcmd = table.Resolve("ardrone3", "Piloting", "PCMD", ArgShape::Pcmd);
  EXPECT_TRUE(IsOk(pcmd));
}

// ═══════════════════════════════════════════════════════════════════════════
// Enum Arguments
// ═══════════════════════════════════════════════════════════════════════════

TEST(CommandTableTest, ResolveFlipVariant) {
  auto table = CommandTable::Builtin();
  auto r = table.ResolveWithEnum("ardrone3", "Animations", "Flip", "left");

  ASSERT_TRUE(IsOk(r));
  const auto& cmd = GetValue(r);
  EXPECT_EQ(cmd.descriptor, (CommandDescriptor{1, 5, 0}));
  EXPECT_EQ(cmd.selector.value, 3u) << "left is the fourth flip variant";
  EXPECT_EQ(cmd.selector.enum_size, 4u);
}

TEST(CommandTableTest, UnknownEnumVariant) {
  auto table = CommandTable::Builtin();
  ExpectError(table.ResolveWithEnum("ardrone3", "Animations", "Flip", "up"),
              LookupError::UnknownEnumVariant);
  ExpectError(table.ResolveWithEnum("ardrone3", "Animations", "Flip", "Left"),
              LookupError::UnknownEnumVariant);
}

TEST(CommandTableTest, EnumOnPlainCommand) {
  auto table = CommandTable::Builtin();
  ExpectError(table.ResolveWithEnum("ardrone3", "Piloting", "TakeOff", "left"),
              LookupError::NotAnEnumCommand);
}

TEST(CommandTableTest, EnumCommandWithoutVariant) {
  auto table = CommandTable::Builtin();
  ExpectError(table.Resolve("ardrone3", "Animations", "Flip"),
              LookupError::WrongArgumentShape);
}

// ═══════════════════════════════════════════════════════════════════════════
// FromEntries
// ═══════════════════════════════════════════════════════════════════════════

TEST(CommandTableTest, FromEntriesRejectsDuplicate) {
  std::vector<CommandDef> entries{
      {"common", "Common", "AllStates", {0, 4, 0}, ArgShape::None, {}},
      {"common", "Common", "AllStates", {0, 4, 1}, ArgShape::None, {}}};
  ExpectError(CommandTable::FromEntries(entries),
              DefinitionError::DuplicateEntry);
}

TEST(CommandTableTest, FromEntriesRejectsEmptyEnum) {
  std::vector<CommandDef> entries{
      {"ardrone3", "Animations", "Flip", {1, 5, 0}, ArgShape::Enum, {}}};
  ExpectError(CommandTable::FromEntries(entries), DefinitionError::EmptyEnum);
}

TEST(CommandTableTest, FromEntriesRejectsEmptyName) {
  std::vector<CommandDef> entries{
      {"ardrone3", "", "TakeOff", {1, 0, 1}, ArgShape::None, {}}};
  ExpectError(CommandTable::FromEntries(entries),
              DefinitionError::MissingField);
}

// ═══════════════════════════════════════════════════════════════════════════
// FromJson
// ═══════════════════════════════════════════════════════════════════════════

TEST(CommandTableTest, FromJsonLoadsEntries) {
  const char* json = R"({"commands": [
    {"domain": "ardrone3", "class": "Piloting", "command": "TakeOff",
     "project_id": 1, "class_id": 0, "command_id": 1},
    {"domain": "ardrone3", "class": "Animations", "command": "Flip",
     "project_id": 1, "class_id": 5, "command_id": 0,
     "args": "enum", "enum": ["front", "back"]}
  ]})";

  auto table = ExpectOk(CommandTable::FromJson(json));
  EXPECT_EQ(table.Size(), 2u);

  auto flip = table.ResolveWithEnum("ardrone3", "Animations", "Flip", "back");
  ASSERT_TRUE(IsOk(flip));
  EXPECT_EQ(GetValue(flip).selector, (EnumSelector{1, 2}));
}

TEST(CommandTableTest, FromJsonMalformed) {
  ExpectError(CommandTable::FromJson("{not json"),
              DefinitionError::MalformedJson);
  ExpectError(CommandTable::FromJson("[]"), DefinitionError::MalformedJson);
}

TEST(CommandTableTest, FromJsonMissingFields) {
  ExpectError(CommandTable::FromJson(R"({"entries": []})"),
              DefinitionError::MissingField);
  ExpectError(CommandTable::FromJson(R"({"commands": [
    {"domain": "ardrone3", "class": "Piloting", "command": "TakeOff",
     "project_id": 1, "class_id": 0}]})"),
              DefinitionError::MissingField);
}

TEST(CommandTableTest, FromJsonIdOutOfRange) {
  ExpectError(CommandTable::FromJson(R"({"commands": [
    {"domain": "ardrone3", "class": "Piloting", "command": "TakeOff",
     "project_id": 256, "class_id": 0, "command_id": 1}]})"),
              DefinitionError::IdOutOfRange);
  ExpectError(CommandTable::FromJson(R"({"commands": [
    {"domain": "ardrone3", "class": "Piloting", "command": "TakeOff",
     "project_id": 1, "class_id": 0, "command_id": -1}]})"),
              DefinitionError::IdOutOfRange);
}

TEST(CommandTableTest, FromJsonUnknownArgs) {
  ExpectError(CommandTable::FromJson(R"({"commands": [
    {"domain": "ardrone3", "class": "Piloting", "command": "moveBy",
     "project_id": 1, "class_id": 0, "command_id": 7, "args": "floats"}]})"),
              DefinitionError::UnknownArgumentShape);
}
