#include "command_table.hpp"

#include <utility>

#include "json_util.hpp"

namespace bebop {

namespace {

constexpr int64_t MAX_PROJECT_ID = 0xFF;
constexpr int64_t MAX_CLASS_ID = 0xFF;
constexpr int64_t MAX_COMMAND_ID = 0xFFFF;

std::optional<ArgShape> ParseArgShape(std::string_view name) {
  if (name == "none") return ArgShape::None;
  if (name == "enum") return ArgShape::Enum;
  if (name == "pcmd") return ArgShape::Pcmd;
  return std::nullopt;
}

bool InRange(int64_t v, int64_t max) { return v >= 0 && v <= max; }

Result<CommandDef, DefinitionError> ParseEntry(const cJSON* item) {
  if (!cJSON_IsObject(item)) return DefinitionError::MalformedJson;

  auto domain = json::GetString(item, "domain");
  auto klass = json::GetString(item, "class");
  auto command = json::GetString(item, "command");
  auto project_id = json::GetInt(item, "project_id");
  auto class_id = json::GetInt(item, "class_id");
  auto command_id = json::GetInt(item, "command_id");
  if (!domain || !klass || !command || !project_id || !class_id ||
      !command_id) {
    return DefinitionError::MissingField;
  }

  if (!InRange(*project_id, MAX_PROJECT_ID) ||
      !InRange(*class_id, MAX_CLASS_ID) ||
      !InRange(*command_id, MAX_COMMAND_ID)) {
    return DefinitionError::IdOutOfRange;
  }

  // "args" необязателен: по умолчанию команда без параметров
  ArgShape shape = ArgShape::None;
  if (auto args = json::GetString(item, "args")) {
    auto parsed = ParseArgShape(*args);
    if (!parsed) return DefinitionError::UnknownArgumentShape;
    shape = *parsed;
  }

  CommandDef def;
  def.domain = std::move(*domain);
  def.klass = std::move(*klass);
  def.command = std::move(*command);
  def.descriptor = CommandDescriptor{static_cast<uint8_t>(*project_id),
                                     static_cast<uint8_t>(*class_id),
                                     static_cast<uint16_t>(*command_id)};
  def.shape = shape;

  if (shape == ArgShape::Enum) {
    const cJSON* variants = cJSON_GetObjectItemCaseSensitive(item, "enum");
    if (!cJSON_IsArray(variants)) return DefinitionError::MissingField;
    const cJSON* v = nullptr;
    cJSON_ArrayForEach(v, variants) {
      if (!cJSON_IsString(v) || v->valuestring == nullptr) {
        return DefinitionError::MalformedJson;
      }
      def.enum_variants.emplace_back(v->valuestring);
    }
  }

  return def;
}

}  // namespace

const char* LookupErrorName(LookupError err) noexcept {
  switch (err) {
    case LookupError::UnknownCommand:
      return "unknown command";
    case LookupError::UnknownEnumVariant:
      return "unknown enum variant";
    case LookupError::NotAnEnumCommand:
      return "command has no enum argument";
    case LookupError::WrongArgumentShape:
      return "wrong argument shape";
  }
  return "unknown";
}

const char* DefinitionErrorName(DefinitionError err) noexcept {
  switch (err) {
    case DefinitionError::MalformedJson:
      return "malformed json";
    case DefinitionError::MissingField:
      return "missing field";
    case DefinitionError::DuplicateEntry:
      return "duplicate entry";
    case DefinitionError::IdOutOfRange:
      return "id out of range";
    case DefinitionError::EmptyEnum:
      return "empty enum";
    case DefinitionError::UnknownArgumentShape:
      return "unknown argument shape";
  }
  return "unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// Загрузка
// ═══════════════════════════════════════════════════════════════════════════

Result<CommandTable, DefinitionError> CommandTable::FromEntries(
    std::vector<CommandDef> entries) {
  CommandTable table;
  for (auto& def : entries) {
    if (def.domain.empty() || def.klass.empty() || def.command.empty()) {
      return DefinitionError::MissingField;
    }
    if (def.shape == ArgShape::Enum && def.enum_variants.empty()) {
      return DefinitionError::EmptyEnum;
    }
    Key key{def.domain, def.klass, def.command};
    if (!table.entries_.emplace(std::move(key), std::move(def)).second) {
      return DefinitionError::DuplicateEntry;
    }
  }
  return table;
}

Result<CommandTable, DefinitionError> CommandTable::FromJson(
    std::string_view json) {
  auto root = json::Parse(json);
  if (!root || !cJSON_IsObject(root.get())) {
    return DefinitionError::MalformedJson;
  }

  const cJSON* commands =
      cJSON_GetObjectItemCaseSensitive(root.get(), "commands");
  if (!cJSON_IsArray(commands)) return DefinitionError::MissingField;

  std::vector<CommandDef> entries;
  const cJSON* item = nullptr;
  cJSON_ArrayForEach(item, commands) {
    auto parsed = ParseEntry(item);
    if (IsError(parsed)) return GetError(parsed);
    entries.push_back(GetValue(std::move(parsed)));
  }
  return FromEntries(std::move(entries));
}

CommandTable CommandTable::Builtin() {
  std::vector<CommandDef> entries{
      {"common", "Common", "AllStates", {0, 4, 0}, ArgShape::None, {}},
      {"common", "Settings", "AllSettings", {0, 2, 0}, ArgShape::None, {}},
      {"ardrone3", "Piloting", "TakeOff", {1, 0, 1}, ArgShape::None, {}},
      {"ardrone3", "Piloting", "PCMD", {1, 0, 2}, ArgShape::Pcmd, {}},
      {"ardrone3", "Piloting", "Landing", {1, 0, 3}, ArgShape::None, {}},
      {"ardrone3", "Piloting", "Emergency", {1, 0, 4}, ArgShape::None, {}},
      {"ardrone3",
       "Animations",
       "Flip",
       {1, 5, 0},
       ArgShape::Enum,
       {"front", "back", "right", "left"}},
  };
  auto table = FromEntries(std::move(entries));
  // Встроенная таблица валидна по построению
  return IsOk(table) ? GetValue(std::move(table)) : CommandTable{};
}

// ═══════════════════════════════════════════════════════════════════════════
// Разрешение
// ═══════════════════════════════════════════════════════════════════════════

const CommandDef* CommandTable::Find(std::string_view domain,
                                     std::string_view klass,
                                     std::string_view command) const {
  auto it = entries_.find(
      Key{std::string(domain), std::string(klass), std::string(command)});
  return it == entries_.end() ? nullptr : &it->second;
}

Result<CommandDescriptor, LookupError> CommandTable::Resolve(
    std::string_view domain, std::string_view klass, std::string_view command,
    ArgShape shape) const {
  const CommandDef* def = Find(domain, klass, command);
  if (def == nullptr) return LookupError::UnknownCommand;
  if (def->shape != shape) return LookupError::WrongArgumentShape;
  return def->descriptor;
}

Result<EnumCommand, LookupError> CommandTable::ResolveWithEnum(
    std::string_view domain, std::string_view klass, std::string_view command,
    std::string_view variant) const {
  const CommandDef* def = Find(domain, klass, command);
  if (def == nullptr) return LookupError::UnknownCommand;
  if (def->shape != ArgShape::Enum) return LookupError::NotAnEnumCommand;

  const auto& variants = def->enum_variants;
  for (size_t i = 0; i < variants.size(); ++i) {
    if (variants[i] == variant) {
      return EnumCommand{def->descriptor,
                         EnumSelector{static_cast<uint32_t>(i),
                                      static_cast<uint32_t>(variants.size())}};
    }
  }
  return LookupError::UnknownEnumVariant;
}

}  // namespace bebop
