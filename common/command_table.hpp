#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "command_types.hpp"
#include "result.hpp"

namespace bebop {

/**
 * @brief Форма аргументов команды в таблице определений
 */
enum class ArgShape : uint8_t {
  None = 0,  ///< Без параметров
  Enum,      ///< Один enum-аргумент
  Pcmd       ///< roll / pitch / yaw / vertical + длительность
};

/**
 * @brief Ошибки разрешения команды
 *
 * Означают несоответствие таблицы определений версии протокола аппарата, а не
 * состояние сети; повторять бессмысленно.
 */
enum class LookupError : uint8_t {
  UnknownCommand,
  UnknownEnumVariant,
  NotAnEnumCommand,
  WrongArgumentShape
};

/**
 * @brief Ошибки загрузки таблиц определений
 */
enum class DefinitionError : uint8_t {
  MalformedJson,
  MissingField,
  DuplicateEntry,
  IdOutOfRange,
  EmptyEnum,
  UnknownArgumentShape
};

[[nodiscard]] const char* LookupErrorName(LookupError err) noexcept;
[[nodiscard]] const char* DefinitionErrorName(DefinitionError err) noexcept;

/**
 * @brief Одна запись таблицы команд
 */
struct CommandDef {
  std::string domain;   ///< "ardrone3", "common"
  std::string klass;    ///< "Piloting", "Animations"
  std::string command;  ///< "TakeOff", "Flip"
  CommandDescriptor descriptor{};
  ArgShape shape{ArgShape::None};
  std::vector<std::string> enum_variants;  ///< Только для ArgShape::Enum
};

/** Команда с разрешённым enum-вариантом. */
struct EnumCommand {
  CommandDescriptor descriptor{};
  EnumSelector selector{};
};

/**
 * @brief Таблица команд (Command Resolver)
 *
 * Отображает символическую тройку (domain, class, command) в
 * CommandDescriptor. Все записи проверяются при загрузке; разрешение:
 * чистый поиск без обращения к сети.
 *
 * @example
 * @code
 * auto table = CommandTable::Builtin();
 * auto r = table.Resolve("ardrone3", "Piloting", "TakeOff");
 * if (IsOk(r)) platform.SendAckCommand(GetValue(r));
 * @endcode
 */
class CommandTable {
 public:
  CommandTable() = default;

  /**
   * @brief Построить таблицу из записей с проверкой схемы
   * @return Таблица или первая найденная ошибка
   */
  [[nodiscard]] static Result<CommandTable, DefinitionError> FromEntries(
      std::vector<CommandDef> entries);

  /**
   * @brief Загрузить таблицу из JSON-документа
   *
   * Формат: {"commands": [{"domain", "class", "command", "project_id",
   * "class_id", "command_id", "args": "none"|"enum"|"pcmd", "enum": [...]}]}
   */
  [[nodiscard]] static Result<CommandTable, DefinitionError> FromJson(
      std::string_view json);

  /** Встроенное подмножество команд Bebop. */
  [[nodiscard]] static CommandTable Builtin();

  /**
   * @brief Разрешить команду
   * @param shape Ожидаемая форма аргументов
   */
  [[nodiscard]] Result<CommandDescriptor, LookupError> Resolve(
      std::string_view domain, std::string_view klass,
      std::string_view command, ArgShape shape = ArgShape::None) const;

  /**
   * @brief Разрешить команду с именованным enum-вариантом
   * @param variant Имя варианта (точное совпадение)
   */
  [[nodiscard]] Result<EnumCommand, LookupError> ResolveWithEnum(
      std::string_view domain, std::string_view klass,
      std::string_view command, std::string_view variant) const;

  /** Запись таблицы или nullptr. */
  [[nodiscard]] const CommandDef* Find(std::string_view domain,
                                       std::string_view klass,
                                       std::string_view command) const;

  [[nodiscard]] size_t Size() const noexcept { return entries_.size(); }

 private:
  using Key = std::tuple<std::string, std::string, std::string>;

  std::map<Key, CommandDef> entries_;
};

}  // namespace bebop
