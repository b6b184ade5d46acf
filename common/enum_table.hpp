#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "command_table.hpp"
#include "result.hpp"

namespace bebop {

/**
 * @brief Таблица перечислений полей телеметрии
 *
 * Имя поля → упорядоченный список меток. Индекс, присланный аппаратом,
 * разрешается в метку по этому списку.
 */
class EnumTable {
 public:
  EnumTable() = default;

  /**
   * @brief Загрузить таблицу из JSON-документа
   *
   * Формат: {"enums": {"FlyingStateChanged_state": ["landed", ...], ...}}
   */
  [[nodiscard]] static Result<EnumTable, DefinitionError> FromJson(
      std::string_view json);

  /** Встроенные перечисления Bebop (состояние полёта, алерты). */
  [[nodiscard]] static EnumTable Builtin();

  /**
   * @brief Добавить перечисление
   * @return false, если поле уже объявлено или список меток пуст
   */
  bool Add(std::string field, std::vector<std::string> labels);

  /** Метки перечисления или nullptr, если поле не перечислимое. */
  [[nodiscard]] const std::vector<std::string>* Find(
      std::string_view field) const;

  [[nodiscard]] size_t Size() const noexcept { return enums_.size(); }

 private:
  std::map<std::string, std::vector<std::string>, std::less<>> enums_;
};

}  // namespace bebop
