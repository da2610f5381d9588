/**
 * @file nodevalidator.hpp
 * @date October 2026
 * @brief Проверка конфигурации узла и подбор альтернативных значений
 *
 * @details
 * NodeValidator не выполняет ввода-вывода, кроме запроса объёма памяти у
 * ISystemMemoryReporter, и не бросает исключений на конфликтах: конфликты
 * возвращаются в ValidationResult. Исключение возможно только при
 * исчерпании окна поиска свободного порта или имени.
 */

#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "nodeconfig.hpp"
#include "orchestratorsettings.hpp"
#include "systemmemory.hpp"
#include "validationresult.hpp"

enum class ValidationMode { Create, Update };

class NodeValidator {
 public:
  NodeValidator(const ISystemMemoryReporter &memory, ValidatorPolicy policy);

  /**
   * @brief Проверяет кандидата на фоне снимка реестра
   *
   * @param candidate Полностью заполненная конфигурация
   * @param mode Create или Update
   * @param snapshot Узлы реестра на момент проверки
   * @param originalName В режиме Update: имя заменяемой записи, которая
   *        исключается из сравнения
   *
   * @throw ResourceExhaustionError Свободный порт или имя не найдены в окне
   */
  ValidationResult validate(
      const NodeConfig &candidate, ValidationMode mode,
      const std::vector<NodeConfig> &snapshot,
      const std::optional<std::string> &originalName = std::nullopt) const;

  /**
   * @brief Первый порт >= start, отсутствующий в used
   * @throw ResourceExhaustionError За пределами окна или 65535
   */
  int findFreePort(int start, const std::set<int> &used) const;

  /**
   * @brief Имена вида "<base>-2", "<base>-3", ... не из taken
   * @return От 1 до maxNameSuggestions имён
   * @throw ResourceExhaustionError Ни одного свободного имени в пределах
   *        nameSearchLimit
   */
  std::vector<std::string> suggestNames(
      const std::string &base, const std::set<std::string> &taken) const;

  const ValidatorPolicy &policy() const { return policy_; }

 private:
  void checkHeap(const NodeConfig &candidate, ValidationResult &result) const;
  void checkRoles(const NodeConfig &candidate, ValidationResult &result) const;

  const ISystemMemoryReporter &memory_;
  ValidatorPolicy policy_;
};
