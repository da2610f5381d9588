/**
 * @file enviromentprocessor.hpp
 * @date October 2026
 * @brief Подстановка переменных окружения в JSON-конфигурацию
 *
 * @details
 * Каждое вхождение `$ENV{VAR}` в строковом узле заменяется значением
 * переменной. Неизвестные переменные оставляются как есть, чтобы ошибка
 * проявилась при валидации пути или числа, а не молча превратилась в
 * пустую строку.
 */

#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <string>

class EnvironmentProcessor {
 public:
  /// Рекурсивно обрабатывает все строковые узлы документа
  void process(nlohmann::json &config) const;

  /**
   * @brief Заменяет шаблоны в одной строке
   *
   * @code
   std::string s = "$ENV{HOME}/nodes";
   EnvironmentProcessor{}.resolveVariable(s);
   @endcode
   */
  void resolveVariable(std::string &value) const;

 private:
  void walkJson(nlohmann::json &node,
                const std::function<void(std::string &)> &func) const;
};
