/**
 * @file nodeinvariants.hpp
 * @date October 2026
 * @brief Проверка уникальности полей узла относительно набора других узлов
 *
 * @details
 * Одна и та же проверка выполняется NodeValidator на снимке реестра и
 * NodeRegistry под эксклюзивной блокировкой непосредственно перед записью.
 */

#pragma once

#include <set>
#include <string>
#include <vector>

#include "nodeconfig.hpp"
#include "validationresult.hpp"

/**
 * @brief Добавляет в result конфликты имени, портов и каталогов
 *
 * @details
 * Порты кандидата сравниваются с обоими портами каждого узла из others.
 * Совпадение httpPort и transportPort самого кандидата также является
 * конфликтом (transport_port). Пути сравниваются после нормализации;
 * пустые пути не сравниваются.
 */
void scanUniquenessConflicts(const NodeConfig &candidate,
                             const std::vector<NodeConfig> &others,
                             ValidationResult &result);

/// Все занятые порты (оба поля) набора узлов
std::set<int> collectPorts(const std::vector<NodeConfig> &nodes);

/// Нормализованная запись пути для сравнения
std::string normalizedPath(const std::string &path);
