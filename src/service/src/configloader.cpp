/**
 * @file configloader.cpp
 * @brief Реализация загрузчика JSON-файлов
 */

#include "../include/configloader.hpp"

#include <fstream>
#include <sstream>

nlohmann::json ConfigLoader::loadFromFile(const std::string &filename) {
  if (filename.empty()) {
    throw std::runtime_error("ConfigLoader: Empty file name");
  }
  auto document = readFileContents(filename);
  lastLoadedFile_ = filename;
  return document;
}

nlohmann::json ConfigLoader::reload() const {
  if (lastLoadedFile_.empty()) {
    throw std::runtime_error("ConfigLoader: No file loaded yet");
  }
  return readFileContents(lastLoadedFile_);
}

std::string ConfigLoader::getLastLoadedFile() const { return lastLoadedFile_; }

bool ConfigLoader::hasLoadedFile() const { return !lastLoadedFile_.empty(); }

nlohmann::json ConfigLoader::readFileContents(
    const std::string &filename) const {
  std::ifstream file(filename);

  if (!file.is_open()) {
    throw std::runtime_error("ConfigLoader: Failed to open file " + filename);
  }

  try {
    nlohmann::json document;
    file >> document;
    return document;
  } catch (const nlohmann::json::parse_error &e) {
    std::stringstream ss;
    ss << "ConfigLoader: JSON parse error in " << filename << ": " << e.what()
       << " at byte " << e.byte;
    throw std::runtime_error(ss.str());
  }
}
