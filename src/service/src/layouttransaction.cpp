#include "../include/layouttransaction.hpp"

#include <stdexcept>

#include "steward/compositelogger.hpp"

namespace fs = std::filesystem;

LayoutTransaction::LayoutTransaction(std::string description)
    : description_(std::move(description)) {}

LayoutTransaction::LayoutTransaction(LayoutTransaction &&other) noexcept
    : description_(std::move(other.description_)),
      created_(std::move(other.created_)),
      discarded_(std::move(other.discarded_)),
      active_(other.active_) {
  other.active_ = false;
}

LayoutTransaction::~LayoutTransaction() {
  if (active_) {
    try {
      rollback();
    } catch (const std::exception &e) {
      steward::CompositeLogger::instance().error(
          "LayoutTransaction: Rollback of " + description_ +
          " failed: " + e.what());
    }
  }
}

void LayoutTransaction::trackCreated(const fs::path &path) {
  created_.push_back({path, true});
}

void LayoutTransaction::trackCreatedParent(const fs::path &path) {
  created_.push_back({path, false});
}

void LayoutTransaction::discardOnCommit(const fs::path &path) {
  discarded_.push_back(path);
}

void LayoutTransaction::commit() {
  if (!active_) {
    throw std::runtime_error("LayoutTransaction: No active transaction");
  }
  active_ = false;

  for (const auto &path : discarded_) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
      steward::CompositeLogger::instance().warning(
          "LayoutTransaction: Cannot remove " + path.string() + ": " +
          ec.message());
    }
  }
  steward::CompositeLogger::instance().debug("LayoutTransaction: " +
                                             description_ + " committed");
}

void LayoutTransaction::rollback() {
  if (!active_) {
    throw std::runtime_error("LayoutTransaction: No active transaction");
  }
  active_ = false;

  for (auto it = created_.rbegin(); it != created_.rend(); ++it) {
    std::error_code ec;
    if (it->recursive) {
      fs::remove_all(it->path, ec);
    } else if (fs::is_empty(it->path, ec) && !ec) {
      fs::remove(it->path, ec);
    }
    if (ec && ec != std::errc::no_such_file_or_directory) {
      steward::CompositeLogger::instance().error(
          "LayoutTransaction: Cannot remove " + it->path.string() + ": " +
          ec.message());
    }
  }
  steward::CompositeLogger::instance().info("LayoutTransaction: " +
                                            description_ + " rolled back");
}
