#include "../include/nodematerializer.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>
#include <vector>

#include "../include/errors.hpp"
#include "steward/compositelogger.hpp"

namespace fs = std::filesystem;

namespace {

bool isWithin(const fs::path &inner, const fs::path &outer) {
  const auto a = inner.lexically_normal();
  const auto b = outer.lexically_normal();
  auto ib = b.begin();
  auto ia = a.begin();
  for (; ib != b.end(); ++ib, ++ia) {
    if (ib->empty()) continue;  // завершающий '/'
    if (ia == a.end() || *ia != *ib) return false;
  }
  return true;
}

fs::path absoluteNormal(const fs::path &path) {
  std::error_code ec;
  auto absolute = fs::absolute(path, ec);
  return (ec ? path : absolute).lexically_normal();
}

}  // namespace

NodeLayout NodeLayout::at(const fs::path &nodeDir) {
  const auto root = absoluteNormal(nodeDir);
  return {root, root / "config", root / "data", root / "logs"};
}

NodeMaterializer::NodeMaterializer(MaterializerOptions options)
    : basePath_(absoluteNormal(options.basePath)),
      engineExecutable_(std::move(options.engineExecutable)) {}

fs::path NodeMaterializer::nodesRoot() const { return basePath_ / "nodes"; }

NodeLayout NodeMaterializer::defaultLayout(const std::string &name) const {
  return NodeLayout::at(nodesRoot() / name);
}

NodeConfig NodeMaterializer::bind(NodeConfig config, const NodeLayout &layout,
                                  bool force) {
  config.configPath = (layout.configDir / kConfigFile).string();
  if (force || config.dataPath.empty()) {
    config.dataPath = layout.dataDir.string();
  }
  if (force || config.logsPath.empty()) {
    config.logsPath = layout.logsDir.string();
  }
  return config;
}

NodeLayout NodeMaterializer::layoutOf(const NodeConfig &config) {
  NodeLayout layout;
  layout.configDir = fs::path(config.configPath).parent_path();
  layout.root = layout.configDir.parent_path();
  layout.dataDir = config.dataPath;
  layout.logsDir = config.logsPath;
  return layout;
}

void NodeMaterializer::ensureUsable(const fs::path &path) const {
  std::error_code ec;
  if (!fs::exists(path, ec)) return;
  if (!fs::is_directory(path, ec)) {
    throw FilesystemError("NodeMaterializer: Path is occupied by a file",
                          path.string());
  }
  if (!fs::is_empty(path, ec)) {
    throw FilesystemError("NodeMaterializer: Path is not empty", path.string(),
                          ec);
  }
}

void NodeMaterializer::makeDirectory(const fs::path &path,
                                     LayoutTransaction &txn) const {
  fs::path target = path.lexically_normal();
  if (!target.has_filename() && target.has_parent_path()) {
    target = target.parent_path();
  }

  std::error_code ec;
  std::vector<fs::path> missing;
  for (fs::path p = target; !p.empty() && !fs::exists(p, ec);
       p = p.parent_path()) {
    missing.push_back(p);
    if (p == p.parent_path()) break;
  }

  // Откат удаляет только каталоги, созданные этим вызовом.
  for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
    const bool created = fs::create_directory(*it, ec);
    if (ec) {
      throw FilesystemError("NodeMaterializer: Cannot create directory",
                            it->string(), ec);
    }
    if (!created) continue;
    if (*it == target) {
      txn.trackCreated(*it);
    } else {
      txn.trackCreatedParent(*it);
    }
  }
  if (!fs::is_directory(target, ec)) {
    throw FilesystemError("NodeMaterializer: Path is occupied by a file",
                          target.string());
  }
}

void NodeMaterializer::writeFile(const fs::path &path,
                                 const std::string &content,
                                 bool executable) const {
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    throw FilesystemError("NodeMaterializer: Cannot open file for writing",
                          path.string(),
                          std::error_code(errno, std::generic_category()));
  }
  out << content;
  out.flush();
  if (!out) {
    throw FilesystemError("NodeMaterializer: Failed to write file",
                          path.string(),
                          std::error_code(errno, std::generic_category()));
  }
  out.close();

  if (executable) {
    std::error_code ec;
    fs::permissions(path,
                    fs::perms::owner_exec | fs::perms::group_exec |
                        fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) {
      throw FilesystemError("NodeMaterializer: Cannot make file executable",
                            path.string(), ec);
    }
  }
}

void NodeMaterializer::writeConfigFiles(const NodeConfig &config) const {
  const auto dir = layoutOf(config).configDir;
  writeFile(dir / kConfigFile, renderElasticsearchYml(config));
  writeFile(dir / kJvmFile, renderJvmOptions(config));
  writeFile(dir / kLog4jFile, renderLog4j(config));
  writeFile(dir / kLauncherFile, renderLauncher(config), true);
}

void NodeMaterializer::copyTree(const fs::path &from, const fs::path &to) const {
  std::error_code ec;
  if (!fs::exists(from, ec)) return;

  fs::copy(from, to,
           fs::copy_options::recursive | fs::copy_options::copy_symlinks |
               fs::copy_options::overwrite_existing,
           ec);
  if (ec) {
    throw FilesystemError("NodeMaterializer: Failed to copy " + from.string(),
                          to.string(), ec);
  }
}

void NodeMaterializer::copyExtraConfig(const NodeConfig &source,
                                       const NodeConfig &target) const {
  const auto from = layoutOf(source).configDir;
  const auto to = layoutOf(target).configDir;
  std::error_code ec;
  if (!fs::is_directory(from, ec)) return;

  for (const auto &entry : fs::directory_iterator(from, ec)) {
    const auto name = entry.path().filename().string();
    if (name == kConfigFile || name == kJvmFile || name == kLog4jFile ||
        name == kLauncherFile || name == kPidFile) {
      continue;
    }
    copyTree(entry.path(), to / name);
  }
  if (ec) {
    throw FilesystemError("NodeMaterializer: Cannot read config directory",
                          from.string(), ec);
  }
}

LayoutTransaction NodeMaterializer::create(const NodeConfig &config) {
  const auto layout = layoutOf(config);
  for (const auto &dir : {layout.configDir, layout.dataDir, layout.logsDir}) {
    ensureUsable(dir);
  }

  LayoutTransaction txn("create of node \"" + config.name + "\"");
  for (const auto &dir : {layout.configDir, layout.dataDir, layout.logsDir}) {
    makeDirectory(dir, txn);
  }
  writeConfigFiles(config);

  steward::CompositeLogger::instance().debug(
      "NodeMaterializer: Node \"" + config.name + "\" staged at " +
      layout.root.string());
  return txn;
}

void NodeMaterializer::rewriteConfig(const NodeConfig &config) {
  const auto layout = layoutOf(config);
  for (const auto &dir : {layout.configDir, layout.dataDir, layout.logsDir}) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
      throw FilesystemError("NodeMaterializer: Cannot create directory",
                            dir.string(), ec);
    }
  }
  writeConfigFiles(config);
}

LayoutTransaction NodeMaterializer::reconfigure(const NodeConfig &current,
                                                const NodeConfig &updated) {
  const auto from = layoutOf(current);
  const auto to = layoutOf(updated);
  if (to.dataDir.lexically_normal() != from.dataDir.lexically_normal()) {
    ensureUsable(to.dataDir);
  }
  if (to.logsDir.lexically_normal() != from.logsDir.lexically_normal()) {
    ensureUsable(to.logsDir);
  }

  LayoutTransaction txn("update of node \"" + current.name + "\"");
  for (const auto &dir : {to.configDir, to.dataDir, to.logsDir}) {
    makeDirectory(dir, txn);
  }
  writeConfigFiles(updated);
  return txn;
}

LayoutTransaction NodeMaterializer::prepareTarget(
    const NodeConfig &target, const std::string &description) const {
  const auto layout = layoutOf(target);
  std::error_code ec;
  if (fs::exists(layout.root, ec) && !fs::is_empty(layout.root, ec)) {
    throw FilesystemError("NodeMaterializer: Destination already exists",
                          layout.root.string());
  }
  ensureUsable(layout.dataDir);
  ensureUsable(layout.logsDir);

  LayoutTransaction txn(description);
  for (const auto &dir :
       {layout.root, layout.configDir, layout.dataDir, layout.logsDir}) {
    makeDirectory(dir, txn);
  }
  return txn;
}

LayoutTransaction NodeMaterializer::relocate(const NodeConfig &source,
                                             const NodeConfig &target,
                                             bool preserveData) {
  const auto from = layoutOf(source);
  const auto to = layoutOf(target);
  if (isWithin(to.root, from.root) || isWithin(from.root, to.root)) {
    throw FilesystemError(
        "NodeMaterializer: Destination overlaps the current node directory",
        to.root.string());
  }

  auto txn = prepareTarget(target, "move of node \"" + source.name + "\"");
  if (preserveData) {
    copyTree(from.dataDir, to.dataDir);
    copyTree(from.logsDir, to.logsDir);
  }
  copyExtraConfig(source, target);
  writeConfigFiles(target);

  txn.discardOnCommit(from.dataDir);
  txn.discardOnCommit(from.logsDir);
  txn.discardOnCommit(from.configDir);
  txn.discardOnCommit(from.root);

  steward::CompositeLogger::instance().debug(
      "NodeMaterializer: Node \"" + source.name + "\" staged at " +
      to.root.string() + (preserveData ? " with data" : " without data"));
  return txn;
}

LayoutTransaction NodeMaterializer::duplicate(const NodeConfig &source,
                                              const NodeConfig &target,
                                              bool copyData) {
  auto txn = prepareTarget(target, "copy of node \"" + source.name +
                                       "\" to \"" + target.name + "\"");
  if (copyData) {
    copyTree(layoutOf(source).dataDir, layoutOf(target).dataDir);
  }
  copyExtraConfig(source, target);
  writeConfigFiles(target);
  return txn;
}

void NodeMaterializer::remove(const NodeConfig &config, bool preserveData) {
  const auto layout = layoutOf(config);
  std::vector<fs::path> targets{layout.configDir};
  if (!preserveData) {
    targets.push_back(layout.dataDir);
    targets.push_back(layout.logsDir);
  }

  for (const auto &path : targets) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
      throw FilesystemError("NodeMaterializer: Cannot remove", path.string(),
                            ec);
    }
  }

  std::error_code ec;
  if (!preserveData && fs::is_directory(layout.root, ec) &&
      fs::is_empty(layout.root, ec)) {
    fs::remove(layout.root, ec);
  }
}

std::string NodeMaterializer::renderElasticsearchYml(
    const NodeConfig &config) const {
  std::ostringstream out;
  out << "# Search engine configuration for " << config.name << "\n"
      << "# Generated by NodeSteward\n\n"
      << "cluster.name: " << config.cluster << "\n"
      << "node.name: " << config.name << "\n\n"
      << "network.host: " << config.host << "\n"
      << "http.port: " << config.httpPort << "\n"
      << "transport.port: " << config.transportPort << "\n\n"
      << "path.data: " << config.dataPath << "\n"
      << "path.logs: " << config.logsPath << "\n\n"
      << "node.roles: [" << config.roles.toList() << "]\n"
      << "node.attr.custom_id: " << config.name << "\n\n"
      << "discovery.type: single-node\n"
      << "bootstrap.memory_lock: false\n\n"
      << "xpack.security.enabled: false\n"
      << "xpack.security.transport.ssl.enabled: false\n"
      << "xpack.security.http.ssl.enabled: false\n";
  return out.str();
}

std::string NodeMaterializer::renderJvmOptions(const NodeConfig &config) const {
  return "-Xms" + config.heapSize + "\n-Xmx" + config.heapSize + "\n";
}

std::string NodeMaterializer::renderLog4j(const NodeConfig &config) const {
  std::ostringstream out;
  out << "status = error\n\n"
      << "appender.console.type = Console\n"
      << "appender.console.name = console\n"
      << "appender.console.layout.type = PatternLayout\n"
      << "appender.console.layout.pattern = [%d{ISO8601}][%-5p][%-25c{1.}] "
         "[%node_name]%marker %m%n\n\n"
      << "appender.rolling.type = RollingFile\n"
      << "appender.rolling.name = rolling\n"
      << "appender.rolling.fileName = " << config.logsPath
      << "/elasticsearch.log\n"
      << "appender.rolling.filePattern = " << config.logsPath
      << "/elasticsearch-%i.log.gz\n"
      << "appender.rolling.layout.type = PatternLayout\n"
      << "appender.rolling.layout.pattern = [%d{ISO8601}][%-5p][%-25c{1.}] "
         "[%node_name]%marker %m%n\n"
      << "appender.rolling.policies.type = Policies\n"
      << "appender.rolling.policies.size.type = SizeBasedTriggeringPolicy\n"
      << "appender.rolling.policies.size.size = 128MB\n"
      << "appender.rolling.strategy.type = DefaultRolloverStrategy\n"
      << "appender.rolling.strategy.max = 32\n\n"
      << "rootLogger.level = info\n"
      << "rootLogger.appenderRef.console.ref = console\n"
      << "rootLogger.appenderRef.rolling.ref = rolling\n";
  return out.str();
}

std::string NodeMaterializer::renderLauncher(const NodeConfig &config) const {
  const auto configDir = layoutOf(config).configDir.string();
  std::ostringstream out;
  out << "#!/bin/sh\n"
      << "# Node: " << config.name << ", HTTP port " << config.httpPort
      << "\n\n"
      << "if [ \"$(id -u)\" = \"0\" ]; then\n"
      << "  echo \"Refusing to start the search engine as root\" >&2\n"
      << "  exit 1\n"
      << "fi\n\n"
      << "export ES_PATH_CONF=\"" << configDir << "\"\n"
      << "export ES_JAVA_OPTS=\"-Xms" << config.heapSize << " -Xmx"
      << config.heapSize << "\"\n\n"
      << "exec \"" << engineExecutable_ << "\"\n";
  return out.str();
}
