#include "kira/workspace/inmemory_work_item_store.h"

#include <utility>

namespace kira::workspace {

void InMemoryWorkItemStore::put(std::string path, std::string content,
                                const std::int64_t modified_time) {
  files_[std::move(path)] = Entry{std::move(content), modified_time};
}

void InMemoryWorkItemStore::fail_writes_to(std::string path) {
  failing_writes_.insert(std::move(path));
}

core::Result<std::vector<std::string>, core::Error> InMemoryWorkItemStore::list_work_items()
    const {
  std::vector<std::string> result;
  for (const auto& [path, entry] : files_) {
    if (is_work_item_path(path)) {
      result.push_back(path);
    }
  }
  return core::Result<std::vector<std::string>, core::Error>::ok(std::move(result));
}

core::Result<std::vector<std::string>, core::Error> InMemoryWorkItemStore::list_markdown_files_in(
    const std::string_view folder) const {
  const std::string prefix = std::string(folder) + "/";
  std::vector<std::string> result;
  for (const auto& [path, entry] : files_) {
    if (path.rfind(prefix, 0) != 0) {
      continue;
    }
    const std::string name = path.substr(prefix.size());
    if (name.find('/') == std::string::npos && name.size() > kMarkdownExtension.size() &&
        name.substr(name.size() - kMarkdownExtension.size()) == kMarkdownExtension) {
      result.push_back(name);
    }
  }
  return core::Result<std::vector<std::string>, core::Error>::ok(std::move(result));
}

core::Result<std::string, core::Error> InMemoryWorkItemStore::read(
    const std::string_view path) const {
  const auto it = files_.find(path);
  if (it == files_.end()) {
    return core::Result<std::string, core::Error>::err(
        core::io_error("file not found: " + std::string(path)));
  }
  return core::Result<std::string, core::Error>::ok(it->second.content);
}

core::Result<bool, core::Error> InMemoryWorkItemStore::write(const std::string_view path,
                                                             const std::string_view content) {
  if (failing_writes_.find(path) != failing_writes_.end()) {
    return core::Result<bool, core::Error>::err(
        core::io_error("failed to write file: " + std::string(path)));
  }
  files_[std::string(path)] = Entry{std::string(content), ++write_clock_};
  return core::Result<bool, core::Error>::ok(true);
}

std::optional<std::int64_t> InMemoryWorkItemStore::modified_time(
    const std::string_view path) const {
  const auto it = files_.find(path);
  if (it == files_.end()) {
    return std::nullopt;
  }
  return it->second.modified_time;
}

std::string InMemoryWorkItemStore::content(const std::string_view path) const {
  const auto it = files_.find(path);
  return it == files_.end() ? std::string{} : it->second.content;
}

}  // namespace kira::workspace
