#pragma once

#include "kira/core/result.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kira::workspace {

inline constexpr std::string_view kMarkdownExtension = ".md";
inline constexpr std::string_view kIdeasFileName = "IDEAS.md";
inline constexpr std::string_view kTemplateMarker = "template";

// is_work_item_path decides whether a path relative to the work folder is a
// work item: a .md file, not named IDEAS.md, with no "template" anywhere in
// the path.
inline bool is_work_item_path(const std::string_view relative_path) {
  if (relative_path.size() < kMarkdownExtension.size() ||
      relative_path.substr(relative_path.size() - kMarkdownExtension.size()) !=
          kMarkdownExtension) {
    return false;
  }
  if (relative_path.find(kTemplateMarker) != std::string_view::npos) {
    return false;
  }
  const auto slash = relative_path.rfind('/');
  const std::string_view name =
      slash == std::string_view::npos ? relative_path : relative_path.substr(slash + 1);
  return name != kIdeasFileName;
}

// IWorkItemStore isolates file access so the engine and repair passes can run
// against a real work folder or an in-memory tree in tests.
// All paths are relative to the work folder and use '/' separators.
class IWorkItemStore {
 public:
  virtual ~IWorkItemStore() = default;

  // Every work item below the work folder, sorted by relative path.
  [[nodiscard]] virtual core::Result<std::vector<std::string>, core::Error> list_work_items()
      const = 0;

  // Names of the .md files directly inside `folder`, sorted. A missing folder
  // yields an empty list.
  [[nodiscard]] virtual core::Result<std::vector<std::string>, core::Error> list_markdown_files_in(
      std::string_view folder) const = 0;

  [[nodiscard]] virtual core::Result<std::string, core::Error> read(
      std::string_view path) const = 0;

  // Replaces the file content. On failure the previous content is untouched.
  [[nodiscard]] virtual core::Result<bool, core::Error> write(std::string_view path,
                                                              std::string_view content) = 0;

  // Opaque, monotonically comparable modification stamp; nullopt if unknown.
  [[nodiscard]] virtual std::optional<std::int64_t> modified_time(std::string_view path) const = 0;

 protected:
  IWorkItemStore() = default;
  IWorkItemStore(const IWorkItemStore&) = default;
  IWorkItemStore& operator=(const IWorkItemStore&) = default;
  IWorkItemStore(IWorkItemStore&&) = default;
  IWorkItemStore& operator=(IWorkItemStore&&) = default;
};

}  // namespace kira::workspace
