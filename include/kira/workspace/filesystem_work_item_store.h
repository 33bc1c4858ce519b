#pragma once

#include "kira/workspace/work_item_store.h"

#include <filesystem>

namespace kira::workspace {

// FilesystemWorkItemStore serves work items from a directory on disk.
//
// Every path handed in is resolved against the work folder and rejected with
// an I/O error when it would land outside it ("../x.md", absolute paths,
// symlinks pointing elsewhere). Writes go to a sibling temporary file that is
// renamed over the target.
class FilesystemWorkItemStore final : public IWorkItemStore {
 public:
  explicit FilesystemWorkItemStore(std::filesystem::path work_root);

  [[nodiscard]] const std::filesystem::path& work_root() const noexcept { return work_root_; }

  [[nodiscard]] core::Result<std::vector<std::string>, core::Error> list_work_items()
      const override;
  [[nodiscard]] core::Result<std::vector<std::string>, core::Error> list_markdown_files_in(
      std::string_view folder) const override;
  [[nodiscard]] core::Result<std::string, core::Error> read(std::string_view path) const override;
  [[nodiscard]] core::Result<bool, core::Error> write(std::string_view path,
                                                      std::string_view content) override;
  [[nodiscard]] std::optional<std::int64_t> modified_time(std::string_view path) const override;

 private:
  [[nodiscard]] core::Result<std::filesystem::path, core::Error> resolve(
      std::string_view path) const;

  std::filesystem::path work_root_;
};

}  // namespace kira::workspace
