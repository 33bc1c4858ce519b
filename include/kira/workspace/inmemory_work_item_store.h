#pragma once

#include "kira/workspace/work_item_store.h"

#include <functional>
#include <map>
#include <set>

namespace kira::workspace {

// InMemoryWorkItemStore keeps files in a std::map keyed by relative path, so
// listing order is deterministic. Modification times are whatever the test
// sets; writes bump a counter so rewritten files become the newest.
class InMemoryWorkItemStore final : public IWorkItemStore {
 public:
  void put(std::string path, std::string content, std::int64_t modified_time = 0);

  // Makes every later write to `path` fail with an I/O error.
  void fail_writes_to(std::string path);

  [[nodiscard]] core::Result<std::vector<std::string>, core::Error> list_work_items()
      const override;
  [[nodiscard]] core::Result<std::vector<std::string>, core::Error> list_markdown_files_in(
      std::string_view folder) const override;
  [[nodiscard]] core::Result<std::string, core::Error> read(std::string_view path) const override;
  [[nodiscard]] core::Result<bool, core::Error> write(std::string_view path,
                                                      std::string_view content) override;
  [[nodiscard]] std::optional<std::int64_t> modified_time(std::string_view path) const override;

  // Raw content for assertions; empty when the path does not exist.
  [[nodiscard]] std::string content(std::string_view path) const;

 private:
  struct Entry {
    std::string content;
    std::int64_t modified_time{0};
  };

  std::map<std::string, Entry, std::less<>> files_;
  std::set<std::string, std::less<>> failing_writes_;
  std::int64_t write_clock_{1'000'000};
};

}  // namespace kira::workspace
