#include "kira/workspace/filesystem_work_item_store.h"
#include "kira/workspace/project.h"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

using kira::workspace::FilesystemWorkItemStore;

namespace {

// Creates a scratch work folder and removes it when the test ends.
class ScratchWorkFolder {
 public:
  explicit ScratchWorkFolder(const std::string& name)
      : root_(fs::temp_directory_path() / name) {
    fs::remove_all(root_);
    fs::create_directories(root_ / ".work");
  }
  ~ScratchWorkFolder() {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }
  ScratchWorkFolder(const ScratchWorkFolder&) = delete;
  ScratchWorkFolder& operator=(const ScratchWorkFolder&) = delete;

  [[nodiscard]] fs::path root() const { return root_; }
  [[nodiscard]] fs::path work() const { return root_ / ".work"; }

  void write(const fs::path& relative, const std::string& content) const {
    const fs::path target = work() / relative;
    fs::create_directories(target.parent_path());
    std::ofstream(target, std::ios::binary) << content;
  }

 private:
  fs::path root_;
};

}  // namespace

TEST_CASE("Filesystem store lists work items", "[workspace][filesystem]") {
  const ScratchWorkFolder scratch("kira_fs_store_list");
  scratch.write("1_todo/002-b.md", "b");
  scratch.write("1_todo/001-a.md", "a");
  scratch.write("2_doing/003-c.md", "c");
  scratch.write("2_doing/notes.txt", "ignored");
  scratch.write("IDEAS.md", "ideas");
  scratch.write("templates/task-template.md", "template");
  scratch.write("0_backlog/nested/004-d.md", "d");

  const FilesystemWorkItemStore store(scratch.work());

  const auto items = store.list_work_items();
  REQUIRE(items.has_value());
  REQUIRE(items.value() == std::vector<std::string>{
                               "0_backlog/nested/004-d.md",
                               "1_todo/001-a.md",
                               "1_todo/002-b.md",
                               "2_doing/003-c.md",
                           });

  SECTION("single folder listings are names only and not recursive") {
    const auto doing = store.list_markdown_files_in("2_doing");
    REQUIRE(doing.has_value());
    REQUIRE(doing.value() == std::vector<std::string>{"003-c.md"});

    const auto backlog = store.list_markdown_files_in("0_backlog");
    REQUIRE(backlog.has_value());
    REQUIRE(backlog.value().empty());
  }

  SECTION("a missing folder is empty, not an error") {
    const auto missing = store.list_markdown_files_in("9_nowhere");
    REQUIRE(missing.has_value());
    REQUIRE(missing.value().empty());

    const FilesystemWorkItemStore absent(scratch.root() / "does-not-exist");
    const auto none = absent.list_work_items();
    REQUIRE(none.has_value());
    REQUIRE(none.value().empty());
  }
}

TEST_CASE("Filesystem store reads and writes", "[workspace][filesystem]") {
  const ScratchWorkFolder scratch("kira_fs_store_rw");
  scratch.write("1_todo/001.md", "---\nid: 001\n---\nbody\r\nwith crlf");
  FilesystemWorkItemStore store(scratch.work());

  SECTION("reads return the exact bytes") {
    const auto content = store.read("1_todo/001.md");
    REQUIRE(content.has_value());
    REQUIRE(content.value() == "---\nid: 001\n---\nbody\r\nwith crlf");
  }

  SECTION("writes replace the file and leave no temporary behind") {
    REQUIRE(store.write("1_todo/001.md", "replaced").has_value());
    REQUIRE(store.read("1_todo/001.md").value() == "replaced");
    REQUIRE_FALSE(fs::exists(scratch.work() / "1_todo" / "001.md.kira-tmp"));
    REQUIRE(store.modified_time("1_todo/001.md").has_value());
  }

  SECTION("a write into a missing directory fails") {
    const auto written = store.write("9_nowhere/001.md", "x");
    REQUIRE_FALSE(written.has_value());
    REQUIRE(written.error().kind == kira::core::ErrorKind::kIo);
    REQUIRE(store.read("1_todo/001.md").value() == "---\nid: 001\n---\nbody\r\nwith crlf");
  }

  SECTION("missing files") {
    REQUIRE_FALSE(store.read("1_todo/404.md").has_value());
    REQUIRE_FALSE(store.modified_time("1_todo/404.md").has_value());
  }
}

TEST_CASE("Filesystem store stays inside the work folder", "[workspace][filesystem]") {
  const ScratchWorkFolder scratch("kira_fs_store_confine");
  std::ofstream(scratch.root() / "outside.md") << "secret";
  FilesystemWorkItemStore store(scratch.work());

  for (const std::string path : {"../outside.md", "1_todo/../../outside.md"}) {
    INFO(path);
    const auto read = store.read(path);
    REQUIRE_FALSE(read.has_value());
    REQUIRE(read.error().message == "path escapes work folder: " + path);
    REQUIRE_FALSE(store.write(path, "x").has_value());
  }

  const std::string absolute = (scratch.root() / "outside.md").string();
  REQUIRE_FALSE(store.read(absolute).has_value());
  REQUIRE_FALSE(store.list_markdown_files_in("..").has_value());

  std::ifstream in(scratch.root() / "outside.md");
  std::string content;
  std::getline(in, content);
  REQUIRE(content == "secret");
}

TEST_CASE("load_project resolves the work folder and checks defaults", "[workspace][project]") {
  const ScratchWorkFolder scratch("kira_fs_project");
  const kira::core::FixedClock clock{kira::core::CalendarDate{2024, 6, 15}};

  SECTION("defaults") {
    const auto project = kira::workspace::load_project(scratch.root(), clock);
    REQUIRE(project.has_value());
    REQUIRE(project.value().work_root == scratch.root() / ".work");
  }

  SECTION("custom work folder") {
    std::ofstream(scratch.root() / "kira.yml") << "workspace:\n  work_folder: tasks\n";
    const auto project = kira::workspace::load_project(scratch.root(), clock);
    REQUIRE(project.has_value());
    REQUIRE(project.value().work_root == scratch.root() / "tasks");
  }

  SECTION("a broken default fails the load") {
    std::ofstream(scratch.root() / "kira.yml")
        << "fields:\n  due:\n    type: date\n    default: soon\n";
    const auto project = kira::workspace::load_project(scratch.root(), clock);
    REQUIRE_FALSE(project.has_value());
    REQUIRE(project.error().kind == kira::core::ErrorKind::kConfiguration);
    REQUIRE(project.error().message ==
            "field 'due': invalid default: invalid date default value 'soon': does not match "
            "format %Y-%m-%d");
  }
}
