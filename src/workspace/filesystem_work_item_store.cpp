#include "kira/workspace/filesystem_work_item_store.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace kira::workspace {

namespace fs = std::filesystem;

namespace {

using PathList = core::Result<std::vector<std::string>, core::Error>;

constexpr std::string_view kTempSuffix = ".kira-tmp";

bool has_markdown_extension(const fs::path& path) {
  return path.extension() == kMarkdownExtension;
}

}  // namespace

FilesystemWorkItemStore::FilesystemWorkItemStore(fs::path work_root)
    : work_root_(std::move(work_root)) {}

core::Result<fs::path, core::Error> FilesystemWorkItemStore::resolve(
    const std::string_view path) const {
  using R = core::Result<fs::path, core::Error>;

  const fs::path relative{std::string(path)};
  if (path.empty() || relative.is_absolute() || relative.has_root_name()) {
    return R::err(core::io_error("path escapes work folder: " + std::string(path)));
  }

  std::error_code ec;
  const fs::path root = fs::weakly_canonical(work_root_, ec);
  if (ec) {
    return R::err(core::io_error("cannot resolve work folder: " + ec.message()));
  }
  const fs::path target = fs::weakly_canonical(work_root_ / relative, ec);
  if (ec) {
    return R::err(core::io_error("cannot resolve path " + std::string(path) + ": " +
                                 ec.message()));
  }

  const fs::path inside = target.lexically_relative(root);
  if (inside.empty() || *inside.begin() == "..") {
    return R::err(core::io_error("path escapes work folder: " + std::string(path)));
  }
  return R::ok(target);
}

PathList FilesystemWorkItemStore::list_work_items() const {
  std::error_code ec;
  if (!fs::is_directory(work_root_, ec)) {
    return PathList::ok({});
  }

  std::vector<std::string> result;
  fs::recursive_directory_iterator it(work_root_, ec);
  if (ec) {
    return PathList::err(core::io_error("failed to list work folder: " + ec.message()));
  }
  const fs::recursive_directory_iterator end{};
  for (; it != end; it.increment(ec)) {
    if (ec) {
      return PathList::err(core::io_error("failed to list work folder: " + ec.message()));
    }
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec) || !has_markdown_extension(it->path())) {
      continue;
    }
    std::string relative = it->path().lexically_relative(work_root_).generic_string();
    if (is_work_item_path(relative)) {
      result.push_back(std::move(relative));
    }
  }
  if (ec) {
    return PathList::err(core::io_error("failed to list work folder: " + ec.message()));
  }

  std::sort(result.begin(), result.end());
  return PathList::ok(std::move(result));
}

PathList FilesystemWorkItemStore::list_markdown_files_in(const std::string_view folder) const {
  auto dir = resolve(folder);
  if (!dir.has_value()) {
    return PathList::err(dir.error());
  }

  std::error_code ec;
  if (!fs::is_directory(dir.value(), ec)) {
    return PathList::ok({});
  }

  std::vector<std::string> result;
  for (fs::directory_iterator it(dir.value(), ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if (it->is_regular_file(entry_ec) && has_markdown_extension(it->path())) {
      result.push_back(it->path().filename().string());
    }
  }
  if (ec) {
    return PathList::err(core::io_error("failed to read folder " + std::string(folder) + ": " +
                                        ec.message()));
  }

  std::sort(result.begin(), result.end());
  return PathList::ok(std::move(result));
}

core::Result<std::string, core::Error> FilesystemWorkItemStore::read(
    const std::string_view path) const {
  using R = core::Result<std::string, core::Error>;

  auto target = resolve(path);
  if (!target.has_value()) {
    return R::err(target.error());
  }

  std::ifstream in(target.value(), std::ios::binary);
  if (!in) {
    return R::err(core::io_error("failed to read file: " + std::string(path)));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return R::err(core::io_error("failed to read file: " + std::string(path)));
  }
  return R::ok(buffer.str());
}

core::Result<bool, core::Error> FilesystemWorkItemStore::write(const std::string_view path,
                                                               const std::string_view content) {
  using R = core::Result<bool, core::Error>;

  auto target = resolve(path);
  if (!target.has_value()) {
    return R::err(target.error());
  }

  fs::path temp = target.value();
  temp += std::string(kTempSuffix);

  std::error_code ec;
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return R::err(core::io_error("failed to write file: " + std::string(path)));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
      fs::remove(temp, ec);
      return R::err(core::io_error("failed to write file: " + std::string(path)));
    }
  }

  fs::rename(temp, target.value(), ec);
  if (ec) {
    const std::string reason = ec.message();
    fs::remove(temp, ec);
    return R::err(core::io_error("failed to replace file " + std::string(path) + ": " + reason));
  }
  return R::ok(true);
}

std::optional<std::int64_t> FilesystemWorkItemStore::modified_time(
    const std::string_view path) const {
  auto target = resolve(path);
  if (!target.has_value()) {
    return std::nullopt;
  }
  std::error_code ec;
  const auto stamp = fs::last_write_time(target.value(), ec);
  if (ec) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(stamp.time_since_epoch().count());
}

}  // namespace kira::workspace
