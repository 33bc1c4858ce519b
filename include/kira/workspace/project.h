#pragma once

#include "kira/core/clock.h"
#include "kira/core/result.h"
#include "kira/schema/schema.h"

#include <filesystem>

namespace kira::workspace {

// A project is a root directory with an optional kira.yml and a work folder
// (".work" unless workspace.work_folder says otherwise).
struct Project {
  std::filesystem::path root;
  std::filesystem::path work_root;
  schema::Schema schema;
};

// load_project loads and compiles the schema for `root`, then resolves every
// configured default once against `clock`. Any problem is a kConfiguration
// error and no file has been read besides kira.yml.
[[nodiscard]] core::Result<Project, core::Error> load_project(const std::filesystem::path& root,
                                                              const core::IClock& clock);

}  // namespace kira::workspace
