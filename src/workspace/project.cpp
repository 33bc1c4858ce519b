#include "kira/workspace/project.h"

#include "kira/repair/default_resolver.h"
#include "kira/schema/schema_loader.h"

#include <utility>

namespace kira::workspace {

core::Result<Project, core::Error> load_project(const std::filesystem::path& root,
                                                const core::IClock& clock) {
  using R = core::Result<Project, core::Error>;

  auto schema = schema::load_schema(root);
  if (!schema.has_value()) {
    return R::err(schema.error());
  }

  auto verified = repair::verify_defaults(schema.value(), clock);
  if (!verified.has_value()) {
    return R::err(verified.error());
  }

  Project project;
  project.root = root;
  project.work_root = root / schema.value().work_folder;
  project.schema = std::move(schema.value());
  return R::ok(std::move(project));
}

}  // namespace kira::workspace
