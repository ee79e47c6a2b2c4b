#include <doctest/doctest.h>

#include "../test_helpers.hpp"
#include "gr4ft/core/config.hpp"
#include <string>

namespace {

using gr4ft::core::runtime_config;
using gr4ft::core::toolchain_selection;
using gr4ft::test_helpers::scoped_env;

} // namespace

TEST_CASE("config defaults are valid") {
  runtime_config config;
  std::string error;
  CHECK(config.validate(error));
  CHECK(error.empty());
  CHECK(config.backup_retention == 5);
  CHECK(config.backup_policy == gr4ft::engine::backup_policy::strict);
  CHECK(config.toolchain == toolchain_selection::auto_detect);
  CHECK(config.build_target == "android");
}

TEST_CASE("config reads GR4FT_ variables") {
  scoped_env env;
  env.set("GR4FT_BACKUP_DIR", "/tmp/gr4ft-backups");
  env.set("GR4FT_BACKUP_RETENTION", "9");
  env.set("GR4FT_BACKUP_POLICY", "best-effort");
  env.set("GR4FT_TOOLCHAIN", "Legacy");
  env.set("GR4FT_DRY_RUN", "yes");
  env.set("GR4FT_BUILD_TARGET", "ios");

  std::string error;
  auto config = runtime_config::from_environment(error);
  CHECK(error.empty());
  CHECK(config.backup_dir == "/tmp/gr4ft-backups");
  CHECK(config.backup_retention == 9);
  CHECK(config.backup_policy == gr4ft::engine::backup_policy::best_effort);
  CHECK(config.toolchain == toolchain_selection::legacy);
  CHECK(config.dry_run);
  CHECK(config.build_target == "ios");
}

TEST_CASE("config keeps the default retention for non-numeric values") {
  scoped_env env;
  env.set("GR4FT_BACKUP_RETENTION", "3x");

  std::string error;
  auto config = runtime_config::from_environment(error);
  CHECK(error.empty());
  CHECK(config.backup_retention == 5);
}

TEST_CASE("config reports invalid enum values") {
  scoped_env env;
  env.set("GR4FT_TOOLCHAIN", "ancient");

  std::string error;
  runtime_config::from_environment(error);
  CHECK(error.find("GR4FT_TOOLCHAIN") != std::string::npos);
}

TEST_CASE("config validation rejects zero retention") {
  runtime_config config;
  config.backup_retention = 0;
  std::string error;
  CHECK_FALSE(config.validate(error));
  CHECK_FALSE(error.empty());
}

TEST_CASE("config parses selections case-insensitively") {
  toolchain_selection selection = toolchain_selection::auto_detect;
  CHECK(gr4ft::core::parse_toolchain_selection(" MODERN ", selection));
  CHECK(selection == toolchain_selection::modern);
  CHECK_FALSE(gr4ft::core::parse_toolchain_selection("newest", selection));
  CHECK(selection == toolchain_selection::modern);

  auto policy = gr4ft::engine::backup_policy::best_effort;
  CHECK(gr4ft::core::parse_backup_policy("Strict", policy));
  CHECK(policy == gr4ft::engine::backup_policy::strict);
  CHECK_FALSE(gr4ft::core::parse_backup_policy("never", policy));
}
