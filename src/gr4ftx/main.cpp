#include "commands/backups.hpp"
#include "commands/check.hpp"
#include "commands/fix.hpp"
#include <args.hxx>
#include <iostream>
#include <redlog.hpp>
#include <string>

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

void apply_verbosity() {
  auto verbosity_count = args::get(verbosity_flag);

  redlog::level log_level = redlog::level::info;
  switch (verbosity_count) {
  case 0:
  case 1:
    log_level = redlog::level::info;
    break;
  default:
    log_level = redlog::level::debug;
    break;
  }

  redlog::set_level(log_level);
}

// flags shared by every command that targets a gradle template
struct target_flags {
  args::ValueFlag<std::string> project;
  args::ValueFlag<std::string> file;
  args::ValueFlag<std::string> toolchain;
  args::ValueFlag<std::string> version_set;
  args::ValueFlag<std::string> recipe;
  args::ValueFlag<std::string> backup_dir;
  args::ValueFlag<size_t> retention;
  args::ValueFlag<std::string> build_target;

  explicit target_flags(args::Command& command)
      : project(command, "project", "unity project root (default: current directory)", {'p', "project"}),
        file(command, "file", "gradle file to patch instead of the project template", {'f', "file"}),
        toolchain(command, "toolchain", "auto, modern or legacy", {"toolchain"}),
        version_set(command, "name", "version set name, overrides --toolchain", {"version-set"}),
        recipe(command, "recipe", "lua recipe replacing the built-in fragments", {"recipe"}),
        backup_dir(command, "dir", "backup directory", {"backup-dir"}),
        retention(command, "count", "backups kept per file", {"retention"}),
        build_target(command, "target", "active build target (default: android)", {"target"}) {}

  gr4ftx::commands::target_options to_options() {
    gr4ftx::commands::target_options options;
    options.project = project ? args::get(project) : std::string();
    options.file = file ? args::get(file) : std::string();
    options.toolchain = toolchain ? args::get(toolchain) : std::string();
    options.version_set = version_set ? args::get(version_set) : std::string();
    options.recipe = recipe ? args::get(recipe) : std::string();
    options.backup_dir = backup_dir ? args::get(backup_dir) : std::string();
    if (retention) {
      options.retention = args::get(retention);
    }
    options.build_target = build_target ? args::get(build_target) : std::string();
    return options;
  }
};
} // namespace cli

int cmd_check(cli::target_flags& flags) {
  cli::apply_verbosity();
  return gr4ftx::commands::check(flags.to_options());
}

int cmd_fix(
    cli::target_flags& flags, args::Flag& best_effort_flag, args::Flag& dry_run_flag,
    gr4ft::host::hook_trigger trigger
) {
  auto log = redlog::get_logger("gr4ftx.fix");
  cli::apply_verbosity();

  auto options = flags.to_options();
  options.best_effort_backup = args::get(best_effort_flag);
  options.dry_run = args::get(dry_run_flag);

  log.dbg("running patch", redlog::field("trigger", gr4ft::host::hook_trigger_name(trigger)));
  return gr4ftx::commands::fix(options, trigger);
}

int cmd_backups(cli::target_flags& flags) {
  cli::apply_verbosity();
  return gr4ftx::commands::backups(flags.to_options());
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser("gr4ftx - gradle template dependency patcher");
  parser.helpParams.showTerminator = false;
  parser.helpParams.helpindent = 2;
  parser.helpParams.width = 120;

  parser.Add(cli::arguments);

  args::Command check_cmd(parser, "check", "report the state of every fragment without writing");
  cli::target_flags check_flags(check_cmd);

  args::Command fix_cmd(parser, "fix", "add missing fragments and replace outdated ones");
  cli::target_flags fix_flags(fix_cmd);
  args::Flag fix_best_effort_flag(
      fix_cmd, "best-effort-backup", "continue additive edits when the backup fails", {"best-effort-backup"}
  );
  args::Flag fix_dry_run_flag(fix_cmd, "dry-run", "compute and report without writing", {"dry-run"});

  args::Command prebuild_cmd(parser, "prebuild", "patch before a build; exits non-zero to halt it");
  cli::target_flags prebuild_flags(prebuild_cmd);
  args::Flag prebuild_best_effort_flag(
      prebuild_cmd, "best-effort-backup", "continue additive edits when the backup fails", {"best-effort-backup"}
  );
  args::Flag prebuild_dry_run_flag(prebuild_cmd, "dry-run", "compute and report without writing", {"dry-run"});

  args::Command backups_cmd(parser, "backups", "list backups of the target file, newest first");
  cli::target_flags backups_flags(backups_cmd);

  try {
    parser.ParseCLI(argc, argv);

    if (check_cmd) {
      return cmd_check(check_flags);
    } else if (fix_cmd) {
      return cmd_fix(fix_flags, fix_best_effort_flag, fix_dry_run_flag, gr4ft::host::hook_trigger::manual);
    } else if (prebuild_cmd) {
      return cmd_fix(
          prebuild_flags, prebuild_best_effort_flag, prebuild_dry_run_flag, gr4ft::host::hook_trigger::prebuild
      );
    } else if (backups_cmd) {
      return cmd_backups(backups_flags);
    } else {
      std::cerr << "error: no command specified" << std::endl;
      std::cerr << parser;
      return 1;
    }

  } catch (const args::Help&) {
    std::cout << parser;
    return 0;
  } catch (const args::ParseError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  } catch (const args::ValidationError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  }

  return 0;
}
