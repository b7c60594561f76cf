#include "cli/registry.hpp"

int cmd_branch(int, char **);
int cmd_switch(int, char **);
int cmd_ensure_branch(int, char **);
int cmd_reset_default(int, char **);
int cmd_detach(int, char **);
int cmd_reattach(int, char **);
int cmd_clean(int, char **);
int cmd_stash_push(int, char **);
int cmd_stash_pop(int, char **);
int cmd_stash_apply(int, char **);
int cmd_capture(int, char **);
int cmd_apply(int, char **);
int cmd_worktree(int, char **);
int cmd_checkpoint(int, char **);
int cmd_config(int, char **);

namespace gitsaga::cli {

void register_all_commands() {
  register_command("branch", ::cmd_branch,
                   "Create and check out a branch: gitsaga branch <name> [--base <ref>]");
  register_command("switch", ::cmd_switch, "Check out an existing branch: gitsaga switch <name>");
  register_command("ensure-branch", ::cmd_ensure_branch,
                   "Switch to a branch, creating it if missing: gitsaga ensure-branch <name> "
                   "[--base <ref>]");
  register_command("reset-default", ::cmd_reset_default,
                   "Switch back to the default branch (refuses uncommitted changes)");
  register_command("detach", ::cmd_detach, "Detach HEAD at the current commit");
  register_command("reattach", ::cmd_reattach,
                   "Point a branch at HEAD and check it out: gitsaga reattach <name>");
  register_command("clean", ::cmd_clean,
                   "Discard all local changes, keeping a backup on the stash");
  register_command("stash-push", ::cmd_stash_push,
                   "Stash everything, untracked files included: gitsaga stash-push [-m <message>]");
  register_command("stash-pop", ::cmd_stash_pop, "Pop the newest stash entry");
  register_command("stash-apply", ::cmd_stash_apply,
                   "Apply and drop a stash entry by commit: gitsaga stash-apply <sha>");
  register_command("capture", ::cmd_capture,
                   "Capture the working tree: gitsaga capture [--last <tree>] [--archive <file>] "
                   "[-o <manifest>]");
  register_command("apply", ::cmd_apply,
                   "Apply a captured snapshot: gitsaga apply <manifest> [--task <id>] [--run <id>]");
  register_command("worktree", ::cmd_worktree,
                   "Manage worktrees: gitsaga worktree <create [base] | create-for <branch> | "
                   "delete <path> | list | cleanup [keep...]>");
  register_command("checkpoint", ::cmd_checkpoint,
                   "Save and restore HEAD, index and working tree: gitsaga checkpoint "
                   "<capture [id] | revert <id> | diff <from> [to] | list | delete <id>>");
  register_command("config", ::cmd_config,
                   "Show or change settings: gitsaga config [<key> <value> | --unset <key>]");
}

} // namespace gitsaga::cli
