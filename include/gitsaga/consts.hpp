#pragma once
#include <cstddef>
#include <string_view>

namespace gitsaga::consts {

// Directory and file names
inline constexpr std::string_view kGitDir          = ".git";
inline constexpr std::string_view kInfoDir         = "info";
inline constexpr std::string_view kExcludeFile     = "exclude";
inline constexpr std::string_view kWorktreeFolder  = ".twig";
inline constexpr std::string_view kLocalWorktree   = "local";
inline constexpr std::string_view kScratchDir      = ".gitsaga";
inline constexpr std::string_view kScratchTmpDir   = "tmp";
inline constexpr std::string_view kCaptureTmpDir   = "gitsaga-tmp";
inline constexpr std::string_view kSettingsFile    = "gitsaga.conf";
inline constexpr std::string_view kSettingsEnv     = "GITSAGA_CONFIG";
inline constexpr std::string_view kArchiveSuffix   = ".tar.gz";

// Shared editor configuration linked into every new worktree
inline constexpr std::string_view kSharedConfigDir  = ".claude";
inline constexpr std::string_view kSharedNotesFile  = "CLAUDE.local.md";

// Ref prefixes
inline constexpr std::string_view kHeadsPrefix      = "refs/heads/";
inline constexpr std::string_view kRemoteHeadRef    = "refs/remotes/origin/HEAD";
inline constexpr std::string_view kRemotePrefix     = "refs/remotes/origin/";

// Checkpoints: one ref per checkpoint, commit authored by this identity
inline constexpr std::string_view kCheckpointRefPrefix = "refs/gitsaga-checkpoint/";
inline constexpr std::string_view kCheckpointHeader    = "GITSAGA-CHECKPOINT";
inline constexpr std::string_view kCheckpointVersion   = "v1";
inline constexpr std::string_view kCheckpointAuthor    = "gitsaga";
inline constexpr std::string_view kCheckpointEmail     = "gitsaga@local";

// Default branch candidates, in order of preference after the remote HEAD
inline constexpr std::string_view kMainBranch       = "main";
inline constexpr std::string_view kMasterBranch     = "master";

// Worktree naming
inline constexpr std::string_view kWorktreeNamePrefix = "workspace-";
inline constexpr int kMaxNameAttempts = 100;

// Stash labels
inline constexpr std::string_view kCleanBackupMessage = "gitsaga-clean-backup";
inline constexpr std::string_view kPopRestoreMessage  = "gitsaga-stash-pop-restore";

// Object ID sizes
inline constexpr std::size_t kOidRawLen = 20;  // SHA-1 digest bytes
inline constexpr std::size_t kOidHexLen = 40;  // hex characters
inline constexpr std::string_view kEmptyTree = "4b825dc642cb6eb9a060e54bf8d69288fbee4904";

// Tar
inline constexpr std::size_t kTarBlock = 512;

} // namespace gitsaga::consts
