#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace gitrelay::consts {

// Remote repository layout
inline constexpr std::string_view kObjectsDir = "objects";
inline constexpr std::string_view kRefsDir    = "refs";
inline constexpr std::string_view kHeadFile   = "HEAD";
inline constexpr std::string_view kConfigFile = "relay.conf";

// Git object type strings
inline constexpr std::string_view kTypeBlob   = "blob";
inline constexpr std::string_view kTypeTree   = "tree";
inline constexpr std::string_view kTypeCommit = "commit";
inline constexpr std::string_view kTypeTag    = "tag";

// Tree entry mode of a gitlink (submodule commit, lives in another repository)
inline constexpr std::uint32_t kModeGitlink = 0160000;

// ——— Object ID sizes ———
inline constexpr std::size_t kOidRawLen = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)

// ——— Object store fanout ———
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." under objects/

// ——— Transfer ———
inline constexpr unsigned kDefaultJobs = 4;
inline constexpr unsigned kMaxJobs     = 64;

// ——— Object header prefixes (commit / tag parsing) ———
inline constexpr std::string_view kTreePrefix   = "tree ";
inline constexpr std::string_view kParentPrefix = "parent ";
inline constexpr std::string_view kObjectPrefix = "object ";
inline constexpr std::string_view kRefPrefix    = "ref: ";
inline constexpr std::string_view kRefsPrefix   = "refs/";

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

// ——— Remote helper protocol ———
inline constexpr std::string_view kCmdCapabilities = "capabilities";
inline constexpr std::string_view kCmdOption       = "option";
inline constexpr std::string_view kCmdList         = "list";
inline constexpr std::string_view kCmdPush         = "push";
inline constexpr std::string_view kCmdFetch        = "fetch";
inline constexpr std::string_view kForPush         = "for-push";
inline constexpr std::string_view kOptVerbosity    = "verbosity";
inline constexpr std::string_view kReplyOk         = "ok";
inline constexpr std::string_view kReplyError      = "error";
inline constexpr std::string_view kReplyUnsupported = "unsupported";
inline constexpr std::string_view kNonFastForward  = "non-fast-forward";

// ——— URL scheme ———
inline constexpr std::string_view kScheme = "relay://";

} // namespace gitrelay::consts
