#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace repochurn::consts {

// Directory and file names of a local repository
inline constexpr std::string_view kGitDir      = ".git";
inline constexpr std::string_view kObjectsDir  = "objects";
inline constexpr std::string_view kPackDir     = "pack";
inline constexpr std::string_view kHeadFile    = "HEAD";
inline constexpr std::string_view kPackedRefs  = "packed-refs";

// Git object type strings
inline constexpr std::string_view kTypeBlob    = "blob";
inline constexpr std::string_view kTypeTree    = "tree";
inline constexpr std::string_view kTypeCommit  = "commit";
inline constexpr std::string_view kTypeTag     = "tag";

// File modes (octal)
inline constexpr std::uint32_t kModeTypeMask = 0170000;
inline constexpr std::uint32_t kModeFile     = 0100644; // regular file
inline constexpr std::uint32_t kModeExec     = 0100755; // executable file
inline constexpr std::uint32_t kModeTree     = 0040000; // directory entry in tree
inline constexpr std::uint32_t kModeSymlink  = 0120000;
inline constexpr std::uint32_t kModeGitlink  = 0160000; // submodule commit

// --- Object ID sizes ---
inline constexpr std::size_t kOidRawLen = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)
inline constexpr std::string_view kNullOid = "0000000000000000000000000000000000000000";

// --- Object store fanout ---
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in .git/objects

// --- Commit header prefixes (used in parsing/formatting) ---
inline constexpr std::string_view kTreePrefix      = "tree ";
inline constexpr std::string_view kRefPrefix       = "ref: ";
inline constexpr std::string_view kParentPrefix    = "parent ";
inline constexpr std::string_view kAuthorPrefix    = "author ";
inline constexpr std::string_view kCommitterPrefix = "committer ";

// --- Common characters ---
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

// --- Smart HTTP protocol ---
inline constexpr std::string_view kUploadPack        = "git-upload-pack";
inline constexpr std::string_view kAdvertisementType = "application/x-git-upload-pack-advertisement";
inline constexpr std::string_view kRequestType       = "application/x-git-upload-pack-request";
inline constexpr std::string_view kResultType        = "application/x-git-upload-pack-result";
inline constexpr std::string_view kServiceLine       = "# service=git-upload-pack\n";
inline constexpr std::string_view kHeadName          = "HEAD";
inline constexpr std::string_view kSymrefHead        = "symref=HEAD:";
inline constexpr std::string_view kErrPrefix         = "ERR ";
inline constexpr std::string_view kBlobNoneFilter    = "filter=blob:none";
inline constexpr std::string_view kDefaultAgent      = "repochurn";

// --- pkt-line framing ---
inline constexpr std::size_t kPktLenSize = 4;
inline constexpr std::size_t kPktMaxLen  = 65520;
inline constexpr std::string_view kFlushPkt  = "0000";
inline constexpr std::string_view kPackMagic = "PACK";

// --- Pack format ---
inline constexpr std::size_t kPackHeaderLen = 12;
inline constexpr std::uint8_t kPackCommit   = 1;
inline constexpr std::uint8_t kPackTree     = 2;
inline constexpr std::uint8_t kPackBlob     = 3;
inline constexpr std::uint8_t kPackTag      = 4;
inline constexpr std::uint8_t kPackOfsDelta = 6;
inline constexpr std::uint8_t kPackRefDelta = 7;

} // namespace repochurn::consts
