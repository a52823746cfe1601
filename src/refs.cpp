#include "repochurn/refs.hpp"

#include "repochurn/consts.hpp"
#include "repochurn/errors.hpp"
#include "repochurn/fs.hpp"
#include "repochurn/util.hpp"

#include <sstream>
#include <string>
#include <string_view>

namespace repochurn {

static std::filesystem::path head_file(const std::filesystem::path &git_dir) {
  return git_dir / consts::kHeadFile;
}

static std::filesystem::path ref_path(const std::filesystem::path &git_dir,
                                      const std::string &refname) {
  return git_dir / refname;
}

// packed-refs lines: "<hex> <refname>", plus "#" headers and "^<hex>" peeled tags
static std::optional<std::string> read_packed_ref(const std::filesystem::path &git_dir,
                                                  const std::string &refname) {
  const auto p = git_dir / consts::kPackedRefs;
  if (!fs::exists(p)) {
    return std::nullopt;
  }
  const auto bytes = fs::read_file(p);
  std::istringstream is(std::string(bytes.begin(), bytes.end()));
  std::string line;
  while (std::getline(is, line)) {
    strutil::rstrip_newlines(line);
    if (line.empty() || line[0] == '#' || line[0] == '^') {
      continue;
    }
    const auto sp = line.find(consts::kSpace);
    if (sp == std::string::npos) {
      continue;
    }
    if (std::string_view(line).substr(sp + 1) == refname) {
      return line.substr(0, sp);
    }
  }
  return std::nullopt;
}

std::optional<std::filesystem::path> find_git_dir(const std::filesystem::path &path) {
  const auto dotgit = path / consts::kGitDir;
  if (fs::exists(dotgit / consts::kHeadFile) && fs::exists(dotgit / consts::kObjectsDir)) {
    return dotgit;
  }
  if (fs::exists(path / consts::kHeadFile) && fs::exists(path / consts::kObjectsDir)) {
    return path; // bare
  }
  return std::nullopt;
}

std::optional<std::string> read_HEAD(const std::filesystem::path &git_dir) {
  const auto head_file_ptr = head_file(git_dir);
  if (!fs::exists(head_file_ptr)) {
    return std::nullopt;
  }
  auto bytes = fs::read_file(head_file_ptr);
  std::string str(bytes.begin(), bytes.end());
  return str;
}

std::optional<std::string> read_ref(const std::filesystem::path &git_dir,
                                    const std::string &refname) {
  const auto p = ref_path(git_dir, refname);
  if (!fs::exists(p)) {
    return read_packed_ref(git_dir, refname);
  }
  auto bytes = fs::read_file(p);
  std::string s(bytes.begin(), bytes.end());
  // strip trailing whitespace/newlines
  strutil::rstrip_newlines(s);
  return s;
}

std::string resolve_head(const std::filesystem::path &git_dir) {
  auto head_txt = read_HEAD(git_dir);
  if (!head_txt) {
    throw ObjectError("no HEAD in " + git_dir.string());
  }
  std::string s = *head_txt;
  strutil::rstrip_newlines(s);

  std::string tip;
  if (s.starts_with(consts::kRefPrefix)) {
    const std::string refname = s.substr(consts::kRefPrefix.size());
    const auto ref = read_ref(git_dir, refname);
    if (!ref) {
      throw EmptyRepositoryError(); // unborn branch
    }
    tip = *ref;
  } else {
    tip = s; // detached
  }
  if (!looks_hex40(tip)) {
    throw ObjectError("HEAD does not name a commit: '" + tip + "'");
  }
  return tip;
}

} // namespace repochurn
