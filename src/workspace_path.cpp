#include "workspace_path.hpp"

#include <cctype>
#include <utility>
#include <vector>

namespace bridge {
namespace {

static bool HasDrivePrefix(const std::string& s) {
  return s.size() >= 2 && std::isalpha(static_cast<unsigned char>(s[0])) && s[1] == ':';
}

static std::vector<std::string> SplitSegments(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == '/') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

}  // namespace

std::string NormalizeWorkspacePath(const std::string& path) {
  if (path.empty()) return path;

  std::string s = path;
  for (auto& c : s) {
    if (c == '\\') c = '/';
  }

  std::string root;
  if (HasDrivePrefix(s) && (s.size() == 2 || s[2] == '/')) {
    root = s.substr(0, 2) + "/";
    s = s.substr(2);
  } else if (s.front() == '/') {
    root = "/";
  }
  const bool absolute = !root.empty();

  std::vector<std::string> stack;
  for (auto& seg : SplitSegments(s)) {
    if (seg == ".") continue;
    if (seg == "..") {
      if (!stack.empty() && stack.back() != "..") {
        stack.pop_back();
      } else if (!absolute) {
        stack.push_back(seg);
      }
      continue;
    }
    stack.push_back(std::move(seg));
  }

  std::string out = root;
  for (size_t i = 0; i < stack.size(); i++) {
    if (i > 0) out += '/';
    out += stack[i];
  }
  if (out.empty()) return ".";
  return out;
}

bool IsAbsoluteWorkspacePath(const std::string& path) {
  const std::string n = NormalizeWorkspacePath(path);
  if (n.empty()) return false;
  if (n.front() == '/') return true;
  return HasDrivePrefix(n) && n.size() >= 3 && n[2] == '/';
}

}  // namespace bridge
