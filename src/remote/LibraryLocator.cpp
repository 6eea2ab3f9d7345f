#include "LibraryLocator.hpp"
#include <cstdlib>
#include <filesystem>

#ifdef _WIN32
namespace {

std::string envOrEmpty(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

// Joins only when the environment root is known; an unset root yields nothing.
void pushUnder(std::vector<std::string>& out, const std::string& root, const char* rel) {
  if (root.empty()) return;
  out.push_back((std::filesystem::path(root) / rel).string());
}

} // namespace
#endif

std::vector<std::string> splitSearchPathList(const std::string& list, char sep) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= list.size()) {
    size_t pos = list.find(sep, start);
    std::string tok = (pos == std::string::npos) ? list.substr(start) : list.substr(start, pos - start);
    if (!tok.empty()) out.push_back(tok);
    if (pos == std::string::npos) break; else start = pos + 1;
  }
  return out;
}

std::vector<std::string> defaultLibraryCandidates() {
  std::vector<std::string> out;
#ifdef _WIN32
  const std::string programFiles = envOrEmpty("PROGRAMFILES");
  const std::string programFilesX86 = envOrEmpty("PROGRAMFILES(X86)");
  const std::string windir = envOrEmpty("WINDIR");
#if defined(_WIN64)
  out.emplace_back("VoicemeeterRemote64.dll");
  pushUnder(out, programFiles, "VB/Voicemeeter/VoicemeeterRemote64.dll");
  pushUnder(out, programFilesX86, "VB/Voicemeeter/VoicemeeterRemote64.dll");
  pushUnder(out, windir, "System32/VoicemeeterRemote64.dll");
  // 32-bit fallbacks
  out.emplace_back("VoicemeeterRemote.dll");
  pushUnder(out, programFilesX86, "VB/Voicemeeter/VoicemeeterRemote.dll");
  pushUnder(out, windir, "SysWOW64/VoicemeeterRemote.dll");
#else
  out.emplace_back("VoicemeeterRemote.dll");
  pushUnder(out, programFiles, "VB/Voicemeeter/VoicemeeterRemote.dll");
  pushUnder(out, windir, "System32/VoicemeeterRemote.dll");
#endif
#elif defined(__APPLE__)
  out.emplace_back("libVoicemeeterRemote.dylib");
#else
  out.emplace_back("libVoicemeeterRemote.so");
#endif
  return out;
}

std::vector<std::string> libraryCandidates(const std::string& explicitPath,
                                           const std::vector<std::string>& extra) {
  std::vector<std::string> out;
  if (!explicitPath.empty()) out.push_back(explicitPath);
  out.insert(out.end(), extra.begin(), extra.end());
  for (auto& p : defaultLibraryCandidates()) out.push_back(std::move(p));
  return out;
}

bool shouldSkipCandidate(const std::string& path) {
  const std::filesystem::path p(path);
  if (!p.is_absolute()) return false;
  std::error_code ec;
  return !std::filesystem::exists(p, ec);
}
