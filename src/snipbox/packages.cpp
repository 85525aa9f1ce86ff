#include "packages.h"

#include <regex>
#include <algorithm>

#include <fmt/ranges.h>
#include <snipbox/errors.h>
#include "utils.h"

std::vector<std::string> NormalizePinnedPackages(const std::vector<std::string>& packages) {
  static const std::regex kPinned(R"(^[A-Za-z0-9_.\-]+==[^=\s]+$)");
  std::vector<std::string> ret, invalid;
  for (auto& i : packages) {
    std::string pkg = Trim(i);
    if (pkg.empty()) continue;
    if (std::regex_match(pkg, kPinned)) {
      ret.push_back(pkg);
    } else {
      invalid.push_back(pkg);
    }
  }
  if (invalid.size()) {
    throw ConfigError(fmt::format(
        "Packages must be pinned as name==version; invalid: {}", fmt::join(invalid, ", ")));
  }
  std::sort(ret.begin(), ret.end());
  ret.erase(std::unique(ret.begin(), ret.end()), ret.end());
  return ret;
}

std::string EnvironmentHash(const std::string& python_version, const std::string& env_namespace,
                            const std::vector<std::string>& pinned) {
  std::string material = python_version + "|" + env_namespace;
  for (auto& i : pinned) material += "|" + i;
  return Sha256Hex(material).substr(0, 16);
}
