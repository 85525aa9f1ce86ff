#ifndef SNIPBOX_PACKAGES_H_
#define SNIPBOX_PACKAGES_H_

#include <string>
#include <vector>

// Requires name==version for every entry; returns them sorted and unique.
// Throws ConfigError naming the offending entries.
std::vector<std::string> NormalizePinnedPackages(const std::vector<std::string>&);

// First 16 hex digits of SHA-256 over "<python>|<namespace>|<pin>|<pin>..."
std::string EnvironmentHash(const std::string& python_version, const std::string& env_namespace,
                            const std::vector<std::string>& pinned);

#endif  // SNIPBOX_PACKAGES_H_
