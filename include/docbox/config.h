#ifndef INCLUDE_DOCBOX_CONFIG_H_
#define INCLUDE_DOCBOX_CONFIG_H_

#include <string>
#include <filesystem>

#include "policy.h"

// docboxd only
extern std::string kListenHost;
extern int kListenPort;
extern int kMaxParallel;

// Applies an INI configuration file to the global settings and builds the
// policy from it. Keys that are absent keep their current values.
// Returns false if the file cannot be read or a value is invalid.
bool ParseConfig(const std::filesystem::path&, Policy& policy);

#endif  // INCLUDE_DOCBOX_CONFIG_H_
