#ifndef INCLUDE_SNIPBOX_UTILS_H_
#define INCLUDE_SNIPBOX_UTILS_H_

#include <string>

#include "policy.h"
#include "execution.h"
#include "local_engine.h"
#include "container_engine.h"

const char* PolicyModeName(PolicyMode);
const char* ErrorKindName(ErrorKind);
const char* EnvCreatorName(EnvCreator);
const char* ContainerStateName(ContainerState);

// false if unknown
bool ParsePolicyMode(const std::string&, PolicyMode&);
bool ParseErrorKind(const std::string&, ErrorKind&);
bool ParseEnvCreator(const std::string&, EnvCreator&);

#endif  // INCLUDE_SNIPBOX_UTILS_H_
