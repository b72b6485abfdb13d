#ifndef INCLUDE_DOCBOX_UTILS_H_
#define INCLUDE_DOCBOX_UTILS_H_

#include <string>
#include <optional>

#include "result.h"

const char* OutcomeName(Outcome);
std::optional<Outcome> ParseOutcome(const std::string&);

const char* DiagnosticKindName(DiagnosticKind);

#endif  // INCLUDE_DOCBOX_UTILS_H_
