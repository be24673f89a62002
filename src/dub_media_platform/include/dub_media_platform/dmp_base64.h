#pragma once

#include "dmp_errors.h"
#include <cstdint>
#include <string>
#include <vector>

namespace dmp {

// Decode standard base64 text (as returned by the speech-synthesis
// collaborator). ASCII whitespace is ignored; any other character outside
// the alphabet is DecodeFailed.
Result<std::vector<uint8_t>> DecodeBase64(const std::string& text);

} // namespace dmp
