#pragma once
#include <string>

namespace gitsaga {

// RFC 4122 version 4 identifier from the OpenSSL CSPRNG, lowercase with dashes.
std::string random_uuid();

} // namespace gitsaga
