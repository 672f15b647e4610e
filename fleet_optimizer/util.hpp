#pragma once
#include <string>

// Random RFC 4122 version-4 identifier.
std::string make_uuid();

// Local time as YYYY-MM-DDTHH:MM:SS.ffffff
std::string iso_timestamp();
