#pragma once

#include <cstdint>
#include <string>

constexpr const char* EZFT_VERSION = "0.3.3";

std::string full_version();

// Components of a dotted "proto.major.minor" string; 0 when malformed.
std::int64_t proto_version(const std::string& version);
std::int64_t major_version(const std::string& version);
std::int64_t minor_version(const std::string& version);
