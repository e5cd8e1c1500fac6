#pragma once

#include <string>

namespace tracksync::util {

/*
  Identity for records in collections without natural names (sqlite):
  a random RFC4122 version 4 UUID in canonical text form, 36 chars.
*/
std::string NewIdentity();

} // namespace tracksync::util
