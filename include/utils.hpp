#ifndef UTILS_HPP
#define UTILS_HPP

#include <uuid/uuid.h>

#include <string>

namespace meshlink {

static std::string generate_uuid() {
  uuid_t uuid;
  uuid_generate(uuid);
  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);
  return uuid_str;
}

}  // namespace meshlink

#endif  // UTILS_HPP
