#pragma once

#include <string>
#include <uuid/uuid.h>

namespace ds::util {

inline std::string generateUuid() {
    uuid_t uuid;
    char uuidStr[37];
    uuid_generate(uuid);
    uuid_unparse_lower(uuid, uuidStr);
    return {uuidStr};
}

}
