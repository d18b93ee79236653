/**
 * @file id_generator.h
 * @brief Resource identifiers
 */

#pragma once

#include <string>
#include <uuid/uuid.h>

namespace common {

/**
 * @brief Random (version 4) UUID in lower-case canonical form
 *
 * Used for account, order, authorization and challenge ids. They appear in
 * resource URLs, so they must not be guessable.
 */
inline std::string generateUuid() {
    uuid_t uuid;
    uuid_generate_random(uuid);
    char buf[37];
    uuid_unparse_lower(uuid, buf);
    return std::string(buf);
}

} // namespace common
