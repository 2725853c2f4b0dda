#ifndef IDTOK_CORE_BUILTIN_TABLES_H
#define IDTOK_CORE_BUILTIN_TABLES_H

#include "scrambled_table.h"

namespace idtok::core {

// Compiled-in secrets. Replacing either table invalidates every identifier
// issued under the old one.
const ScrambledTable& BuiltinKdfSaltTable();
const ScrambledTable& BuiltinApiKeyTable();

}  // namespace idtok::core

#endif  // IDTOK_CORE_BUILTIN_TABLES_H
