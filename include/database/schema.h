#pragma once

#include "database/database.h"
#include <string>
#include <vector>

namespace cryptotrade {
namespace database {

static constexpr int SCHEMA_VERSION = 1;

// Creates every table and index if missing. Runs inside the caller's transaction.
void createSchema(Database& db);
int schemaVersion(Database& db);
std::vector<std::string> tableNames(Database& db);

}
}
