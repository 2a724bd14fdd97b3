#pragma once

/**
 * @file migrations.h
 * @brief Schema of the expense tracker database
 */

#include "schema_migrator.h"
#include <vector>

namespace infrastructure {

/// All schema migrations, oldest first
std::vector<common::Migration> ptetMigrations();

} // namespace infrastructure
