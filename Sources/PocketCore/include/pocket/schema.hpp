#pragma once

#include "db.hpp"
#include <cstdint>

namespace pocket {

/// Bumped whenever ensure_schema() learns a new migration step.
constexpr int32_t current_schema_version = 3;

/// Create the wallets/transactions tables on a fresh database, or bring an
/// older transactions table forward by adding the recurrence columns it is
/// missing. Always (re)creates the partial unique index on
/// (parent_transaction_id, date) that makes instance generation idempotent.
void ensure_schema(database& db);

int32_t schema_version(database& db);

} // namespace pocket
