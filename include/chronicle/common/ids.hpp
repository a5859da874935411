#pragma once

#include <chronicle/schema/primitives.hpp>

#include <string>
#include <string_view>

namespace chronicle::common {

/// Fresh random (version 4) UUID in canonical lowercase form.
std::string make_uuid();

/// Name-based (version 5) UUID. The same (scope, name) pair always yields
/// the same id, which lets retried work upsert instead of duplicating rows.
std::string make_deterministic_uuid(const std::string_view scope,
                                    const std::string_view name);

bool is_uuid(const std::string_view value);

/// Wall clock in milliseconds since the Unix epoch.
chronicle::schema::timestamp_milliseconds_t now_ms();

}  // namespace chronicle::common
