#pragma once

#include <cstdint>
#include <string>

namespace shopstack::db::model {

/*
  Running artifact of one compute target.

  Only a succeeded Deploy stage writes this row.
*/
struct ReleaseRecord {
  std::string target;
  std::string artifact;
  std::string revision;
  std::string execution_id;
  uint64_t    updated_at_ms = 0;

  bool operator==(const ReleaseRecord&) const = default;
};

} // namespace shopstack::db::model
