#pragma once

#include <cstdint>
#include <string>

#include "internal/util/ids.hpp"

namespace roster::db::model {

enum class RecordKind : uint8_t {
  kGroup      = 1,
  kMembership = 2,
  kInviteLink = 3,
  kCodeLookup = 4,
};

const char* RecordKindName(RecordKind kind);

/*
  Persistent record envelope.

  - address: derived location, primary key
  - data:    serialized roster.v1 record
  - payer:   identity that funded the deposit
  - deposit: storage allowance reserved at creation, returned on delete
*/
struct StoredRecord {
  util::Address  address{};
  RecordKind     kind = RecordKind::kGroup;
  std::string    data;
  util::Identity payer{};
  uint64_t       deposit       = 0;
  uint64_t       created_at_ms = 0;
};

struct Refund {
  util::Identity recipient{};
  uint64_t       amount = 0;
};

} // namespace roster::db::model
