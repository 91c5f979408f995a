#include "stored_record.hpp"

namespace roster::db::model {

const char* RecordKindName(RecordKind kind) {
  switch (kind) {
    case RecordKind::kGroup:
      return "group";
    case RecordKind::kMembership:
      return "membership";
    case RecordKind::kInviteLink:
      return "invite_link";
    case RecordKind::kCodeLookup:
      return "code_lookup";
  }
  return "unknown";
}

} // namespace roster::db::model
