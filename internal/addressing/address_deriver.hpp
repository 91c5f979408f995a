#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/stored_record.hpp"
#include "internal/util/ids.hpp"

namespace roster::addressing {

/*
  Deterministic record addressing.

  Every record lives at BLAKE2b-256(seeds) keyed by the program namespace:

    group        "group",        group_id
    membership   "group:member", group_id, member
    code lookup  "group:code",   lowercase(code)
    invite link  "group:invite", group_id, invite_code

  Seeds are length-prefixed before hashing, so no two seed lists share an
  encoding. The seed list travels with the address as its derivation proof;
  Verify() recomputes it.
*/

inline constexpr std::string_view kGroupSeed       = "group";
inline constexpr std::string_view kMembershipSeed  = "group:member";
inline constexpr std::string_view kCodeLookupSeed  = "group:code";
inline constexpr std::string_view kInviteLinkSeed  = "group:invite";

struct DerivedAddress {
  util::Address            address{};
  db::model::RecordKind    kind = db::model::RecordKind::kGroup;
  std::vector<std::string> seeds;
};

class AddressDeriver {
 public:
  explicit AddressDeriver(std::string program_namespace);

  DerivedAddress Group(const util::GroupId& group_id) const;
  DerivedAddress Membership(const util::GroupId& group_id, const util::Identity& member) const;
  DerivedAddress CodeLookup(std::string_view public_code) const;
  DerivedAddress InviteLink(const util::GroupId& group_id, std::string_view invite_code) const;

  bool Verify(const DerivedAddress& derived) const;

  const std::string& ProgramNamespace() const {
    return program_namespace_;
  }

 private:
  DerivedAddress Derive(db::model::RecordKind kind, std::vector<std::string> seeds) const;
  util::Address  Hash(const std::vector<std::string>& seeds) const;

  std::string             program_namespace_;
  std::array<uint8_t, 32> key_{};
};

} // namespace roster::addressing
