#include "address_deriver.hpp"

#include <sodium/core.h>
#include <sodium/crypto_generichash_blake2b.h>
#include <sodium/utils.h>

#include <stdexcept>

#include "internal/validation/rules.hpp"

namespace roster::addressing {

namespace {

const unsigned char* to_unsigned(const char* data) {
  return reinterpret_cast<const unsigned char*>(data);
}

void UpdateLengthPrefixed(crypto_generichash_blake2b_state& st, const std::string& seed) {
  const auto len = static_cast<uint32_t>(seed.size());
  const unsigned char prefix[4] = {
      static_cast<unsigned char>(len & 0xFF),
      static_cast<unsigned char>((len >> 8) & 0xFF),
      static_cast<unsigned char>((len >> 16) & 0xFF),
      static_cast<unsigned char>((len >> 24) & 0xFF),
  };
  crypto_generichash_blake2b_update(&st, prefix, sizeof(prefix));
  crypto_generichash_blake2b_update(&st, to_unsigned(seed.data()), seed.size());
}

std::string_view SeedFor(db::model::RecordKind kind) {
  switch (kind) {
    case db::model::RecordKind::kGroup:
      return kGroupSeed;
    case db::model::RecordKind::kMembership:
      return kMembershipSeed;
    case db::model::RecordKind::kCodeLookup:
      return kCodeLookupSeed;
    case db::model::RecordKind::kInviteLink:
      return kInviteLinkSeed;
  }
  return {};
}

} // namespace

AddressDeriver::AddressDeriver(std::string program_namespace) : program_namespace_(std::move(program_namespace)) {
  if (program_namespace_.empty()) {
    throw std::invalid_argument("address deriver: program namespace must not be empty");
  }
  if (sodium_init() < 0) {
    throw std::runtime_error("address deriver: libsodium initialization failed");
  }

  // the namespace may be any length; hash it down to a fixed-size key
  crypto_generichash_blake2b(key_.data(), key_.size(), to_unsigned(program_namespace_.data()), program_namespace_.size(),
                             nullptr, 0);
}

util::Address AddressDeriver::Hash(const std::vector<std::string>& seeds) const {
  crypto_generichash_blake2b_state st;
  crypto_generichash_blake2b_init(&st, key_.data(), key_.size(), util::kKeySize);

  UpdateLengthPrefixed(st, std::to_string(seeds.size()));
  for (const auto& seed : seeds) {
    UpdateLengthPrefixed(st, seed);
  }

  util::Address out{};
  crypto_generichash_blake2b_final(&st, out.data(), out.size());
  return out;
}

DerivedAddress AddressDeriver::Derive(db::model::RecordKind kind, std::vector<std::string> seeds) const {
  DerivedAddress derived;
  derived.address = Hash(seeds);
  derived.kind    = kind;
  derived.seeds   = std::move(seeds);
  return derived;
}

DerivedAddress AddressDeriver::Group(const util::GroupId& group_id) const {
  return Derive(db::model::RecordKind::kGroup, {std::string(kGroupSeed), util::ToBytes(group_id)});
}

DerivedAddress AddressDeriver::Membership(const util::GroupId& group_id, const util::Identity& member) const {
  return Derive(db::model::RecordKind::kMembership,
                {std::string(kMembershipSeed), util::ToBytes(group_id), util::ToBytes(member)});
}

DerivedAddress AddressDeriver::CodeLookup(std::string_view public_code) const {
  return Derive(db::model::RecordKind::kCodeLookup,
                {std::string(kCodeLookupSeed), validation::NormalizePublicCode(public_code)});
}

DerivedAddress AddressDeriver::InviteLink(const util::GroupId& group_id, std::string_view invite_code) const {
  return Derive(db::model::RecordKind::kInviteLink,
                {std::string(kInviteLinkSeed), util::ToBytes(group_id), std::string(invite_code)});
}

bool AddressDeriver::Verify(const DerivedAddress& derived) const {
  if (derived.seeds.empty() || derived.seeds.front() != SeedFor(derived.kind)) {
    return false;
  }
  const auto expected = Hash(derived.seeds);
  return sodium_memcmp(expected.data(), derived.address.data(), expected.size()) == 0;
}

} // namespace roster::addressing
