#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"
#include "internal/validation/rules.hpp"
#include "roster/v1.hpp"

using namespace roster;

namespace {

// Exit codes, one per error type.
constexpr int kExitOk               = 0;
constexpr int kExitUsage            = 1;
constexpr int kExitValidation       = 2;
constexpr int kExitNotFound         = 3;
constexpr int kExitAlreadyExists    = 4;
constexpr int kExitPermissionDenied = 5;
constexpr int kExitCapacityExceeded = 6;
constexpr int kExitInvalidState     = 7;
constexpr int kExitFailure          = 10;

void Usage() {
  std::cout << "Usage:\n"
            << "  rosterctl [--config <roster.yaml>] [--caller <identity-hex>] <command> [args]\n"
            << "\n"
            << "Groups:\n"
            << "  create-group <group-hex|new> <name> [--description D] [--avatar A] [--public] [--searchable]\n"
            << "               [--invite-only] [--member-invites] [--max-members N] [--key <32-byte-hex>]\n"
            << "  set-code <group> <code>\n"
            << "  get-group <group>\n"
            << "  search [query]\n"
            << "  my-groups [identity]\n"
            << "Membership:\n"
            << "  join <group> [key-blob-hex]\n"
            << "  join-code <code> [key-blob-hex]\n"
            << "  invite <group> <identity> [key-blob-hex]\n"
            << "  leave <group>\n"
            << "  kick <group> <identity>\n"
            << "  set-role <group> <identity> <member|moderator|admin>\n"
            << "  mark-read <group> <unix-seconds>\n"
            << "  get-member <group> <identity>\n"
            << "  members <group>\n"
            << "Invite links:\n"
            << "  create-link <group> <code> [expires-at] [max-uses]\n"
            << "  revoke-link <group> <code>\n"
            << "  redeem-link <group> <code> [key-blob-hex]\n"
            << "  get-link <group> <code>\n"
            << "Lookup:\n"
            << "  resolve <code>\n";
}

std::optional<v1::Role> ParseRole(const std::string& value) {
  if (value == "member") return v1::ROLE_MEMBER;
  if (value == "moderator") return v1::ROLE_MODERATOR;
  if (value == "admin") return v1::ROLE_ADMIN;
  if (value == "owner") return v1::ROLE_OWNER;
  return std::nullopt;
}

// Key blobs are opaque; an omitted one is stored zero-filled.
std::string KeyBlobArg(const std::vector<std::string>& args, size_t index, size_t size) {
  if (index < args.size()) {
    return util::DecodeHex(args[index]);
  }
  return std::string(size, '\0');
}

void PrintGroup(const v1::GroupRecord& group) {
  std::cout << "group=" << util::EncodeHex(group.group_id()) << "\n"
            << "owner=" << util::EncodeHex(group.owner()) << "\n"
            << "name=" << group.name() << "\n"
            << "description=" << group.description() << "\n"
            << "public_code=" << group.public_code() << "\n"
            << "avatar_ref=" << group.avatar_ref() << "\n"
            << "is_public=" << group.flags().is_public() << "\n"
            << "is_searchable=" << group.flags().is_searchable() << "\n"
            << "invite_only=" << group.flags().invite_only() << "\n"
            << "allow_member_invites=" << group.allow_member_invites() << "\n"
            << "max_members=" << group.max_members() << "\n"
            << "member_count=" << group.member_count() << "\n"
            << "created_at=" << group.created_at() << "\n"
            << "updated_at=" << group.updated_at() << "\n";
}

void PrintGroupLine(const v1::GroupRecord& group) {
  std::cout << util::EncodeHex(group.group_id()) << " members=" << group.member_count() << " name=" << group.name()
            << "\n";
}

void PrintMember(const v1::MembershipRecord& m) {
  std::cout << "member=" << util::EncodeHex(m.member()) << "\n"
            << "group=" << util::EncodeHex(m.group_id()) << "\n"
            << "role=" << v1::Role_Name(m.role()) << "\n"
            << "permissions=0x" << std::hex << m.permissions() << std::dec << "\n"
            << "invited_by=" << util::EncodeHex(m.invited_by()) << "\n"
            << "joined_at=" << m.joined_at() << "\n"
            << "last_read_at=" << m.last_read_at() << "\n";
}

void PrintMemberLine(const v1::MembershipRecord& m) {
  std::cout << util::EncodeHex(m.member()) << " role=" << v1::Role_Name(m.role()) << " joined_at=" << m.joined_at()
            << "\n";
}

void PrintLink(const v1::InviteLinkRecord& link) {
  std::cout << "group=" << util::EncodeHex(link.group_id()) << "\n"
            << "code=" << link.invite_code() << "\n"
            << "created_by=" << util::EncodeHex(link.created_by()) << "\n"
            << "expires_at=" << link.expires_at() << "\n"
            << "max_uses=" << link.max_uses() << "\n"
            << "use_count=" << link.use_count() << "\n"
            << "is_active=" << link.is_active() << "\n";
}

void PrintRefund(const db::model::Refund& refund) {
  std::cout << "refund_to=" << util::ToHex(refund.recipient) << "\n"
            << "refund_amount=" << refund.amount << "\n";
}

int RunCommand(factory::RuntimeDependencies& app, const util::Identity& caller, const std::string& cmd,
               const std::vector<std::string>& args) {
  // ------------------------------------------------------------

  if (cmd == "create-group") {
    if (args.size() < 2) return kExitUsage;

    service::CreateGroupParams params;
    params.group_id             = args[0] == "new" ? util::GenerateKey32() : util::FromHex(args[0]);
    params.name                 = args[1];
    params.group_encryption_key = std::string(validation::kGroupEncryptionKeySize, '\0');

    for (size_t i = 2; i < args.size(); ++i) {
      const auto& flag     = args[i];
      const bool  has_next = i + 1 < args.size();
      if (flag == "--public") {
        params.is_public = true;
      } else if (flag == "--searchable") {
        params.is_searchable = true;
      } else if (flag == "--invite-only") {
        params.invite_only = true;
      } else if (flag == "--member-invites") {
        params.allow_member_invites = true;
      } else if (flag == "--description" && has_next) {
        params.description = args[++i];
      } else if (flag == "--avatar" && has_next) {
        params.avatar_ref = args[++i];
      } else if (flag == "--max-members" && has_next) {
        params.max_members = validation::ParseCounterLimit("max_members", args[++i]);
      } else if (flag == "--key" && has_next) {
        params.group_encryption_key = util::DecodeHex(args[++i]);
      } else {
        std::cerr << "unknown create-group option: " << flag << "\n";
        return kExitUsage;
      }
    }

    PrintGroup(app.groups->CreateGroup(caller, params));
    return kExitOk;
  }

  if (cmd == "set-code") {
    if (args.size() < 2) return kExitUsage;
    PrintGroup(app.groups->SetGroupCode(caller, util::FromHex(args[0]), args[1]));
    return kExitOk;
  }

  if (cmd == "get-group") {
    if (args.empty()) return kExitUsage;
    PrintGroup(app.groups->GetGroup(util::FromHex(args[0])));
    return kExitOk;
  }

  if (cmd == "search") {
    for (const auto& group : app.groups->SearchPublicGroups(args.empty() ? std::string() : args[0])) {
      PrintGroupLine(group);
    }
    return kExitOk;
  }

  if (cmd == "my-groups") {
    const auto who = args.empty() ? caller : util::FromHex(args[0]);
    for (const auto& group : app.groups->ListGroupsForMember(who)) {
      PrintGroupLine(group);
    }
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "join") {
    if (args.empty()) return kExitUsage;
    PrintMember(app.memberships->Join(caller, util::FromHex(args[0]),
                                      KeyBlobArg(args, 1, validation::kEncryptedGroupKeySize)));
    return kExitOk;
  }

  if (cmd == "join-code") {
    if (args.empty()) return kExitUsage;
    PrintMember(app.memberships->JoinByCode(caller, args[0], KeyBlobArg(args, 1, validation::kEncryptedGroupKeySize)));
    return kExitOk;
  }

  if (cmd == "invite") {
    if (args.size() < 2) return kExitUsage;
    PrintMember(app.memberships->Invite(caller, util::FromHex(args[0]), util::FromHex(args[1]),
                                        KeyBlobArg(args, 2, validation::kEncryptedGroupKeySize)));
    return kExitOk;
  }

  if (cmd == "leave") {
    if (args.empty()) return kExitUsage;
    PrintRefund(app.memberships->Leave(caller, util::FromHex(args[0])));
    return kExitOk;
  }

  if (cmd == "kick") {
    if (args.size() < 2) return kExitUsage;
    PrintRefund(app.memberships->Kick(caller, util::FromHex(args[0]), util::FromHex(args[1])));
    return kExitOk;
  }

  if (cmd == "set-role") {
    if (args.size() < 3) return kExitUsage;
    const auto role = ParseRole(args[2]);
    if (!role.has_value()) {
      std::cerr << "unsupported role: " << args[2] << "\n";
      return kExitUsage;
    }
    PrintMember(app.memberships->UpdateRole(caller, util::FromHex(args[0]), util::FromHex(args[1]), *role));
    return kExitOk;
  }

  if (cmd == "mark-read") {
    if (args.size() < 2) return kExitUsage;
    PrintMember(app.memberships->MarkRead(caller, util::FromHex(args[0]), validation::ParseTimestamp("last_read_at", args[1])));
    return kExitOk;
  }

  if (cmd == "get-member") {
    if (args.size() < 2) return kExitUsage;
    PrintMember(app.memberships->GetMember(util::FromHex(args[0]), util::FromHex(args[1])));
    return kExitOk;
  }

  if (cmd == "members") {
    if (args.empty()) return kExitUsage;
    for (const auto& member : app.memberships->ListMembers(util::FromHex(args[0]))) {
      PrintMemberLine(member);
    }
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "create-link") {
    if (args.size() < 2) return kExitUsage;
    const int64_t  expires_at = args.size() > 2 ? validation::ParseTimestamp("expires_at", args[2]) : 0;
    const uint32_t max_uses   = args.size() > 3 ? validation::ParseCounterLimit("max_uses", args[3]) : 0;
    PrintLink(app.invites->CreateInviteLink(caller, util::FromHex(args[0]), args[1], expires_at, max_uses));
    return kExitOk;
  }

  if (cmd == "revoke-link") {
    if (args.size() < 2) return kExitUsage;
    PrintLink(app.invites->RevokeInviteLink(caller, util::FromHex(args[0]), args[1]));
    return kExitOk;
  }

  if (cmd == "redeem-link") {
    if (args.size() < 2) return kExitUsage;
    PrintMember(app.invites->RedeemInviteLink(caller, util::FromHex(args[0]), args[1],
                                              KeyBlobArg(args, 2, validation::kEncryptedGroupKeySize)));
    return kExitOk;
  }

  if (cmd == "get-link") {
    if (args.size() < 2) return kExitUsage;
    PrintLink(app.invites->GetInviteLink(util::FromHex(args[0]), args[1]));
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "resolve") {
    if (args.empty()) return kExitUsage;
    PrintGroup(app.lookup->ResolveByCode(args[0]));
    return kExitOk;
  }

  std::cerr << "unknown command: " << cmd << "\n";
  return kExitUsage;
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  std::string caller_hex;

  int i = 1;
  for (; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--caller" && i + 1 < argc) {
      caller_hex = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      Usage();
      return kExitOk;
    } else {
      break;
    }
  }

  if (i >= argc) {
    Usage();
    return kExitUsage;
  }

  const std::string        cmd = argv[i];
  std::vector<std::string> args(argv + i + 1, argv + argc);

  try {
    roster::runtime::config::RuntimeConfig runtime_config;
    if (!config_path.empty()) {
      runtime_config = config::ConfigLoader::LoadFromYaml(config_path);
    } else {
      config::ConfigLoader::ApplyDefaults(runtime_config);
    }
    observability::InitializeLogging(runtime_config);

    // the caller is the operator-asserted signer of this invocation
    const util::Identity caller = caller_hex.empty() ? util::Identity{} : util::FromHex(caller_hex);

    auto app = factory::BuildRuntime(runtime_config);
    int  rc  = RunCommand(app, caller, cmd, args);
    if (rc == kExitUsage) {
      Usage();
    }
    observability::ShutdownLogging();
    return rc;
  } catch (const util::ValidationError& e) {
    std::cerr << "validation error (" << e.field() << "): " << e.what() << "\n";
    return kExitValidation;
  } catch (const util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
    return kExitNotFound;
  } catch (const util::AlreadyExists& e) {
    std::cerr << "already exists: " << e.what() << "\n";
    return kExitAlreadyExists;
  } catch (const util::PermissionDenied& e) {
    std::cerr << "permission denied: " << e.what() << "\n";
    return kExitPermissionDenied;
  } catch (const util::CapacityExceeded& e) {
    std::cerr << "capacity exceeded: " << e.what() << "\n";
    return kExitCapacityExceeded;
  } catch (const util::InvalidState& e) {
    std::cerr << "invalid state: " << e.what() << "\n";
    return kExitInvalidState;
  } catch (const std::invalid_argument& e) {
    std::cerr << "invalid argument: " << e.what() << "\n";
    return kExitUsage;
  } catch (const std::out_of_range& e) {
    std::cerr << "argument out of range: " << e.what() << "\n";
    return kExitUsage;
  } catch (const std::exception& e) {
    ROSTER_LOG_ERROR("Fatal error", {observability::StringField("error", e.what())});
    observability::ShutdownLogging();
    return kExitFailure;
  }
}
