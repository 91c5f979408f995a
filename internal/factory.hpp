#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/addressing/address_deriver.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/group_service.hpp"
#include "internal/service/invite_service.hpp"
#include "internal/service/lookup_service.hpp"
#include "internal/service/membership_service.hpp"

namespace roster::factory {

/*
  RuntimeDependencies

  Owns all long-lived objects used by rosterctl and embedders.
  Everything here lives for the lifetime of the process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository>                   repository;
  std::shared_ptr<const addressing::AddressDeriver> deriver;

  std::shared_ptr<service::GroupService>      groups;
  std::shared_ptr<service::MembershipService> memberships;
  std::shared_ptr<service::InviteService>     invites;
  std::shared_ptr<service::LookupService>     lookup;
};

/*
  BuildRuntime

  Constructs the storage backend, the address deriver and every service
  from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
RuntimeDependencies BuildRuntime(const roster::runtime::config::RuntimeConfig& config);

// Wires services over an existing repository.
RuntimeDependencies BuildServices(std::shared_ptr<db::Repository> repository,
                                  std::shared_ptr<const addressing::AddressDeriver> deriver);

}
