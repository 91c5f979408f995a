#pragma once

#include <memory>

namespace roster::db { class Repository; }
namespace roster::addressing { class AddressDeriver; }

namespace roster::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<roster::db::Repository> repository;
  std::shared_ptr<const roster::addressing::AddressDeriver> deriver;
};

}
