#pragma once

#include <string>

#include "roster/v1.hpp"
#include "service_context.hpp"

namespace roster::service {

/*
  Public code resolution. Read-only; codes match case-insensitively.
*/
class LookupService {
public:
  explicit LookupService(ServiceContext ctx);

  v1::GroupRecord ResolveByCode(const std::string& code);

private:
  ServiceContext ctx_;
};

}
