#include "lookup_service.hpp"

#include "internal/addressing/address_deriver.hpp"
#include "internal/core/unit_of_work.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/validation/rules.hpp"
#include "observe.hpp"

namespace roster::service {

LookupService::LookupService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

v1::GroupRecord LookupService::ResolveByCode(const std::string& code) {
  return Observe("LookupService.ResolveByCode", [&] {
    const auto normalized = validation::NormalizePublicCode(code);
    validation::ValidatePublicCode(normalized);

    core::UnitOfWork uow(*ctx_.repository, *ctx_.deriver);
    const auto       lookup = uow.LoadCodeLookup(normalized);
    if (!lookup) {
      throw util::NotFound("resolve code: no group uses code '" + normalized + "'");
    }
    auto group = uow.RequireGroup(util::FromBytes(lookup->group_id()), "resolve code");
    uow.Finish();
    return group;
  });
}

}
