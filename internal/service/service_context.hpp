#pragma once

#include <memory>

namespace rentledger::core { class RentLedger; }

namespace rentledger::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<rentledger::core::RentLedger> ledger;
};

}
