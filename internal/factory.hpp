#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"

#include "internal/core/rent_ledger.hpp"
#include "internal/db/api/repository.hpp"

#if RENTLEDGER_WITH_GRPC
#include <grpcpp/impl/service_type.h>
#endif

namespace rentledger::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>   repository;
  std::shared_ptr<core::RentLedger> ledger;

#if RENTLEDGER_WITH_GRPC
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
#endif
};

// Builds the configured repository and bootstraps its schema.
std::shared_ptr<db::Repository> BuildRepository(const rentledger::runtime::config::RuntimeConfig& config);

core::LedgerOptions BuildLedgerOptions(const rentledger::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root of the application. It is the ONLY place allowed to
  know concrete DB types.
*/
Application Build(const rentledger::runtime::config::RuntimeConfig& config);

} // namespace rentledger::factory
