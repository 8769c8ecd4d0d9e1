#pragma once

#include "rentledger/ledger/v1/types.pb.h"

#include "rentledger/ledger/v1/admin_service.pb.h"
#include "rentledger/ledger/v1/ledger_service.pb.h"
#include "rentledger/ledger/v1/registry_service.pb.h"
