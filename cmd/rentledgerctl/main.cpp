#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "rentledger/ledger/v1/admin_service.grpc.pb.h"
#include "rentledger/ledger/v1/ledger_service.grpc.pb.h"
#include "rentledger/ledger/v1/registry_service.grpc.pb.h"
#include "rentledger/ledger/v1.hpp"

using namespace rentledger::ledger::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  rentledgerctl <addr> [--tls <ca.pem> <cert.pem> <key.pem>] [--as <principal>]... <command> [args]\n"
            << "\n"
            << "  --tls presents a client certificate, whose identity is the caller principal.\n"
            << "  --as sends x-rentledger-principal metadata, honored only by servers that trust it.\n"
            << "\n"
            << "  create <id> <landlord> <tenant> <monthly_rent> <deposit> <start> <end> [agent commission_bps]\n"
            << "  transition <id> <actor> <draft|pending|active|completed|cancelled|terminated|disputed>\n"
            << "  pay <id> <token> <amount>\n"
            << "  agreement <id>\n"
            << "  payment <payment_id>\n"
            << "  record <id> <payment_number>\n"
            << "  total <id>\n"
            << "  counts\n"
            << "  mint <token> <to> <amount>\n"
            << "  balance <token> <principal>\n"
            << "  init-registry <admin>\n"
            << "  register <landlord> <property_id> <metadata_hash>\n"
            << "  verify <admin> <property_id>\n"
            << "  property <property_id>\n"
            << "  init-obligations\n"
            << "  mint-obligation <id> <landlord>\n"
            << "  transfer-obligation <from> <to> <id>\n"
            << "  obligation <id>\n";
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "cannot read " << path << "\n";
    std::exit(1);
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

static std::optional<AgreementStatus> ParseStatus(const std::string& value) {
  if (value == "draft") return AGREEMENT_STATUS_DRAFT;
  if (value == "pending") return AGREEMENT_STATUS_PENDING;
  if (value == "active") return AGREEMENT_STATUS_ACTIVE;
  if (value == "completed") return AGREEMENT_STATUS_COMPLETED;
  if (value == "cancelled") return AGREEMENT_STATUS_CANCELLED;
  if (value == "terminated") return AGREEMENT_STATUS_TERMINATED;
  if (value == "disputed") return AGREEMENT_STATUS_DISPUTED;
  return std::nullopt;
}

static int Print(const grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
    return 2;
  }

  std::string json;
  auto        print_status = google::protobuf::util::MessageToJsonString(resp, &json);
  if (!print_status.ok()) {
    std::cerr << "failed to print response: " << print_status.message() << "\n";
    return 2;
  }
  std::cout << json << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string                                addr = argv[1];
  std::vector<std::string>                   principals;
  std::optional<grpc::SslCredentialsOptions> tls;

  int i = 2;
  while (i < argc) {
    const std::string flag = argv[i];
    if (flag == "--as" && i + 1 < argc) {
      principals.emplace_back(argv[i + 1]);
      i += 2;
    } else if (flag == "--tls" && i + 3 < argc) {
      grpc::SslCredentialsOptions options;
      options.pem_root_certs  = ReadFile(argv[i + 1]);
      options.pem_cert_chain  = ReadFile(argv[i + 2]);
      options.pem_private_key = ReadFile(argv[i + 3]);
      tls                     = std::move(options);
      i += 4;
    } else {
      break;
    }
  }
  if (i >= argc) {
    Usage();
    return 1;
  }

  const std::string              cmd = argv[i];
  const std::vector<std::string> args(argv + i + 1, argv + argc);

  auto channel = grpc::CreateChannel(addr, tls ? grpc::SslCredentials(*tls) : grpc::InsecureChannelCredentials());

  auto ledger_stub     = RentLedgerService::NewStub(channel);
  auto registry_stub   = PropertyRegistryService::NewStub(channel);
  auto obligation_stub = ObligationService::NewStub(channel);
  auto admin_stub      = LedgerAdminService::NewStub(channel);

  grpc::ClientContext ctx;
  for (const auto& principal : principals) {
    ctx.AddMetadata("x-rentledger-principal", principal);
  }

  try {
    // ------------------------------------------------------------

    if (cmd == "create") {
      if (args.size() != 7 && args.size() != 9) return 1;

      CreateAgreementRequest req;
      req.set_agreement_id(args[0]);
      req.set_landlord(args[1]);
      req.set_tenant(args[2]);
      req.set_monthly_rent(std::stoll(args[3]));
      req.set_security_deposit(std::stoll(args[4]));
      req.set_start_date(std::stoull(args[5]));
      req.set_end_date(std::stoull(args[6]));
      if (args.size() == 9) {
        req.set_agent(args[7]);
        req.set_agent_commission_rate(static_cast<uint32_t>(std::stoul(args[8])));
      }

      CreateAgreementResponse resp;
      return Print(ledger_stub->CreateAgreement(&ctx, req, &resp), resp);
    }

    // ------------------------------------------------------------

    if (cmd == "transition") {
      if (args.size() != 3) return 1;

      auto target = ParseStatus(args[2]);
      if (!target) {
        std::cerr << "unknown status: " << args[2] << "\n";
        return 1;
      }

      TransitionAgreementRequest req;
      req.set_agreement_id(args[0]);
      req.set_actor(args[1]);
      req.set_target(*target);

      TransitionAgreementResponse resp;
      return Print(ledger_stub->TransitionAgreement(&ctx, req, &resp), resp);
    }

    // ------------------------------------------------------------

    if (cmd == "pay") {
      if (args.size() != 3) return 1;

      PayRentRequest req;
      req.set_agreement_id(args[0]);
      req.set_token(args[1]);
      req.set_amount(std::stoll(args[2]));

      PayRentResponse resp;
      return Print(ledger_stub->PayRent(&ctx, req, &resp), resp);
    }

    // ------------------------------------------------------------

    if (cmd == "agreement") {
      if (args.size() != 1) return 1;

      GetAgreementRequest req;
      req.set_agreement_id(args[0]);

      GetAgreementResponse resp;
      return Print(ledger_stub->GetAgreement(&ctx, req, &resp), resp);
    }

    if (cmd == "payment") {
      if (args.size() != 1) return 1;

      GetPaymentRequest req;
      req.set_payment_id(args[0]);

      GetPaymentResponse resp;
      return Print(ledger_stub->GetPayment(&ctx, req, &resp), resp);
    }

    if (cmd == "record") {
      if (args.size() != 2) return 1;

      GetPaymentRecordRequest req;
      req.set_agreement_id(args[0]);
      req.set_payment_number(static_cast<uint32_t>(std::stoul(args[1])));

      GetPaymentRecordResponse resp;
      return Print(ledger_stub->GetPaymentRecord(&ctx, req, &resp), resp);
    }

    if (cmd == "total") {
      if (args.size() != 1) return 1;

      GetTotalPaidRequest req;
      req.set_agreement_id(args[0]);

      GetTotalPaidResponse resp;
      return Print(ledger_stub->GetTotalPaid(&ctx, req, &resp), resp);
    }

    if (cmd == "counts") {
      GetAgreementCountResponse agreements;
      auto status = ledger_stub->GetAgreementCount(&ctx, GetAgreementCountRequest{}, &agreements);
      if (!status.ok()) return Print(status, agreements);

      grpc::ClientContext     payments_ctx;
      GetPaymentCountResponse payments;
      status = ledger_stub->GetPaymentCount(&payments_ctx, GetPaymentCountRequest{}, &payments);
      if (!status.ok()) return Print(status, payments);

      std::cout << "agreements=" << agreements.count() << "\n";
      std::cout << "payments=" << payments.count() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "mint") {
      if (args.size() != 3) return 1;

      MintTokensRequest req;
      req.set_token(args[0]);
      req.set_to(args[1]);
      req.set_amount(std::stoll(args[2]));

      MintTokensResponse resp;
      return Print(admin_stub->MintTokens(&ctx, req, &resp), resp);
    }

    if (cmd == "balance") {
      if (args.size() != 2) return 1;

      GetBalanceRequest req;
      req.set_token(args[0]);
      req.set_principal(args[1]);

      GetBalanceResponse resp;
      return Print(admin_stub->GetBalance(&ctx, req, &resp), resp);
    }

    // ------------------------------------------------------------

    if (cmd == "init-registry") {
      if (args.size() != 1) return 1;

      InitializeRegistryRequest req;
      req.set_admin(args[0]);

      InitializeRegistryResponse resp;
      return Print(registry_stub->InitializeRegistry(&ctx, req, &resp), resp);
    }

    if (cmd == "register") {
      if (args.size() != 3) return 1;

      RegisterPropertyRequest req;
      req.set_landlord(args[0]);
      req.set_property_id(args[1]);
      req.set_metadata_hash(args[2]);

      RegisterPropertyResponse resp;
      return Print(registry_stub->RegisterProperty(&ctx, req, &resp), resp);
    }

    if (cmd == "verify") {
      if (args.size() != 2) return 1;

      VerifyPropertyRequest req;
      req.set_admin(args[0]);
      req.set_property_id(args[1]);

      VerifyPropertyResponse resp;
      return Print(registry_stub->VerifyProperty(&ctx, req, &resp), resp);
    }

    if (cmd == "property") {
      if (args.size() != 1) return 1;

      GetPropertyRequest req;
      req.set_property_id(args[0]);

      GetPropertyResponse resp;
      return Print(registry_stub->GetProperty(&ctx, req, &resp), resp);
    }

    // ------------------------------------------------------------

    if (cmd == "init-obligations") {
      InitializeObligationsResponse resp;
      return Print(obligation_stub->InitializeObligations(&ctx, InitializeObligationsRequest{}, &resp), resp);
    }

    if (cmd == "mint-obligation") {
      if (args.size() != 2) return 1;

      MintObligationRequest req;
      req.set_agreement_id(args[0]);
      req.set_landlord(args[1]);

      MintObligationResponse resp;
      return Print(obligation_stub->MintObligation(&ctx, req, &resp), resp);
    }

    if (cmd == "transfer-obligation") {
      if (args.size() != 3) return 1;

      TransferObligationRequest req;
      req.set_from(args[0]);
      req.set_to(args[1]);
      req.set_agreement_id(args[2]);

      TransferObligationResponse resp;
      return Print(obligation_stub->TransferObligation(&ctx, req, &resp), resp);
    }

    if (cmd == "obligation") {
      if (args.size() != 1) return 1;

      GetObligationRequest req;
      req.set_agreement_id(args[0]);

      GetObligationResponse resp;
      return Print(obligation_stub->GetObligation(&ctx, req, &resp), resp);
    }
  } catch (const std::logic_error& e) {
    // std::stoll and friends
    std::cerr << "invalid argument: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
