#pragma once

#include <initializer_list>
#include <string>
#include <unordered_set>
#include <utility>

#include "internal/model/types.hpp"
#include "internal/util/errors.hpp"

namespace rentledger::auth {

/*
  Authorization port.

  RequireAuth throws util::Unauthorized unless the caller proved control of
  `principal` for the current invocation.
*/
class Authorizer {
 public:
  virtual ~Authorizer() = default;

  virtual void RequireAuth(const model::PrincipalId& principal) const = 0;
};

// Accepts exactly the principals the transport authenticated.
class CallerAuthorizer final : public Authorizer {
 public:
  CallerAuthorizer() = default;
  CallerAuthorizer(std::initializer_list<model::PrincipalId> principals) : proven_(principals) {
  }

  void Prove(model::PrincipalId principal) {
    proven_.insert(std::move(principal));
  }

  bool IsProven(const model::PrincipalId& principal) const {
    return proven_.contains(principal);
  }

  void RequireAuth(const model::PrincipalId& principal) const override {
    if (!IsProven(principal)) {
      throw util::Unauthorized("principal " + principal + " did not authorize");
    }
  }

 private:
  std::unordered_set<model::PrincipalId> proven_;
};

} // namespace rentledger::auth
