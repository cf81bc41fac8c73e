#pragma once

#include "vaulttrade/model/Account.hpp"
#include "vaulttrade/model/State.hpp"
#include "vaulttrade/repository/AuditLog.hpp"
#include "vaulttrade/repository/StateRepository.hpp"
#include "vaulttrade/util/Errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vaulttrade::service {

enum class LedgerStatus {
    ok,
    alreadyExists,
    notFound,
    badCredential,
    notApproved,
    unknownAccount,
    insufficientFunds,
    invalidRequest,
};

struct LedgerResult {
    LedgerStatus status{LedgerStatus::ok};
    std::string message;
    std::optional<std::int64_t> balance;
    bool replayed{false};

    [[nodiscard]] bool ok() const noexcept { return status == LedgerStatus::ok; }
    [[nodiscard]] util::ErrorClass errorClass() const noexcept;
};

// Authoritative accounts. Every successful mutation is persisted wholesale
// and appended to the audit log before the call returns.
class LedgerService {
public:
    LedgerService(model::BankState& state,
                  repository::BankRepository& repository,
                  repository::AuditLog& audit);

    LedgerResult registerAccount(const std::string& identity, const std::string& credential);
    LedgerResult authenticate(const std::string& identity, const std::string& credential) const;
    LedgerResult approve(const std::string& identity);

    // Admin credit/debit; the resulting balance is clamped at zero.
    LedgerResult adjust(const std::string& identity, std::int64_t delta);

    LedgerResult credit(const std::string& identity, std::int64_t amount, const std::string& reason);
    LedgerResult debit(const std::string& identity, std::int64_t amount, const std::string& reason);

    // Atomic over both balances. A non-empty transactionId makes the call
    // idempotent: replaying an applied id moves nothing and reports replayed.
    LedgerResult transfer(const std::string& from,
                          const std::string& to,
                          std::int64_t amount,
                          const std::string& transactionId = {});

    std::optional<model::Account> findAccount(const std::string& identity) const;
    // Credentials cleared.
    std::vector<model::Account> listAccounts() const;
    std::optional<model::TransferReceipt> findReceipt(const std::string& transactionId) const;

    [[nodiscard]] std::int64_t totalBalance() const;

private:
    model::Account* lookup(const std::string& identity);
    void commit(const std::string& event, const std::string& message);
    std::string amountText(std::int64_t amount) const;

    model::BankState& state_;
    repository::BankRepository& repository_;
    repository::AuditLog& audit_;
};

} // namespace vaulttrade::service
