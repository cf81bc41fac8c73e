#include "vaulttrade/service/LedgerService.hpp"
#include "vaulttrade/util/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <limits>

namespace vaulttrade::service {
namespace {

std::string trim(const std::string& input) {
    auto begin = std::find_if_not(input.begin(), input.end(), [](unsigned char ch) { return std::isspace(ch); });
    auto end = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char ch) { return std::isspace(ch); }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

LedgerResult reject(LedgerStatus status, std::string message) {
    LedgerResult result;
    result.status = status;
    result.message = std::move(message);
    return result;
}

bool addWouldOverflow(std::int64_t balance, std::int64_t amount) {
    return amount > 0 && balance > std::numeric_limits<std::int64_t>::max() - amount;
}

} // namespace

util::ErrorClass LedgerResult::errorClass() const noexcept {
    switch (status) {
    case LedgerStatus::ok:
        return util::ErrorClass::none;
    case LedgerStatus::alreadyExists:
    case LedgerStatus::invalidRequest:
        return util::ErrorClass::validation;
    case LedgerStatus::notFound:
    case LedgerStatus::badCredential:
    case LedgerStatus::notApproved:
    case LedgerStatus::unknownAccount:
        return util::ErrorClass::authorization;
    case LedgerStatus::insufficientFunds:
        return util::ErrorClass::insufficientResource;
    }
    return util::ErrorClass::internal;
}

LedgerService::LedgerService(model::BankState& state,
                             repository::BankRepository& repository,
                             repository::AuditLog& audit)
    : state_(state)
    , repository_(repository)
    , audit_(audit) {}

LedgerResult LedgerService::registerAccount(const std::string& identity, const std::string& credential) {
    const auto name = trim(identity);
    if (name.empty() || trim(credential).empty()) {
        return reject(LedgerStatus::invalidRequest, "User and PIN required");
    }
    if (state_.accounts.count(name) > 0) {
        return reject(LedgerStatus::alreadyExists, "Account exists");
    }

    model::Account account;
    account.identity = name;
    account.credential = credential;
    state_.accounts.emplace(name, std::move(account));
    commit("account.created", "Account created: " + name);

    LedgerResult result;
    result.message = "Account created. Awaiting approval.";
    result.balance = 0;
    return result;
}

LedgerResult LedgerService::authenticate(const std::string& identity, const std::string& credential) const {
    auto it = state_.accounts.find(trim(identity));
    if (it == state_.accounts.end()) {
        return reject(LedgerStatus::notFound, "No account");
    }
    if (it->second.credential != credential) {
        util::log(util::LogLevel::warn, "Rejected credential for " + it->first);
        return reject(LedgerStatus::badCredential, "Invalid PIN");
    }
    if (!it->second.approved) {
        return reject(LedgerStatus::notApproved, "Not approved");
    }
    LedgerResult result;
    result.balance = it->second.balance;
    return result;
}

LedgerResult LedgerService::approve(const std::string& identity) {
    auto* account = lookup(identity);
    if (!account) {
        return reject(LedgerStatus::notFound, "No account");
    }
    if (!account->approved) {
        account->approved = true;
        commit("account.approved", "Approved account: " + account->identity);
    }
    LedgerResult result;
    result.message = "Approved";
    result.balance = account->balance;
    return result;
}

LedgerResult LedgerService::adjust(const std::string& identity, std::int64_t delta) {
    auto* account = lookup(identity);
    if (!account) {
        return reject(LedgerStatus::notFound, "No account");
    }
    if (addWouldOverflow(account->balance, delta)) {
        return reject(LedgerStatus::invalidRequest, "Adjustment out of range");
    }

    const auto before = account->balance;
    account->balance = delta < 0 && -delta >= before ? 0 : before + delta;
    commit("account.adjusted", "Admin adj " + account->identity + " by " + std::to_string(delta) +
                                   " (" + amountText(before) + " -> " + amountText(account->balance) + ")");

    LedgerResult result;
    result.message = "New balance: " + amountText(account->balance);
    result.balance = account->balance;
    return result;
}

LedgerResult LedgerService::credit(const std::string& identity, std::int64_t amount, const std::string& reason) {
    if (amount <= 0) {
        return reject(LedgerStatus::invalidRequest, "Amount must be positive");
    }
    auto* account = lookup(identity);
    if (!account) {
        return reject(LedgerStatus::unknownAccount, "Unknown account");
    }
    if (addWouldOverflow(account->balance, amount)) {
        return reject(LedgerStatus::invalidRequest, "Amount out of range");
    }
    account->balance += amount;
    commit("account.credited", account->identity + " +" + amountText(amount) + " (" + reason + ")");

    LedgerResult result;
    result.balance = account->balance;
    return result;
}

LedgerResult LedgerService::debit(const std::string& identity, std::int64_t amount, const std::string& reason) {
    if (amount <= 0) {
        return reject(LedgerStatus::invalidRequest, "Amount must be positive");
    }
    auto* account = lookup(identity);
    if (!account) {
        return reject(LedgerStatus::unknownAccount, "Unknown account");
    }
    if (account->balance < amount) {
        return reject(LedgerStatus::insufficientFunds, "Insufficient funds");
    }
    account->balance -= amount;
    commit("account.debited", account->identity + " -" + amountText(amount) + " (" + reason + ")");

    LedgerResult result;
    result.balance = account->balance;
    return result;
}

LedgerResult LedgerService::transfer(const std::string& from,
                                     const std::string& to,
                                     std::int64_t amount,
                                     const std::string& transactionId) {
    if (from.empty() || to.empty() || amount <= 0) {
        return reject(LedgerStatus::invalidRequest, "Invalid transfer");
    }

    if (!transactionId.empty()) {
        if (auto receipt = findReceipt(transactionId)) {
            if (receipt->from != trim(from) || receipt->to != trim(to) || receipt->amount != amount) {
                util::log(util::LogLevel::warn, "Transaction id " + transactionId + " reused with different terms");
                return reject(LedgerStatus::invalidRequest, "Transaction id reused");
            }
            util::log(util::LogLevel::info, "Replayed transfer " + transactionId + " ignored");
            LedgerResult result;
            result.message = "Transfer complete";
            result.replayed = true;
            if (auto* sender = lookup(from)) {
                result.balance = sender->balance;
            }
            return result;
        }
    }

    auto* sender = lookup(from);
    auto* receiver = lookup(to);
    if (!sender || !receiver) {
        return reject(LedgerStatus::unknownAccount, "Unknown account");
    }
    if (!sender->approved || !receiver->approved) {
        return reject(LedgerStatus::notApproved, "Not approved");
    }
    if (sender->balance < amount) {
        return reject(LedgerStatus::insufficientFunds, "Insufficient funds");
    }
    if (sender != receiver && addWouldOverflow(receiver->balance, amount)) {
        return reject(LedgerStatus::invalidRequest, "Amount out of range");
    }

    sender->balance -= amount;
    receiver->balance += amount;

    if (!transactionId.empty()) {
        state_.journal.push_back(model::TransferReceipt{
            transactionId, sender->identity, receiver->identity, amount, std::chrono::system_clock::now()});
        while (state_.journal.size() > model::BankState::kJournalCapacity) {
            state_.journal.pop_front();
        }
    }

    std::string message = "Transfer " + sender->identity + " -> " + receiver->identity + " : " + amountText(amount);
    if (!transactionId.empty()) {
        message += " [" + transactionId + "]";
    }
    commit("ledger.transfer", message);

    LedgerResult result;
    result.message = "Transfer complete";
    result.balance = sender->balance;
    return result;
}

std::optional<model::Account> LedgerService::findAccount(const std::string& identity) const {
    auto it = state_.accounts.find(trim(identity));
    if (it == state_.accounts.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<model::Account> LedgerService::listAccounts() const {
    std::vector<model::Account> out;
    out.reserve(state_.accounts.size());
    for (const auto& [identity, account] : state_.accounts) {
        auto copy = account;
        copy.credential.clear();
        out.push_back(std::move(copy));
    }
    return out;
}

std::optional<model::TransferReceipt> LedgerService::findReceipt(const std::string& transactionId) const {
    auto it = std::find_if(state_.journal.rbegin(), state_.journal.rend(),
                           [&transactionId](const model::TransferReceipt& receipt) {
                               return receipt.transactionId == transactionId;
                           });
    if (it == state_.journal.rend()) {
        return std::nullopt;
    }
    return *it;
}

std::int64_t LedgerService::totalBalance() const {
    std::int64_t total = 0;
    for (const auto& [identity, account] : state_.accounts) {
        total += account.balance;
    }
    return total;
}

model::Account* LedgerService::lookup(const std::string& identity) {
    auto it = state_.accounts.find(trim(identity));
    return it == state_.accounts.end() ? nullptr : &it->second;
}

void LedgerService::commit(const std::string& event, const std::string& message) {
    repository_.save(state_);
    audit_.append(event, message);
}

std::string LedgerService::amountText(std::int64_t amount) const {
    return model::formatAmount(amount, state_.catalog.price);
}

} // namespace vaulttrade::service
