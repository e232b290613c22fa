#include "domain/events/TransactionEvent.hpp"

namespace ledger::domain {

namespace {

nlohmann::json moneyToJson(const Money& money) {
    return {
        {"amount", money.toString()},
        {"currency", money.currency}
    };
}

} // namespace

nlohmann::json transactionToJson(const Transaction& tx) {
    nlohmann::json j;
    j["transaction_id"] = tx.transactionId;
    j["type"] = toString(tx.type);
    j["status"] = toString(tx.status);
    j["idempotency_key"] = tx.idempotencyKey;
    j["source_account_id"] = tx.sourceAccountId;
    j["destination_account_id"] = tx.destinationAccountId;
    j["requested"] = moneyToJson(tx.requested);
    if (tx.debit) {
        j["debit"] = moneyToJson(*tx.debit);
    }
    if (tx.credit) {
        j["credit"] = moneyToJson(*tx.credit);
    }
    j["rate"] = tx.rate.toString();
    j["rate_source"] = toString(tx.rateSource);
    if (tx.sourceBalanceAfter) {
        j["source_balance"] = moneyToJson(*tx.sourceBalanceAfter);
    }
    if (tx.destinationBalanceAfter) {
        j["destination_balance"] = moneyToJson(*tx.destinationBalanceAfter);
    }
    if (tx.status == TransactionStatus::FAILED) {
        j["error"] = toString(tx.error);
        j["stage"] = toString(tx.stage);
        j["message"] = tx.message;
    }
    if (!tx.description.empty()) {
        j["description"] = tx.description;
    }
    j["timestamp"] = tx.timestamp.toString();
    return j;
}

std::string TransactionEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = routingKey;
    j["aggregateId"] = aggregateId;
    j["occurredAt"] = occurredAt.toString();
    j["transaction"] = transactionToJson(transaction);
    return j.dump();
}

} // namespace ledger::domain
