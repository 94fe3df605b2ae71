#include "persistence/json_codec.hpp"
#include "common/errors.hpp"
#include <fmt/format.h>

namespace gate {

namespace {

template <typename E, typename Parser>
E enum_field(const nlohmann::json& j, const char* key, E fallback, Parser parse) {
    if (!j.contains(key) || j.at(key).is_null()) return fallback;
    std::string s = j.at(key).get<std::string>();
    auto value = parse(s);
    if (!value) {
        throw DataIntegrityFailure(fmt::format("unknown {} '{}'", key, s));
    }
    return *value;
}

std::optional<ReportStatus> report_status_from_string(const std::string& s) {
    if (s == "ACCEPTED") return ReportStatus::ACCEPTED;
    if (s == "FILLED") return ReportStatus::FILLED;
    if (s == "REJECTED") return ReportStatus::REJECTED;
    return std::nullopt;
}

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& v) {
    if (v) j[key] = *v;
}

template <typename T>
void get_optional(const nlohmann::json& j, const char* key, std::optional<T>& v) {
    if (j.contains(key) && !j.at(key).is_null()) {
        v = j.at(key).get<T>();
    } else {
        v.reset();
    }
}

} // namespace

void to_json(nlohmann::json& j, const Position& p) {
    j = nlohmann::json{
        {"symbol", p.symbol},
        {"direction", direction_to_string(p.direction)},
        {"size", p.size},
        {"entry_price", p.entry_price},
        {"stop_price", p.stop_price},
        {"state", position_state_to_string(p.state)},
        {"risk_reserved", p.risk_reserved},
        {"liquidation_distance", p.liquidation_distance},
        {"last_update_cycle", p.last_update_cycle}
    };
}

void from_json(const nlohmann::json& j, Position& p) {
    p.symbol = j.value("symbol", "");
    p.direction = enum_field(j, "direction", Direction::NONE, direction_from_string);
    p.size = j.value("size", 0.0);
    p.entry_price = j.value("entry_price", 0.0);
    p.stop_price = j.value("stop_price", 0.0);
    p.state = enum_field(j, "state", PositionState::FLAT, position_state_from_string);
    p.risk_reserved = j.value("risk_reserved", 0.0);
    p.liquidation_distance = j.value("liquidation_distance", 1.0);
    p.last_update_cycle = j.value("last_update_cycle", uint64_t{0});
}

void to_json(nlohmann::json& j, const AccountSnapshot& a) {
    j = nlohmann::json{
        {"equity", a.equity},
        {"margin_available", a.margin_available},
        {"realized_pnl", a.realized_pnl},
        {"fees_paid", a.fees_paid},
        {"sequence", a.sequence}
    };
}

void from_json(const nlohmann::json& j, AccountSnapshot& a) {
    a.equity = j.value("equity", 0.0);
    a.margin_available = j.value("margin_available", a.equity);
    a.realized_pnl = j.value("realized_pnl", 0.0);
    a.fees_paid = j.value("fees_paid", 0.0);
    a.sequence = j.value("sequence", uint64_t{0});
}

void to_json(nlohmann::json& j, const ExecutionReport& r) {
    j = nlohmann::json{
        {"symbol", r.symbol},
        {"action", intent_action_to_string(r.action)},
        {"status", report_status_to_string(r.status)},
        {"direction", direction_to_string(r.direction)},
        {"filled_quantity", r.filled_quantity},
        {"fill_price", r.fill_price},
        {"stop_price", r.stop_price},
        {"fee", r.fee},
        {"trigger_id", r.trigger_id},
        {"cycle", r.cycle}
    };
}

void from_json(const nlohmann::json& j, ExecutionReport& r) {
    r.symbol = j.value("symbol", "");
    r.action = enum_field(j, "action", IntentAction::OPEN, intent_action_from_string);
    r.status = enum_field(j, "status", ReportStatus::ACCEPTED, report_status_from_string);
    r.direction = enum_field(j, "direction", Direction::NONE, direction_from_string);
    r.filled_quantity = j.value("filled_quantity", 0.0);
    r.fill_price = j.value("fill_price", 0.0);
    r.stop_price = j.value("stop_price", 0.0);
    r.fee = j.value("fee", 0.0);
    r.trigger_id = j.value("trigger_id", "");
    r.cycle = j.value("cycle", uint64_t{0});
}

void to_json(nlohmann::json& j, const MarketSnapshot& s) {
    j = nlohmann::json{
        {"symbol", s.symbol},
        {"sequence", s.sequence},
        {"mark_price", s.mark_price},
        {"liquidation_price", s.liquidation_price},
        {"age_ms", s.age_ms},
        {"primitives", s.primitives}
    };
}

void from_json(const nlohmann::json& j, MarketSnapshot& s) {
    s.symbol = j.value("symbol", "");
    s.sequence = j.value("sequence", uint64_t{0});
    s.mark_price = j.value("mark_price", 0.0);
    s.liquidation_price = j.value("liquidation_price", 0.0);
    s.age_ms = j.value("age_ms", int64_t{0});
    s.primitives.clear();
    if (j.contains("primitives")) {
        j.at("primitives").get_to(s.primitives);
    }
}

void to_json(nlohmann::json& j, const IntegrityReport& r) {
    j = nlohmann::json{
        {"ok", r.ok},
        {"issues", r.issues}
    };
}

void to_json(nlohmann::json& j, const MandateScope& s) {
    j = nlohmann::json::object();
    put_optional(j, "reduce_fraction", s.reduce_fraction);
    put_optional(j, "quantity", s.quantity);
    put_optional(j, "limit_price", s.limit_price);
    put_optional(j, "stop_price", s.stop_price);
    put_optional(j, "entry_trigger_price", s.entry_trigger_price);
}

void from_json(const nlohmann::json& j, MandateScope& s) {
    get_optional(j, "reduce_fraction", s.reduce_fraction);
    get_optional(j, "quantity", s.quantity);
    get_optional(j, "limit_price", s.limit_price);
    get_optional(j, "stop_price", s.stop_price);
    get_optional(j, "entry_trigger_price", s.entry_trigger_price);
}

void to_json(nlohmann::json& j, const Mandate& m) {
    nlohmann::json preconditions = nlohmann::json::array();
    for (PositionState s : m.preconditions) {
        preconditions.push_back(position_state_to_string(s));
    }

    j = nlohmann::json{
        {"type", mandate_type_to_string(m.type)},
        {"symbol", m.symbol},
        {"direction", direction_to_string(m.direction)},
        {"authority_rank", m.authority_rank},
        {"preconditions", preconditions},
        {"scope", m.scope},
        {"trigger_id", m.trigger_id},
        {"origin", mandate_origin_to_string(m.origin)}
    };
    put_optional(j, "expiry_cycle", m.expiry_cycle);
}

void from_json(const nlohmann::json& j, Mandate& m) {
    m.type = enum_field(j, "type", MandateType::HOLD, mandate_type_from_string);
    m.symbol = j.value("symbol", "");
    m.direction = enum_field(j, "direction", Direction::NONE, direction_from_string);
    m.authority_rank = j.value("authority_rank", authority_of(m.type));

    m.preconditions.clear();
    if (j.contains("preconditions")) {
        for (const auto& s : j.at("preconditions")) {
            auto state = position_state_from_string(s.get<std::string>());
            if (!state) {
                throw DataIntegrityFailure(fmt::format("unknown precondition '{}'", s.get<std::string>()));
            }
            m.preconditions.push_back(*state);
        }
    }

    m.scope = MandateScope{};
    if (j.contains("scope")) {
        j.at("scope").get_to(m.scope);
    }
    get_optional(j, "expiry_cycle", m.expiry_cycle);
    m.trigger_id = j.value("trigger_id", "");
    m.origin = enum_field(j, "origin", MandateOrigin::STRATEGY, mandate_origin_from_string);
}

void to_json(nlohmann::json& j, const ExecutionIntent& i) {
    j = nlohmann::json{
        {"symbol", i.symbol},
        {"action", intent_action_to_string(i.action)},
        {"direction", direction_to_string(i.direction)},
        {"quantity", i.quantity},
        {"price_type", price_type_to_string(i.price_type)},
        {"limit_price", i.limit_price},
        {"stop_price", i.stop_price},
        {"mandate_type", mandate_type_to_string(i.mandate_type)},
        {"trigger_id", i.trigger_id}
    };
}

void from_json(const nlohmann::json& j, ExecutionIntent& i) {
    i.symbol = j.value("symbol", "");
    i.action = enum_field(j, "action", IntentAction::OPEN, intent_action_from_string);
    i.direction = enum_field(j, "direction", Direction::NONE, direction_from_string);
    i.quantity = j.value("quantity", 0.0);
    i.price_type = enum_field(j, "price_type", PriceType::MARKET, price_type_from_string);
    i.limit_price = j.value("limit_price", 0.0);
    i.stop_price = j.value("stop_price", 0.0);
    i.mandate_type = enum_field(j, "mandate_type", MandateType::HOLD, mandate_type_from_string);
    i.trigger_id = j.value("trigger_id", "");
}

void to_json(nlohmann::json& j, const DiscardedMandate& d) {
    j = nlohmann::json{
        {"mandate", d.mandate},
        {"reason", discard_reason_to_string(d.reason)},
        {"detail", d.detail}
    };
}

void to_json(nlohmann::json& j, const ArbitrationResult& r) {
    j = nlohmann::json{
        {"symbol", r.symbol},
        {"cycle", r.cycle},
        {"state", position_state_to_string(r.state)},
        {"selected", nullptr},
        {"discarded", r.discarded},
        {"forced", r.forced},
        {"assessment", verdict_kind_to_string(r.assessment)},
        {"assessment_reason", r.assessment_reason},
        {"halted", r.halted}
    };
    if (r.selected) {
        j["selected"] = *r.selected;
    }
}

void to_json(nlohmann::json& j, const RiskMetrics& m) {
    j = nlohmann::json{
        {"mark", m.mark},
        {"notional", m.notional},
        {"total_notional", m.total_notional},
        {"equity", m.equity},
        {"effective_leverage", m.effective_leverage},
        {"account_exposure", m.account_exposure},
        {"symbol_exposure", m.symbol_exposure},
        {"correlated_exposure", m.correlated_exposure},
        {"correlated_group", m.correlated_group},
        {"liquidation_price", m.liquidation_price},
        {"liquidation_distance", m.liquidation_distance}
    };
}

void to_json(nlohmann::json& j, const SymbolOutcome& o) {
    j = nlohmann::json{
        {"arbitration", o.arbitration},
        {"intent", nullptr},
        {"integrity", o.integrity},
        {"metrics", o.metrics}
    };
    if (o.intent) {
        j["intent"] = *o.intent;
    }
}

} // namespace gate
