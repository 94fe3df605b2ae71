#include "common/types.hpp"

namespace gate {

std::optional<Direction> direction_from_string(const std::string& s) {
    if (s == "NONE") return Direction::NONE;
    if (s == "LONG") return Direction::LONG;
    if (s == "SHORT") return Direction::SHORT;
    return std::nullopt;
}

std::optional<PositionState> position_state_from_string(const std::string& s) {
    if (s == "FLAT") return PositionState::FLAT;
    if (s == "ENTERING") return PositionState::ENTERING;
    if (s == "OPEN") return PositionState::OPEN;
    if (s == "REDUCING") return PositionState::REDUCING;
    if (s == "CLOSING") return PositionState::CLOSING;
    if (s == "CLOSED") return PositionState::CLOSED;
    if (s == "FAILED") return PositionState::FAILED;
    return std::nullopt;
}

std::optional<MandateType> mandate_type_from_string(const std::string& s) {
    if (s == "ENTER") return MandateType::ENTER;
    if (s == "ADD") return MandateType::ADD;
    if (s == "REDUCE") return MandateType::REDUCE;
    if (s == "EXIT") return MandateType::EXIT;
    if (s == "BLOCK") return MandateType::BLOCK;
    if (s == "HOLD") return MandateType::HOLD;
    return std::nullopt;
}

std::optional<MandateOrigin> mandate_origin_from_string(const std::string& s) {
    if (s == "STRATEGY") return MandateOrigin::STRATEGY;
    if (s == "INVARIANT") return MandateOrigin::INVARIANT;
    if (s == "INTEGRITY") return MandateOrigin::INTEGRITY;
    if (s == "HALT") return MandateOrigin::HALT;
    return std::nullopt;
}

std::optional<IntentAction> intent_action_from_string(const std::string& s) {
    if (s == "OPEN") return IntentAction::OPEN;
    if (s == "REDUCE") return IntentAction::REDUCE;
    if (s == "CLOSE") return IntentAction::CLOSE;
    return std::nullopt;
}

std::optional<PriceType> price_type_from_string(const std::string& s) {
    if (s == "MARKET") return PriceType::MARKET;
    if (s == "LIMIT") return PriceType::LIMIT;
    if (s == "STOP") return PriceType::STOP;
    return std::nullopt;
}

std::optional<VerdictKind> verdict_kind_from_string(const std::string& s) {
    if (s == "ALLOW") return VerdictKind::ALLOW;
    if (s == "DENY") return VerdictKind::DENY;
    if (s == "FORCE(REDUCE)") return VerdictKind::FORCE_REDUCE;
    if (s == "FORCE(EXIT)") return VerdictKind::FORCE_EXIT;
    return std::nullopt;
}

std::optional<DiscardReason> discard_reason_from_string(const std::string& s) {
    if (s == "lower_authority") return DiscardReason::LOWER_AUTHORITY;
    if (s == "state_inadmissible") return DiscardReason::STATE_INADMISSIBLE;
    if (s == "invariant_denied") return DiscardReason::INVARIANT_DENIED;
    if (s == "directional_ambiguity") return DiscardReason::DIRECTIONAL_AMBIGUITY;
    if (s == "superseded") return DiscardReason::SUPERSEDED;
    if (s == "halted") return DiscardReason::HALTED;
    if (s == "expired") return DiscardReason::EXPIRED;
    if (s == "malformed") return DiscardReason::MALFORMED;
    if (s == "intent_suppressed") return DiscardReason::INTENT_SUPPRESSED;
    return std::nullopt;
}

} // namespace gate
