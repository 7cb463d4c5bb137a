/// @file src/causal/kind_tables.cpp
/// @brief Kind-pair compatibility and mechanism tables.
///
/// Both tables switch over every cause kind without a `default`, so a new
/// EntityKind enumerator triggers -Wswitch here until it is classified.

#include "tkg/causal_discovery.hpp"

namespace tkg::causal {

const char* to_string(CausalMechanism m) noexcept {
    switch (m) {
        case CausalMechanism::InformationImpact:    return "information_impact";
        case CausalMechanism::FundamentalAnalysis:  return "fundamental_analysis";
        case CausalMechanism::TechnicalAnalysis:    return "technical_analysis";
        case CausalMechanism::LiquidityImpact:      return "liquidity_impact";
        case CausalMechanism::AlgorithmicExecution: return "algorithmic_execution";
        case CausalMechanism::MarketReaction:       return "market_reaction";
        case CausalMechanism::Unknown:              return "unknown_mechanism";
    }
    return "unknown_mechanism";
}

double causal_compatibility(EntityKind cause, EntityKind effect) noexcept {
    constexpr double unlisted = constants::DEFAULT_COMPATIBILITY;
    switch (cause) {
        case EntityKind::NewsEvent:
            return effect == EntityKind::PriceMovement ? 0.9 : unlisted;
        case EntityKind::EconomicData:
            return effect == EntityKind::MarketEvent ? 0.8 : unlisted;
        case EntityKind::TechnicalIndicator:
            return effect == EntityKind::TradingSignal ? 0.7 : unlisted;
        case EntityKind::VolumeSpike:
            return effect == EntityKind::PriceMovement ? 0.6 : unlisted;
        case EntityKind::TradingSignal:
            return effect == EntityKind::StrategyOutput ? 0.8 : unlisted;
        case EntityKind::MarketEvent:
            return effect == EntityKind::VolumeSpike ? 0.5 : unlisted;
        case EntityKind::PriceMovement:
        case EntityKind::StrategyOutput:
            return unlisted;
    }
    return unlisted;
}

CausalMechanism causal_mechanism(EntityKind cause, EntityKind effect) noexcept {
    switch (cause) {
        case EntityKind::NewsEvent:
            if (effect == EntityKind::PriceMovement) return CausalMechanism::InformationImpact;
            break;
        case EntityKind::EconomicData:
            if (effect == EntityKind::MarketEvent) return CausalMechanism::FundamentalAnalysis;
            break;
        case EntityKind::TechnicalIndicator:
            if (effect == EntityKind::TradingSignal) return CausalMechanism::TechnicalAnalysis;
            break;
        case EntityKind::VolumeSpike:
            if (effect == EntityKind::PriceMovement) return CausalMechanism::LiquidityImpact;
            break;
        case EntityKind::TradingSignal:
            if (effect == EntityKind::StrategyOutput) return CausalMechanism::AlgorithmicExecution;
            break;
        case EntityKind::MarketEvent:
            if (effect == EntityKind::VolumeSpike) return CausalMechanism::MarketReaction;
            break;
        case EntityKind::PriceMovement:
        case EntityKind::StrategyOutput:
            break;
    }
    return CausalMechanism::Unknown;
}

}  // namespace tkg::causal
