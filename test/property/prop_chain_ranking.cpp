/**
 * @file  prop_chain_ranking.cpp
 * @brief Property: ∀ hypothesis sets: chain strength compounds, confidence penalises length
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_chain_ranking
 *
 * Invariants:
 *   • total_strength ≤ min(edge strength) along the chain
 *   • chain_confidence = total_strength / |entities|
 *   • equal total_strength ⇒ the longer chain has lower confidence
 *   • output is sorted by total_strength · chain_confidence, descending
 *   • no chain revisits an entity, and no chain exceeds max_chain_length
 */

#include <rapidcheck.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "tkg/chain_builder.hpp"

#include <spdlog/spdlog.h>

using namespace tkg;
using namespace tkg::chain;

namespace {

constexpr int NODES = 7;

/// Edges between NODES nodes, strengths in (0.6, 1].
std::vector<causal::CausalHypothesis>
make_hypotheses(const std::vector<std::pair<int, int>>& raw) {
    std::vector<causal::CausalHypothesis> hyps;
    for (const auto& [a_raw, s_raw] : raw) {
        const int a = std::abs(a_raw % NODES);
        const int b = std::abs((a_raw / NODES) % NODES);
        if (a == b) continue;
        const double strength = 0.61 + 0.39 * (std::abs(s_raw % 1000) / 999.0);
        hyps.push_back(causal::CausalHypothesis{
            .cause_id    = "n" + std::to_string(a),
            .effect_id   = "n" + std::to_string(b),
            .cause_kind  = EntityKind::MarketEvent,
            .effect_kind = EntityKind::VolumeSpike,
            .cause_time  = static_cast<double>(a),
            .effect_time = static_cast<double>(b),
            .mechanism   = causal::CausalMechanism::MarketReaction,
            .strength    = strength,
            .evidence    = {},
        });
    }
    return hyps;
}

}  // namespace

int main() {
    spdlog::set_level(spdlog::level::off);
    bool ok = true;

    // ── Property 1: strength monotonicity and confidence formula ────────────
    ok &= rc::check(
        "chain: total_strength <= min edge strength",
        [](const std::vector<std::pair<int, int>>& raw) {
            const auto hyps = make_hypotheses(raw);
            std::map<std::pair<std::string, std::string>, double> best;
            for (const auto& h : hyps) {
                auto& s = best[{h.cause_id, h.effect_id}];
                s = std::max(s, h.strength);
            }

            const std::size_t max_len = *rc::gen::inRange<std::size_t>(1, 5);
            const auto chains = ChainBuilder{}.build(hyps, max_len).chains;
            for (const auto& c : chains) {
                RC_ASSERT(c.entities.size() >= 2);
                RC_ASSERT(c.length() <= max_len);

                double min_edge = 1.0;
                for (std::size_t i = 1; i < c.entities.size(); ++i) {
                    min_edge = std::min(min_edge, best.at({c.entities[i - 1], c.entities[i]}));
                }
                RC_ASSERT(c.total_strength <= min_edge + 1e-12);
                RC_ASSERT(std::abs(c.chain_confidence
                                   - c.total_strength / c.entities.size()) < 1e-12);

                const std::set<std::string> distinct(c.entities.begin(), c.entities.end());
                RC_ASSERT(distinct.size() == c.entities.size());
            }
        }
    );

    // ── Property 2: ranking order ───────────────────────────────────────────
    ok &= rc::check(
        "chain: output sorted by rank score, ids unique",
        [](const std::vector<std::pair<int, int>>& raw) {
            const auto chains = ChainBuilder{}.build(make_hypotheses(raw), 4).chains;
            RC_ASSERT(chains.size() <= 100u);
            std::set<std::string> ids;
            for (std::size_t i = 0; i < chains.size(); ++i) {
                RC_ASSERT(ids.insert(chains[i].id).second);
                if (i > 0) {
                    RC_ASSERT(chains[i - 1].rank_score() >= chains[i].rank_score());
                }
            }
        }
    );

    // ── Property 3: length penalty ──────────────────────────────────────────
    ok &= rc::check(
        "chain: equal strength, more entities => lower confidence",
        [](int s_raw, int extra_raw) {
            const double total = 0.01 + 0.99 * (std::abs(s_raw % 1000) / 999.0);
            const std::size_t short_n = 2;
            const std::size_t long_n  = short_n + 1 + static_cast<std::size_t>(std::abs(extra_raw % 5));

            CausalChain a;
            a.entities.resize(short_n);
            a.total_strength   = total;
            a.chain_confidence = total / static_cast<double>(short_n);
            CausalChain b;
            b.entities.resize(long_n);
            b.total_strength   = total;
            b.chain_confidence = total / static_cast<double>(long_n);

            RC_ASSERT(b.chain_confidence < a.chain_confidence);
            RC_ASSERT(b.rank_score() < a.rank_score());
        }
    );

    return ok ? 0 : 1;
}
