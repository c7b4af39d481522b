#include "sim/simulation_runner.hpp"

#include <cmath>
#include <fstream>
#include <random>

namespace dnmm {

SimulationRunner::SimulationRunner(const SimulationConfig& config)
    : config_(config),
      engine_(config_.pool, config_.reserves, feed_) {}

void SimulationRunner::run() {
    std::mt19937_64 rng(config_.seed);
    std::normal_distribution<double> price_move(0.0, config_.price_vol_bps / kBps);
    std::normal_distribution<double> secondary_noise(0.0, config_.secondary_noise_bps / kBps);
    std::exponential_distribution<double> notional(1.0 / config_.swap_notional_mean);
    std::uniform_real_distribution<double> coin(0.0, 1.0);

    double mid = config_.initial_mid;
    double ema = mid;
    double stale_age = config_.pool.oracle.max_age_sec + 1.0;

    for (size_t step = 0; step < config_.steps; ++step) {
        Timestamp ts = (step + 1) * config_.seconds_per_step;
        engine_.set_current_time(ts);
        engine_.set_block(step + 1);

        mid *= std::exp(price_move(rng));
        ema = 0.9 * ema + 0.1 * mid;

        bool stale = coin(rng) < config_.stale_probability;
        feed_.set_primary(mid, stale ? stale_age : 0.0);
        double half = mid * config_.spread_bps / kBps / 2.0;
        feed_.set_bid_ask(mid - half, mid + half);
        feed_.set_ema(ema);

        double secondary = mid * (1.0 + secondary_noise(rng));
        if (coin(rng) < config_.divergence_probability) {
            double jump = config_.divergence_jump_bps / kBps;
            secondary *= coin(rng) < 0.5 ? 1.0 + jump : 1.0 - jump;
        }
        feed_.set_secondary(secondary, config_.spread_bps);

        bool base_in = coin(rng) < config_.base_in_probability;
        double size_quote = notional(rng);
        auto amount_in = static_cast<Amount>(std::floor(base_in ? size_quote / mid : size_quote));
        if (amount_in == 0) continue;

        auto result = engine_.swap(amount_in, 0, base_in, OracleMode::Spot, ts);
        if (!result) {
            metrics_.record_reject(result.error().code);
            continue;
        }

        const QuoteResult& fill = result->fill;
        const ReserveState& reserves = engine_.reserves();
        metrics_.record_trade(TradeRow{
            .step          = step,
            .ts            = ts,
            .mid           = fill.mid,
            .is_base_in    = base_in,
            .requested_in  = fill.requested_in,
            .applied_in    = fill.applied_in,
            .leftover_in   = fill.leftover_in,
            .amount_out    = fill.amount_out,
            .fee_bps       = fill.fee_bps,
            .regime_flags  = fill.regime_flags,
            .reason        = fill.reason,
            .base_reserve  = reserves.base_reserve,
            .quote_reserve = reserves.quote_reserve,
            .target_base   = reserves.target_base,
        });
    }
}

std::string SimulationRunner::report() const {
    return metrics_.generate_report(engine_.events());
}

void SimulationRunner::write_report(const std::string& report_path) const {
    std::ofstream f(report_path);
    f << report();
}

void SimulationRunner::write_csv(const std::string& csv_path) const {
    metrics_.write_csv(csv_path);
}

} // namespace dnmm
