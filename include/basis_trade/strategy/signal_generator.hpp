// include/basis_trade/strategy/signal_generator.hpp
#pragma once

#include <string>
#include "basis_trade/core/types.hpp"

namespace basis_trade {
namespace strategy {

/**
 * @brief Discrete trading signals derived from the monthly basis
 */
enum class Signal {
    STRONG_ENTRY,
    ACCEPTABLE_ENTRY,
    PARTIAL_EXIT,
    FULL_EXIT,
    STOP_LOSS,
    NO_ENTRY
};

std::string signal_to_string(Signal signal);

/// Fixed partial-exit level; not part of the configurable threshold set
constexpr double PARTIAL_EXIT_THRESHOLD = 0.025;

/**
 * @brief Monthly-basis thresholds driving signal classification
 */
struct SignalThresholds {
    double entry_threshold = 0.005;
    double strong_entry_threshold = 0.01;
    double stop_loss_threshold = 0.002;
    double exit_threshold = 0.035;
};

/**
 * @brief Stateless classifier mapping one observation to a Signal
 *
 * Rules are evaluated in order, first match wins:
 *   basis < 0 or monthly < stop           -> STOP_LOSS
 *   monthly > exit                        -> FULL_EXIT
 *   monthly > 0.025                       -> PARTIAL_EXIT
 *   monthly > max(strong, entry)          -> STRONG_ENTRY
 *   monthly > entry                       -> ACCEPTABLE_ENTRY
 *   otherwise                             -> NO_ENTRY
 * where monthly = (futures - spot) / spot * 30 / days_to_expiry.
 */
class SignalGenerator {
public:
    explicit SignalGenerator(const SignalThresholds& thresholds = SignalThresholds())
        : thresholds_(thresholds) {}

    /**
     * @param days_to_expiry Values <= 0 are treated as 1
     */
    Signal generate_signal(Price spot_price, Price futures_price, int days_to_expiry) const;

    /**
     * @brief Basis as a fraction of spot, normalized to 30 days
     * Returns 0 when spot is 0.
     */
    static double monthly_basis(Price spot_price, Price futures_price, int days_to_expiry);

    const SignalThresholds& thresholds() const {
        return thresholds_;
    }

private:
    SignalThresholds thresholds_;
};

/**
 * @brief True for signals that open a position when flat
 */
inline bool is_entry_signal(Signal signal) {
    return signal == Signal::STRONG_ENTRY || signal == Signal::ACCEPTABLE_ENTRY;
}

}  // namespace strategy
}  // namespace basis_trade
