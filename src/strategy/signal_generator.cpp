// src/strategy/signal_generator.cpp
#include "basis_trade/strategy/signal_generator.hpp"
#include <algorithm>

namespace basis_trade {
namespace strategy {

std::string signal_to_string(Signal signal) {
    switch (signal) {
        case Signal::STRONG_ENTRY:
            return "strong_entry";
        case Signal::ACCEPTABLE_ENTRY:
            return "acceptable_entry";
        case Signal::PARTIAL_EXIT:
            return "partial_exit";
        case Signal::FULL_EXIT:
            return "full_exit";
        case Signal::STOP_LOSS:
            return "stop_loss";
        case Signal::NO_ENTRY:
            return "no_entry";
        default:
            return "unknown";
    }
}

double SignalGenerator::monthly_basis(Price spot_price, Price futures_price, int days_to_expiry) {
    if (days_to_expiry <= 0) {
        days_to_expiry = 1;
    }
    if (spot_price == 0.0) {
        return 0.0;
    }
    double basis_pct = (futures_price - spot_price) / spot_price;
    return basis_pct * (30.0 / days_to_expiry);
}

Signal SignalGenerator::generate_signal(Price spot_price, Price futures_price,
                                        int days_to_expiry) const {
    const double basis_pct = spot_price != 0.0 ? (futures_price - spot_price) / spot_price : 0.0;
    const double monthly = monthly_basis(spot_price, futures_price, days_to_expiry);

    if (basis_pct < 0.0 || monthly < thresholds_.stop_loss_threshold) {
        return Signal::STOP_LOSS;
    }

    if (monthly > thresholds_.exit_threshold) {
        return Signal::FULL_EXIT;
    }
    if (monthly > PARTIAL_EXIT_THRESHOLD) {
        return Signal::PARTIAL_EXIT;
    }

    // A configured entry level above the strong level raises the strong bar too
    const double strong_level =
        std::max(thresholds_.strong_entry_threshold, thresholds_.entry_threshold);
    if (monthly > strong_level) {
        return Signal::STRONG_ENTRY;
    }
    if (monthly > thresholds_.entry_threshold) {
        return Signal::ACCEPTABLE_ENTRY;
    }

    return Signal::NO_ENTRY;
}

}  // namespace strategy
}  // namespace basis_trade
