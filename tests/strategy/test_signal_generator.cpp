#include <gtest/gtest.h>
#include "basis_trade/strategy/signal_generator.hpp"

using namespace basis_trade;
using namespace basis_trade::strategy;

class SignalGeneratorTest : public ::testing::Test {
protected:
    // spot 100 and 30 days to expiry make the monthly basis equal to the raw basis
    Signal classify(double futures_price) const {
        return generator.generate_signal(100.0, futures_price, 30);
    }

    SignalGenerator generator;
};

TEST_F(SignalGeneratorTest, MonthlyBasisNormalization) {
    EXPECT_NEAR(SignalGenerator::monthly_basis(90000.0, 91000.0, 20), 0.0166667, 1e-6);
    EXPECT_NEAR(SignalGenerator::monthly_basis(100.0, 101.0, 60), 0.005, 1e-12);
    EXPECT_DOUBLE_EQ(SignalGenerator::monthly_basis(0.0, 101.0, 30), 0.0);
}

TEST_F(SignalGeneratorTest, NonPositiveDaysToExpiryTreatedAsOne) {
    double one_day = SignalGenerator::monthly_basis(100.0, 100.1, 1);
    EXPECT_DOUBLE_EQ(SignalGenerator::monthly_basis(100.0, 100.1, 0), one_day);
    EXPECT_DOUBLE_EQ(SignalGenerator::monthly_basis(100.0, 100.1, -5), one_day);
    EXPECT_EQ(generator.generate_signal(100.0, 100.1, 0), Signal::PARTIAL_EXIT);  // 3% monthly
}

TEST_F(SignalGeneratorTest, DefaultThresholdBands) {
    EXPECT_EQ(classify(99.0), Signal::STOP_LOSS);         // backwardation
    EXPECT_EQ(classify(100.1), Signal::STOP_LOSS);        // 0.1% < stop
    EXPECT_EQ(classify(100.3), Signal::NO_ENTRY);         // between stop and entry
    EXPECT_EQ(classify(100.7), Signal::ACCEPTABLE_ENTRY);
    EXPECT_EQ(classify(101.5), Signal::STRONG_ENTRY);
    EXPECT_EQ(classify(103.0), Signal::PARTIAL_EXIT);
    EXPECT_EQ(classify(104.0), Signal::FULL_EXIT);
}

TEST_F(SignalGeneratorTest, ZeroSpotIsStopLoss) {
    EXPECT_EQ(generator.generate_signal(0.0, 100.0, 30), Signal::STOP_LOSS);
}

TEST_F(SignalGeneratorTest, SingleDayScenarioIsStrongEntry) {
    EXPECT_EQ(generator.generate_signal(90000.0, 91000.0, 20), Signal::STRONG_ENTRY);
}

TEST_F(SignalGeneratorTest, EntryAboveStrongThresholdRaisesStrongBar) {
    SignalThresholds thresholds;
    thresholds.entry_threshold = 0.012;
    thresholds.strong_entry_threshold = 0.01;
    SignalGenerator strict(thresholds);

    EXPECT_EQ(strict.generate_signal(100.0, 101.1, 30), Signal::NO_ENTRY);
    EXPECT_EQ(strict.generate_signal(100.0, 101.5, 30), Signal::STRONG_ENTRY);
}

TEST_F(SignalGeneratorTest, SignalsAreIdempotent) {
    for (double futures : {99.0, 100.3, 100.7, 101.5, 103.0, 104.0}) {
        for (int dte : {-3, 0, 1, 7, 30, 90}) {
            EXPECT_EQ(generator.generate_signal(100.0, futures, dte),
                      generator.generate_signal(100.0, futures, dte));
        }
    }
}

TEST_F(SignalGeneratorTest, OrderingInvariantAcrossThresholdSets) {
    const double entries[] = {0.004, 0.008, 0.012, 0.02};
    const double stops[] = {0.001, 0.003};
    const double exits[] = {0.022, 0.03, 0.05};

    for (double entry : entries) {
        for (double stop : stops) {
            for (double exit_level : exits) {
                if (!(stop < entry && entry < exit_level)) {
                    continue;
                }
                SignalThresholds thresholds;
                thresholds.entry_threshold = entry;
                thresholds.stop_loss_threshold = stop;
                thresholds.exit_threshold = exit_level;
                SignalGenerator sweep(thresholds);

                for (int bp = -20; bp <= 80; ++bp) {
                    double monthly = bp / 1000.0 + 0.0001;
                    Signal signal = sweep.generate_signal(100.0, 100.0 * (1.0 + monthly), 30);
                    if (monthly < entry) {
                        EXPECT_FALSE(is_entry_signal(signal))
                            << "monthly " << monthly << " entry " << entry;
                    }
                    if (monthly > exit_level) {
                        EXPECT_NE(signal, Signal::NO_ENTRY) << "monthly " << monthly;
                    }
                }
            }
        }
    }
}

TEST_F(SignalGeneratorTest, SignalNames) {
    EXPECT_EQ(signal_to_string(Signal::STRONG_ENTRY), "strong_entry");
    EXPECT_EQ(signal_to_string(Signal::ACCEPTABLE_ENTRY), "acceptable_entry");
    EXPECT_EQ(signal_to_string(Signal::PARTIAL_EXIT), "partial_exit");
    EXPECT_EQ(signal_to_string(Signal::FULL_EXIT), "full_exit");
    EXPECT_EQ(signal_to_string(Signal::STOP_LOSS), "stop_loss");
    EXPECT_EQ(signal_to_string(Signal::NO_ENTRY), "no_entry");
}

TEST_F(SignalGeneratorTest, EntrySignals) {
    EXPECT_TRUE(is_entry_signal(Signal::STRONG_ENTRY));
    EXPECT_TRUE(is_entry_signal(Signal::ACCEPTABLE_ENTRY));
    EXPECT_FALSE(is_entry_signal(Signal::PARTIAL_EXIT));
    EXPECT_FALSE(is_entry_signal(Signal::NO_ENTRY));
}
