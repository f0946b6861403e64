/**
 * @file trade_metrics.hpp
 * @brief Stateless statistical primitives shared by every tradelab component.
 *
 * All functions are pure. Empty collections raise EmptyInput and NaN or
 * infinite values raise NonFiniteInput; neither is ever coerced to zero.
 * Degenerate-but-valid inputs (zero volatility, no losing trades) have
 * defined results documented per function.
 */

#ifndef TRADELAB_ANALYTICS_TRADE_METRICS_HPP
#define TRADELAB_ANALYTICS_TRADE_METRICS_HPP

#include "data/trade.hpp"

#include <vector>

namespace tradelab
{
    namespace analytics
    {

        /**
         * @struct PercentilePoint
         * @brief A requested percentile level and its interpolated value.
         */
        struct PercentilePoint
        {
            double level; ///< Percentile level in [0, 100]
            double value; ///< Interpolated value at that level
        };

        /**
         * @struct TTestResult
         * @brief Outcome of a Welch two-sample t-test.
         */
        struct TTestResult
        {
            double t_statistic;        ///< (mean_a - mean_b) / standard error
            double degrees_of_freedom; ///< Welch-Satterthwaite degrees of freedom
            double p_value;            ///< Two-sided p-value
        };

        /// Default percentile levels reported by simulation statistics.
        const std::vector<double> &default_percentile_levels();

        // ---------------------------------------------------------------
        // Series primitives
        // ---------------------------------------------------------------

        /**
         * @brief Reject empty or non-finite input.
         * @param values Series to check.
         * @param what Name used in the error message.
         * @throws EmptyInput If values is empty.
         * @throws NonFiniteInput If any value is NaN or infinite.
         */
        void require_finite(const std::vector<double> &values, const char *what);

        /** @brief Arithmetic mean. @throws EmptyInput, NonFiniteInput */
        double mean(const std::vector<double> &values);

        /**
         * @brief Sample standard deviation (n - 1 denominator).
         * @return 0.0 for a single observation.
         * @throws EmptyInput, NonFiniteInput
         */
        double sample_std_dev(const std::vector<double> &values);

        /**
         * @brief Mean divided by sample standard deviation.
         *
         * Not annualized. Returns 0.0 when fewer than two observations are
         * available or the series is constant. A deviation within 1e-12 of
         * max(1, |mean|) also counts as zero, so rounding noise in the mean of
         * a constant series never yields a huge ratio.
         *
         * @throws EmptyInput, NonFiniteInput
         */
        double sharpe_like_ratio(const std::vector<double> &values);

        /**
         * @brief Largest fractional decline from a running peak.
         * @param equity_path Capital values in order; the first must be positive.
         * @return Drawdown as a positive fraction (0.5 = 50%); 0 for a
         *         non-decreasing path.
         * @throws EmptyInput If the path is empty.
         * @throws NonFiniteInput If the path contains NaN or infinity.
         * @throws std::invalid_argument If the first value is not positive.
         */
        double max_drawdown(const std::vector<double> &equity_path);

        /**
         * @brief Largest absolute decline of the cumulative pnl curve.
         *
         * The curve starts at 0 before the first trade.
         *
         * @return Drawdown as a non-negative currency amount.
         * @throws EmptyInput, NonFiniteInput
         */
        double max_drawdown_amount(const std::vector<double> &pnls);

        /**
         * @brief Linearly interpolated percentiles.
         *
         * For level p the rank is p / 100 * (n - 1) over the sorted values.
         *
         * @param values Sample values (unsorted).
         * @param levels Requested levels in [0, 100].
         * @return One PercentilePoint per level, in the order requested.
         * @throws EmptyInput If values is empty.
         * @throws NonFiniteInput If values contains NaN or infinity.
         * @throws InvalidConfiguration If any level is outside [0, 100].
         */
        std::vector<PercentilePoint> percentiles(const std::vector<double> &values,
                                                 const std::vector<double> &levels);

        /** @brief Single-level convenience wrapper around percentiles(). */
        double percentile(const std::vector<double> &values, double level);

        // ---------------------------------------------------------------
        // Trade primitives
        // ---------------------------------------------------------------

        /** @brief pnl of each trade, in order. */
        std::vector<double> extract_pnl(const data::TradeList &trades);

        /**
         * @brief Fraction of trades with pnl > 0, in [0, 1].
         * @throws EmptyInput If trades is empty.
         */
        double win_rate(const data::TradeList &trades);

        /**
         * @brief Gross profit divided by gross loss magnitude.
         *
         * +infinity when there is at least one winner and no losers;
         * 0.0 when there are no winners.
         *
         * @throws EmptyInput If trades is empty.
         */
        double profit_factor(const data::TradeList &trades);

        /** @brief Sum of pnl. @throws EmptyInput */
        double total_pnl(const data::TradeList &trades);

        /** @brief Mean pnl of winning trades, 0.0 if none. @throws EmptyInput */
        double average_win(const data::TradeList &trades);

        /** @brief Mean loss magnitude of losing trades, 0.0 if none. @throws EmptyInput */
        double average_loss(const data::TradeList &trades);

        /**
         * @brief Expected pnl per trade: win_rate * avg_win - (1 - win_rate) * avg_loss.
         * @throws EmptyInput
         */
        double expectancy(const data::TradeList &trades);

        // ---------------------------------------------------------------
        // Hypothesis testing
        // ---------------------------------------------------------------

        /**
         * @brief Welch's unequal-variance two-sample t-test.
         *
         * Variances are not pooled; degrees of freedom follow the
         * Welch-Satterthwaite approximation. This differs from Student's
         * equal-variance test whenever the sample sizes or spreads differ.
         *
         * @throws InsufficientData If either sample has fewer than 2 values.
         * @throws NonFiniteInput If either sample contains NaN or infinity.
         *
         * @note When both samples have zero variance the statistic is
         *       undefined; t = 0 and p = 1 are reported if the means are equal,
         *       otherwise t = +/-infinity and p = 0. Standard errors and mean
         *       differences are compared against the sample magnitude with a
         *       relative tolerance of 1e-12.
         */
        TTestResult welch_t_test(const std::vector<double> &a,
                                 const std::vector<double> &b);

        /**
         * @brief Cohen's d with pooled standard deviation sqrt((sa^2 + sb^2) / 2).
         *
         * sa and sb are sample deviations (n - 1 denominator), not population
         * deviations.
         *
         * @return 0.0 when the pooled deviation is negligible next to the means.
         * @throws InsufficientData If either sample has fewer than 2 values.
         */
        double cohens_d(const std::vector<double> &a,
                        const std::vector<double> &b);

        /**
         * @brief Two-sided p-value of Student's t distribution.
         * @param t Test statistic.
         * @param dof Degrees of freedom (> 0).
         */
        double student_t_two_sided_p(double t, double dof);

    } // namespace analytics
} // namespace tradelab

#endif // TRADELAB_ANALYTICS_TRADE_METRICS_HPP
