/**
 * @file trade_metrics.cpp
 * @brief Implementation of the shared statistical primitives.
 */

#include "analytics/trade_metrics.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <string>

namespace tradelab
{
    namespace analytics
    {

        // ===================================================================
        // Anonymous namespace: incomplete beta for the t distribution
        // ===================================================================

        namespace
        {

            /**
             * @brief Continued fraction for the regularized incomplete beta.
             *
             * Modified Lentz evaluation, converges quickly for x < (a+1)/(a+b+2).
             */
            double beta_continued_fraction(double a, double b, double x)
            {
                static const int MAX_ITER = 300;
                static const double EPS = 1e-14;
                static const double FPMIN = 1e-300;

                double qab = a + b;
                double qap = a + 1.0;
                double qam = a - 1.0;
                double c = 1.0;
                double d = 1.0 - qab * x / qap;
                if (std::abs(d) < FPMIN)
                {
                    d = FPMIN;
                }
                d = 1.0 / d;
                double h = d;

                for (int m = 1; m <= MAX_ITER; ++m)
                {
                    int m2 = 2 * m;
                    double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
                    d = 1.0 + aa * d;
                    if (std::abs(d) < FPMIN)
                    {
                        d = FPMIN;
                    }
                    c = 1.0 + aa / c;
                    if (std::abs(c) < FPMIN)
                    {
                        c = FPMIN;
                    }
                    d = 1.0 / d;
                    h *= d * c;

                    aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
                    d = 1.0 + aa * d;
                    if (std::abs(d) < FPMIN)
                    {
                        d = FPMIN;
                    }
                    c = 1.0 + aa / c;
                    if (std::abs(c) < FPMIN)
                    {
                        c = FPMIN;
                    }
                    d = 1.0 / d;
                    double del = d * c;
                    h *= del;
                    if (std::abs(del - 1.0) < EPS)
                    {
                        break;
                    }
                }
                return h;
            }

            /// Regularized incomplete beta I_x(a, b).
            double incomplete_beta(double a, double b, double x)
            {
                if (x <= 0.0)
                {
                    return 0.0;
                }
                if (x >= 1.0)
                {
                    return 1.0;
                }

                double ln_front = std::lgamma(a + b) - std::lgamma(a) - std::lgamma(b) + a * std::log(x) + b * std::log(1.0 - x);
                double front = std::exp(ln_front);

                if (x < (a + 1.0) / (a + b + 2.0))
                {
                    return front * beta_continued_fraction(a, b, x) / a;
                }
                return 1.0 - front * beta_continued_fraction(b, a, 1.0 - x) / b;
            }

            /// Relative tolerance below which a spread or a mean difference counts as zero.
            constexpr double DEGENERATE_TOLERANCE = 1e-12;

            /// True when x is negligible next to the magnitude of the data it came from.
            bool negligible(double x, double scale)
            {
                return std::abs(x) <= DEGENERATE_TOLERANCE * std::max(1.0, std::abs(scale));
            }

            double sample_variance(const std::vector<double> &values, double m)
            {
                // A constant series has exactly zero spread; the rounded mean would not
                if (std::all_of(values.begin(), values.end(), [&values](double v)
                                { return v == values.front(); }))
                {
                    return 0.0;
                }

                double sum_sq = 0.0;
                for (double v : values)
                {
                    double diff = v - m;
                    sum_sq += diff * diff;
                }
                return sum_sq / static_cast<double>(values.size() - 1);
            }

            void require_trades(const data::TradeList &trades, const char *what)
            {
                if (trades.empty())
                {
                    throw EmptyInput(std::string(what) + " is undefined for an empty trade collection");
                }
            }

            void require_sample(const std::vector<double> &values, const char *name)
            {
                require_finite(values, name);
                if (values.size() < 2)
                {
                    throw InsufficientData(
                        std::string(name) + " needs at least 2 observations, got: " + std::to_string(values.size()));
                }
            }

        } // anonymous namespace

        const std::vector<double> &default_percentile_levels()
        {
            static const std::vector<double> LEVELS = {5.0, 25.0, 50.0, 75.0, 95.0};
            return LEVELS;
        }

        // ===================================================================
        // Series primitives
        // ===================================================================

        void require_finite(const std::vector<double> &values, const char *what)
        {
            if (values.empty())
            {
                throw EmptyInput(std::string(what) + " cannot be empty");
            }
            for (size_t i = 0; i < values.size(); ++i)
            {
                if (!std::isfinite(values[i]))
                {
                    throw NonFiniteInput(
                        std::string(what) + " contains a non-finite value at index " + std::to_string(i));
                }
            }
        }

        double mean(const std::vector<double> &values)
        {
            require_finite(values, "mean input");
            return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
        }

        double sample_std_dev(const std::vector<double> &values)
        {
            double m = mean(values);
            if (values.size() < 2)
            {
                return 0.0;
            }
            return std::sqrt(sample_variance(values, m));
        }

        double sharpe_like_ratio(const std::vector<double> &values)
        {
            double sd = sample_std_dev(values);
            double m = mean(values);
            if (negligible(sd, m))
            {
                return 0.0;
            }
            return m / sd;
        }

        double max_drawdown(const std::vector<double> &equity_path)
        {
            require_finite(equity_path, "equity path");
            if (equity_path.front() <= 0.0)
            {
                throw std::invalid_argument(
                    "Equity path must start with positive capital, got: " + std::to_string(equity_path.front()));
            }

            double peak = equity_path.front();
            double max_dd = 0.0;
            for (double value : equity_path)
            {
                if (value > peak)
                {
                    peak = value;
                }
                double dd = (peak - value) / peak;
                if (dd > max_dd)
                {
                    max_dd = dd;
                }
            }
            return max_dd;
        }

        double max_drawdown_amount(const std::vector<double> &pnls)
        {
            require_finite(pnls, "pnl series");

            double cumulative = 0.0;
            double peak = 0.0;
            double max_dd = 0.0;
            for (double pnl : pnls)
            {
                cumulative += pnl;
                peak = std::max(peak, cumulative);
                max_dd = std::max(max_dd, peak - cumulative);
            }
            return max_dd;
        }

        std::vector<PercentilePoint> percentiles(const std::vector<double> &values,
                                                 const std::vector<double> &levels)
        {
            require_finite(values, "percentile input");
            for (double level : levels)
            {
                if (!(level >= 0.0 && level <= 100.0))
                {
                    throw InvalidConfiguration(
                        "Percentile level must be in [0, 100], got: " + std::to_string(level));
                }
            }

            std::vector<double> sorted(values);
            std::sort(sorted.begin(), sorted.end());
            int n = static_cast<int>(sorted.size());

            std::vector<PercentilePoint> result;
            result.reserve(levels.size());
            for (double level : levels)
            {
                double index = level / 100.0 * static_cast<double>(n - 1);
                int lower = static_cast<int>(std::floor(index));
                int upper = static_cast<int>(std::ceil(index));

                double value;
                if (lower == upper || upper >= n)
                {
                    value = sorted[lower];
                }
                else
                {
                    double frac = index - static_cast<double>(lower);
                    value = sorted[lower] + (sorted[upper] - sorted[lower]) * frac;
                }
                result.push_back({level, value});
            }
            return result;
        }

        double percentile(const std::vector<double> &values, double level)
        {
            return percentiles(values, {level}).front().value;
        }

        // ===================================================================
        // Trade primitives
        // ===================================================================

        std::vector<double> extract_pnl(const data::TradeList &trades)
        {
            std::vector<double> pnls;
            pnls.reserve(trades.size());
            for (const auto &t : trades)
            {
                pnls.push_back(t.pnl());
            }
            return pnls;
        }

        double win_rate(const data::TradeList &trades)
        {
            require_trades(trades, "Win rate");
            auto wins = std::count_if(trades.begin(), trades.end(),
                                      [](const data::Trade &t)
                                      { return t.is_winner(); });
            return static_cast<double>(wins) / static_cast<double>(trades.size());
        }

        double profit_factor(const data::TradeList &trades)
        {
            require_trades(trades, "Profit factor");

            double gross_profit = 0.0;
            double gross_loss = 0.0;
            for (const auto &t : trades)
            {
                if (t.pnl() > 0.0)
                {
                    gross_profit += t.pnl();
                }
                else if (t.pnl() < 0.0)
                {
                    gross_loss -= t.pnl();
                }
            }

            if (gross_loss == 0.0)
            {
                return gross_profit > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
            }
            return gross_profit / gross_loss;
        }

        double total_pnl(const data::TradeList &trades)
        {
            require_trades(trades, "Total pnl");
            double sum = 0.0;
            for (const auto &t : trades)
            {
                sum += t.pnl();
            }
            return sum;
        }

        double average_win(const data::TradeList &trades)
        {
            require_trades(trades, "Average win");
            double sum = 0.0;
            int count = 0;
            for (const auto &t : trades)
            {
                if (t.pnl() > 0.0)
                {
                    sum += t.pnl();
                    ++count;
                }
            }
            return count > 0 ? sum / count : 0.0;
        }

        double average_loss(const data::TradeList &trades)
        {
            require_trades(trades, "Average loss");
            double sum = 0.0;
            int count = 0;
            for (const auto &t : trades)
            {
                if (t.pnl() < 0.0)
                {
                    sum -= t.pnl();
                    ++count;
                }
            }
            return count > 0 ? sum / count : 0.0;
        }

        double expectancy(const data::TradeList &trades)
        {
            double wr = win_rate(trades);
            return wr * average_win(trades) - (1.0 - wr) * average_loss(trades);
        }

        // ===================================================================
        // Hypothesis testing
        // ===================================================================

        double student_t_two_sided_p(double t, double dof)
        {
            if (!(dof > 0.0))
            {
                throw std::invalid_argument(
                    "Degrees of freedom must be positive, got: " + std::to_string(dof));
            }
            if (std::isinf(t))
            {
                return 0.0;
            }
            double x = dof / (dof + t * t);
            return incomplete_beta(0.5 * dof, 0.5, x);
        }

        TTestResult welch_t_test(const std::vector<double> &a,
                                 const std::vector<double> &b)
        {
            require_sample(a, "first sample");
            require_sample(b, "second sample");

            double na = static_cast<double>(a.size());
            double nb = static_cast<double>(b.size());
            double ma = mean(a);
            double mb = mean(b);
            double va = sample_variance(a, ma) / na;
            double vb = sample_variance(b, mb) / nb;
            double se2 = va + vb;

            const double scale = std::max(std::abs(ma), std::abs(mb));

            TTestResult result{};
            if (negligible(std::sqrt(se2), scale))
            {
                if (negligible(ma - mb, scale))
                {
                    result.t_statistic = 0.0;
                    result.p_value = 1.0;
                }
                else
                {
                    result.t_statistic = ma > mb ? std::numeric_limits<double>::infinity()
                                                 : -std::numeric_limits<double>::infinity();
                    result.p_value = 0.0;
                }
                result.degrees_of_freedom = na + nb - 2.0;
                return result;
            }

            result.t_statistic = (ma - mb) / std::sqrt(se2);
            // Welch-Satterthwaite
            result.degrees_of_freedom = (se2 * se2) / (va * va / (na - 1.0) + vb * vb / (nb - 1.0));
            result.p_value = student_t_two_sided_p(result.t_statistic, result.degrees_of_freedom);
            return result;
        }

        double cohens_d(const std::vector<double> &a,
                        const std::vector<double> &b)
        {
            require_sample(a, "first sample");
            require_sample(b, "second sample");

            double sa = sample_std_dev(a);
            double sb = sample_std_dev(b);
            double pooled = std::sqrt((sa * sa + sb * sb) / 2.0);
            double ma = mean(a);
            double mb = mean(b);
            if (negligible(pooled, std::max(std::abs(ma), std::abs(mb))))
            {
                return 0.0;
            }
            return (ma - mb) / pooled;
        }

    } // namespace analytics
} // namespace tradelab
