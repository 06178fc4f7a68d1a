#pragma once

#include <cstdint>

namespace xlend { namespace math {

using u128 = unsigned __int128;

static constexpr u128     ONE_4DP          = 10'000;
static constexpr u128     ONE_6DP          = 1'000'000;
static constexpr u128     ONE_18DP         = 1'000'000'000'000'000'000ULL; // 1e18
static constexpr uint64_t SECONDS_IN_YEAR  = 31'536'000;                    // 365 days

enum class math_err: uint8_t {
   RATIO_EXCEEDS_ONE    = 1,
   MUL_OVERFLOW         = 2,
   DIVIDE_BY_ZERO       = 3
};

// 由使用方实现：合约内走 eosio::check，单元测试里抛异常
void fail(math_err code, const char* msg);

struct u256 {
   u128 hi = 0;
   u128 lo = 0;
};

inline u256 mul_wide(u128 a, u128 b) {
   const u128 mask = (u128)UINT64_MAX;
   u128 a0 = a & mask, a1 = a >> 64;
   u128 b0 = b & mask, b1 = b >> 64;

   u128 p00 = a0 * b0;
   u128 p01 = a0 * b1;
   u128 p10 = a1 * b0;
   u128 p11 = a1 * b1;

   u128 mid = (p00 >> 64) + (p01 & mask) + (p10 & mask);
   u256 r;
   r.lo = (p00 & mask) | (mid << 64);
   r.hi = p11 + (p01 >> 64) + (p10 >> 64) + (mid >> 64);
   return r;
}

inline u256 add_wide(const u256& a, const u256& b) {
   u256 r;
   r.lo = a.lo + b.lo;
   r.hi = a.hi + b.hi + (r.lo < a.lo ? 1 : 0);
   if (r.hi < a.hi) fail(math_err::MUL_OVERFLOW, "math overflow");
   return r;
}

/// 256 位被除数除以 d，商必须落在 128 位内
inline u128 div_wide(const u256& p, u128 d, bool round_up = false) {
   if (d == 0) {
      fail(math_err::DIVIDE_BY_ZERO, "math divide by zero");
      return 0;
   }
   u128 q = 0, rem = 0;
   if (p.hi == 0) {
      q   = p.lo / d;
      rem = p.lo % d;
   } else {
      if (p.hi >= d) {
         fail(math_err::MUL_OVERFLOW, "math overflow");
         return 0;
      }
      rem = p.hi;
      for (int i = 127; i >= 0; --i) {
         bool carry = (rem >> 127) != 0;
         rem = (rem << 1) | ((p.lo >> i) & 1);
         q <<= 1;
         if (carry || rem >= d) {
            rem -= d;
            q |= 1;
         }
      }
   }
   if (round_up && rem != 0) {
      if (q == ~(u128)0) {
         fail(math_err::MUL_OVERFLOW, "math overflow");
         return 0;
      }
      ++q;
   }
   return q;
}

/**
 * a * b / d with a 256-bit intermediate product.
 * The quotient must fit in 128 bits, otherwise fails with math overflow.
 */
inline u128 mul_div(u128 a, u128 b, u128 d, bool round_up = false) {
   return div_wide(mul_wide(a, b), d, round_up);
}

inline u128 checked_add(u128 a, u128 b) {
   u128 c = a + b;
   if (c < a) {
      fail(math_err::MUL_OVERFLOW, "math overflow");
      return 0;
   }
   return c;
}

inline u128 pow10(uint8_t p) {
   u128 x = 1;
   for (uint8_t i = 0; i < p; ++i) x *= 10;
   return x;
}

inline u128 mul_scale(u128 a, u128 b, u128 scale)          { return mul_div(a, b, scale); }
inline u128 mul_scale_round_up(u128 a, u128 b, u128 scale) { return mul_div(a, b, scale, true); }
inline u128 div_scale(u128 a, u128 b, u128 scale)          { return mul_div(a, scale, b); }
inline u128 div_scale_round_up(u128 a, u128 b, u128 scale) { return mul_div(a, scale, b, true); }

inline u128 exp_by_squaring(u128 x, uint64_t n, u128 scale) {
   if (n == 0) return scale;

   u128 y = scale;
   while (n > 1) {
      if (n % 2 == 1) {
         y = mul_scale(x, y, scale);
         n = (n - 1) / 2;
      } else {
         n = n / 2;
      }
      x = mul_scale(x, x, scale);
   }
   return mul_scale(x, y, scale);
}

/// numerator / denominator at 18dp, only defined for numerator <= denominator
inline u128 ratio(u128 numerator, u128 denominator) {
   if (numerator > denominator) {
      fail(math_err::RATIO_EXCEEDS_ONE, "ratio exceeds one");
      return 0;
   }
   if (denominator == 0) return 0;
   return div_scale(numerator, denominator, ONE_18DP);
}

inline u128 utilisation_ratio(u128 total_debt, u128 total_deposits) {
   return ratio(total_debt, total_deposits);
}

inline u128 stable_debt_to_total_debt_ratio(u128 stable_debt, u128 total_debt) {
   return ratio(stable_debt, total_debt);
}

// 利率曲线：vr* 6dp，uopt 4dp，ut 18dp
inline u128 variable_borrow_interest_rate(u128 vr0, u128 vr1, u128 vr2, u128 ut, u128 uopt) {
   const u128 uopt18 = uopt * 100'000'000'000'000ULL; // 4dp -> 18dp
   if (ut < uopt18) {
      return vr0 * 1'000'000'000'000ULL + div_scale(mul_scale(ut, vr1, ONE_6DP), uopt, ONE_4DP);
   }
   return (vr0 + vr1) * 1'000'000'000'000ULL
        + div_scale(mul_scale(ut - uopt18, vr2, ONE_6DP), ONE_4DP - uopt, ONE_4DP);
}

inline u128 stable_borrow_interest_rate(u128 vr1, u128 sr0, u128 sr1, u128 sr2, u128 sr3,
                                        u128 ut, u128 uopt, u128 ratiot, u128 ratioopt) {
   const u128 uopt18     = uopt * 100'000'000'000'000ULL;
   const u128 ratioopt18 = ratioopt * 100'000'000'000'000ULL;

   u128 base = 0;
   if (ut <= uopt18) {
      base = (vr1 + sr0) * 1'000'000'000'000ULL + div_scale(mul_scale(ut, sr1, ONE_6DP), uopt, ONE_4DP);
   } else {
      base = (vr1 + sr0 + sr1) * 1'000'000'000'000ULL
           + div_scale(mul_scale(ut - uopt18, sr2, ONE_6DP), ONE_4DP - uopt, ONE_4DP);
   }

   if (ratiot <= ratioopt18) return base;
   return base + div_scale(mul_scale(sr3, ratiot - ratioopt18, ONE_6DP), ONE_4DP - ratioopt, ONE_4DP);
}

inline u128 overall_borrow_interest_rate(u128 variable_total, u128 stable_total,
                                         u128 variable_rate, u128 stable_avg_rate) {
   u128 total = checked_add(variable_total, stable_total);
   if (total == 0) return 0;
   // 两项乘积在 256 位里相加后再除，只在最后截断一次
   u256 weighted = add_wide(mul_wide(variable_total, variable_rate),
                            mul_wide(stable_total, stable_avg_rate));
   return div_wide(weighted, total);
}

/// rr: retention rate 6dp
inline u128 deposit_interest_rate(u128 ut, u128 overall_rate, u128 rr) {
   return mul_scale(mul_scale(ut, overall_rate, ONE_18DP), ONE_6DP - rr, ONE_6DP);
}

/// 借款指数按秒复利，存款指数线性
inline u128 compound_index(u128 rate, u128 old_index, uint64_t dt, bool compounding) {
   if (dt == 0) return old_index;
   if (compounding) {
      u128 per_second = ONE_18DP + rate / SECONDS_IN_YEAR;
      return mul_scale(old_index, exp_by_squaring(per_second, dt, ONE_18DP), ONE_18DP);
   }
   return mul_scale(old_index, ONE_18DP + mul_scale(rate, dt, SECONDS_IN_YEAR), ONE_18DP);
}

inline u128 increasing_average_stable_rate(u128 amount_added, u128 rate_of_added,
                                           u128 total_before, u128 avg_before) {
   u128 total = total_before + amount_added;
   if (total == 0) return 0;
   u128 weighted = checked_add(mul_scale(total_before, avg_before, ONE_18DP),
                               mul_scale(amount_added, rate_of_added, ONE_18DP));
   return div_scale(weighted, total, ONE_18DP);
}

inline u128 decreasing_average_stable_rate(u128 amount_removed, u128 rate_of_removed,
                                           u128 total_before, u128 avg_before) {
   if (amount_removed >= total_before) return 0;
   u128 weighted = mul_scale(total_before, avg_before, ONE_18DP);
   u128 removed  = mul_scale(amount_removed, rate_of_removed, ONE_18DP);
   if (removed >= weighted) return 0;
   return div_scale(weighted - removed, total_before - amount_removed, ONE_18DP);
}

inline u128 to_receipt_amount(u128 amount, u128 deposit_index, bool round_up = false) {
   return round_up ? div_scale_round_up(amount, deposit_index, ONE_18DP)
                   : div_scale(amount, deposit_index, ONE_18DP);
}

inline u128 to_underlying_amount(u128 famount, u128 deposit_index) {
   return mul_scale(famount, deposit_index, ONE_18DP);
}

/// 借款余额按指数增长回放
inline u128 borrow_balance(u128 balance, u128 new_index, u128 old_index) {
   if (old_index == 0 || new_index == old_index) return balance;
   return mul_scale_round_up(balance, div_scale_round_up(new_index, old_index, ONE_18DP), ONE_18DP);
}

inline u128 loan_stable_rate_after_increase(u128 balance, u128 old_rate, u128 amount, u128 new_rate) {
   u128 total = balance + amount;
   if (total == 0) return 0;
   return checked_add(mul_div(balance, old_rate, total), mul_div(amount, new_rate, total));
}

inline u128 flash_loan_fee_amount(u128 amount, u128 fee) {
   return mul_scale_round_up(amount, fee, ONE_6DP);
}

/// 18dp USD
inline u128 dollar_value(u128 amount, u128 price, uint8_t decimals, bool round_up = false) {
   return mul_div(amount, price, pow10(decimals), round_up);
}

inline u128 asset_amount(u128 value, u128 price, uint8_t decimals) {
   if (price == 0) return 0;
   return mul_div(value, pow10(decimals), price);
}

inline u128 convert_asset_amount(u128 amount, u128 from_price, uint8_t from_decimals,
                                 u128 to_price, uint8_t to_decimals) {
   return asset_amount(dollar_value(amount, from_price, from_decimals), to_price, to_decimals);
}

inline u128 rebalance_up_threshold(u128 rudir, u128 vr0, u128 vr1, u128 vr2) {
   return mul_scale(rudir * 100'000'000'000'000ULL, vr0 + vr1 + vr2, ONE_6DP);
}

inline u128 rebalance_down_threshold(u128 rdd, u128 stable_rate) {
   return mul_scale(ONE_4DP + rdd, stable_rate, ONE_4DP);
}

}} // namespace xlend::math
