#include "config.hh"

#include <large-collections/contract.hh>

void lc::growth_policy::validate() const
{
    LC_CHECK_CONFIG(grow_factor > 1.0, "grow factor must be greater than 1");
    LC_CHECK_CONFIG(grow_factor <= max_grow_factor, "grow factor must not exceed max_grow_factor (3.0)");
    LC_CHECK_CONFIG(fixed_grow_amount >= 1, "fixed grow amount must be at least 1");
    LC_CHECK_CONFIG(fixed_grow_limit >= 1, "fixed grow limit must be at least 1");
}

lc::isize lc::growth_policy::grown_capacity(isize capacity, isize limit) const
{
    LC_ASSERT(0 <= capacity && capacity <= limit, "capacity outside of [0, limit]");

    if (capacity >= fixed_grow_limit)
    {
        if (fixed_grow_amount >= limit - capacity)
            return limit;
        return capacity + fixed_grow_amount;
    }

    // compare in floating point first, the product may exceed the isize range
    f64 const grown = f64(capacity) * grow_factor;
    if (grown >= f64(limit - 1))
        return limit;

    auto const result = isize(grown) + 1;
    return result < limit ? result : limit;
}

void lc::load_factor_policy::validate() const
{
    LC_CHECK_CONFIG(min_load_factor > 0.0, "min load factor must be positive");
    LC_CHECK_CONFIG(max_load_factor > 0.0, "max load factor must be positive");
    LC_CHECK_CONFIG(min_load_factor < max_load_factor, "min load factor must be less than max load factor");
    LC_CHECK_CONFIG(min_load_factor_tolerance >= 0.0, "min load factor tolerance must be non-negative");
}
