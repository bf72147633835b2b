#include "contract_meta.hpp"

#include <cmath>

std::string make_instrument_id(const std::string& underlying,
                               const std::string& expiry_yyyymmdd,
                               double strike,
                               OptionType type)
{
    const auto whole = static_cast<long long>(std::trunc(strike));
    return underlying + "_" + expiry_yyyymmdd + "_" + std::to_string(whole) + to_exchange_code(type);
}
