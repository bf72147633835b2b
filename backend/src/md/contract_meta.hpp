#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "tick.hpp"

enum class OptionType : std::uint8_t
{
    Call = 0, // CE
    Put = 1   // PE
};

inline const char* to_exchange_code(OptionType t) { return t == OptionType::Call ? "CE" : "PE"; }
inline const char* to_short_code(OptionType t) { return t == OptionType::Call ? "C" : "P"; }

// Static description of one option contract.
struct ContractMeta
{
    InstrumentToken token{0};
    std::string tradingsymbol; // broker symbol, e.g. "NIFTY24MAY24000CE"
    std::string underlying;    // "NIFTY"
    std::string expiry_date;   // "YYYY-MM-DD"
    double strike{0};
    OptionType option_type{OptionType::Call};
    std::string instrument_id; // "NIFTY_20240530_24000CE"
    std::int64_t lot_size{1};
};

// token -> contract. Rebuilt wholesale and published as an immutable snapshot.
using Universe = std::map<InstrumentToken, ContractMeta>;
using UniversePtr = std::shared_ptr<const Universe>;

// Deterministic id: {UNDERLYING}_{YYYYMMDD}_{int(strike)}{CE|PE}
std::string make_instrument_id(const std::string& underlying,
                               const std::string& expiry_yyyymmdd,
                               double strike,
                               OptionType type);
