#pragma once

#include <cstdint>

namespace perspective {

// Sentinels standing in for null in every non-weight numeric column
static constexpr int64_t INT_NULL = -2147483648LL;
static constexpr double FLOAT_NULL = -2147483648.49438;

static constexpr const char *DEFAULT_SUB_PORTFOLIO = "default";
static constexpr const char *DEFAULT_EFFECTIVE_DATE = "2024-01-01";
static constexpr const char *POSITION_RECORD_TYPE = "position";
static constexpr const char *ESSENTIAL_LOOKTHROUGHS = "essential_lookthroughs";

// Reference pseudo-tables
static constexpr const char *POSITION_DATA_TABLE = "position_data";
static constexpr const char *PARENT_INSTRUMENT_TABLE = "PARENT_INSTRUMENT";
static constexpr const char *INSTRUMENT_TABLE = "INSTRUMENT";
static constexpr const char *INSTRUMENT_CATEGORIZATION_TABLE = "INSTRUMENT_CATEGORIZATION";

// Modifier names with engine-level meaning
static constexpr const char *SCALE_HOLDINGS_MODIFIER = "scale_holdings_to_100_percent";
static constexpr const char *SCALE_LOOKTHROUGHS_MODIFIER = "scale_lookthroughs_to_100_percent";

} // namespace perspective
