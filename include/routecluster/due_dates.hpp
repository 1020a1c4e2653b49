#ifndef ROUTECLUSTER_DUE_DATES_HPP
#define ROUTECLUSTER_DUE_DATES_HPP

#include "routecluster/types.hpp"

#include <optional>

namespace routecluster {

// y/m/d helper for callers and tests. Out-of-range days roll into the next
// month (2026/2/31 -> 2026/3/3).
Date make_date(int year, unsigned month, unsigned day);

Date add_months(Date d, int months);
Date add_days(Date d, int days);

// Today's date in UTC.
Date today_utc();

// Earliest date over the service records (next_due, else last_visit +
// interval_months); falls back to next_due_date when no service yields one.
std::optional<Date> resolve_next_due(const CustomerLocation& customer);

bool is_overdue(const CustomerLocation& customer, Date today);

}  // namespace routecluster

#endif  // ROUTECLUSTER_DUE_DATES_HPP
