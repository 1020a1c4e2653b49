#include "routecluster/due_dates.hpp"

namespace routecluster {

using std::chrono::days;
using std::chrono::floor;
using std::chrono::months;
using std::chrono::year_month_day;

// sys_days{ymd} with ok() year/month and an overflowing day counts forward
// from the first of the month, which is the rollover we want.
Date make_date(int year, unsigned month, unsigned day) {
    year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                       std::chrono::day{day}};
    return Date{ymd};
}

Date add_months(Date d, int n) {
    year_month_day ymd{d};
    ymd += months{n};
    return Date{ymd};
}

Date add_days(Date d, int n) { return d + days{n}; }

Date today_utc() {
    return floor<days>(std::chrono::system_clock::now());
}

std::optional<Date> resolve_next_due(const CustomerLocation& customer) {
    std::optional<Date> earliest;
    for (const auto& svc : customer.services) {
        std::optional<Date> next;
        if (svc.next_due)
            next = svc.next_due;
        else if (svc.last_visit)
            next = add_months(*svc.last_visit, svc.interval_months);
        if (next && (!earliest || *next < *earliest))
            earliest = next;
    }
    if (earliest) return earliest;
    return customer.next_due_date;
}

bool is_overdue(const CustomerLocation& customer, Date today) {
    auto due = resolve_next_due(customer);
    return due && *due < today;
}

}  // namespace routecluster
