#include "market_hours.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/local_time/local_time.hpp>

namespace chart {

bool MarketHours::isRegularSession(core::Timestamp now) {
    namespace pt = boost::posix_time;
    namespace lt = boost::local_time;

    // Eastern time with the post-2007 DST rules
    static const lt::time_zone_ptr eastern(new lt::posix_time_zone("EST-05EDT+01,M3.2.0/02:00,M11.1.0/02:00"));

    const pt::ptime utc = pt::from_time_t(std::chrono::system_clock::to_time_t(now));
    const lt::local_date_time new_york(utc, eastern);
    const pt::ptime wall_clock = new_york.local_time();

    const auto weekday = wall_clock.date().day_of_week();
    if (weekday == boost::date_time::Saturday || weekday == boost::date_time::Sunday) {
        return false;
    }

    const pt::time_duration time_of_day = wall_clock.time_of_day();
    return time_of_day >= pt::hours(9) + pt::minutes(30) && time_of_day <= pt::hours(16);
}

} // namespace chart
