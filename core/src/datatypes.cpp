#include "datatypes.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace core {

    std::string toString(Resolution resolution) {
        switch (resolution) {
            case Resolution::Intraday: return "intraday";
            case Resolution::EndOfDay: return "eod";
        }
        return "unknown";
    }

    std::string toString(DisplayWindow window) {
        switch (window) {
            case DisplayWindow::OneDay:     return "1D";
            case DisplayWindow::FiveDay:    return "5D";
            case DisplayWindow::OneMonth:   return "1M";
            case DisplayWindow::SixMonth:   return "6M";
            case DisplayWindow::OneYear:    return "1Y";
            case DisplayWindow::YearToDate: return "YTD";
            case DisplayWindow::FiveYear:   return "5Y";
        }
        return "unknown";
    }

    DisplayWindow windowFromString(const std::string& label) {
        std::string upper = label;
        std::transform(upper.begin(), upper.end(), upper.begin(),
            [](unsigned char c){ return static_cast<char>(std::toupper(c)); });

        if (upper == "1D")  return DisplayWindow::OneDay;
        if (upper == "5D")  return DisplayWindow::FiveDay;
        if (upper == "1M")  return DisplayWindow::OneMonth;
        if (upper == "6M")  return DisplayWindow::SixMonth;
        if (upper == "1Y")  return DisplayWindow::OneYear;
        if (upper == "YTD") return DisplayWindow::YearToDate;
        if (upper == "5Y")  return DisplayWindow::FiveYear;
        throw std::invalid_argument("Unknown display window: '" + label + "'");
    }

} // namespace core
