#include "diffdb/core/timestamp.hpp"
#include <charconv>
#include <cstdio>

namespace diffdb {

namespace {

constexpr std::size_t TIMESTAMP_LENGTH = 19;  // "YYYY-MM-DD HH:MM:SS"

bool read_field(std::string_view text, std::size_t pos, std::size_t width, int& out) {
    auto field = text.substr(pos, width);
    for (char c : field) {
        if (c < '0' || c > '9') return false;
    }
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), out);
    return ec == std::errc{} && ptr == field.data() + field.size();
}

} // anonymous namespace

std::string format_timestamp(Timestamp ts) {
    using namespace std::chrono;

    auto day_point = floor<days>(ts);
    year_month_day ymd{day_point};
    hh_mm_ss hms{ts - day_point};

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u %02d:%02d:%02d",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(hms.hours().count()),
                  static_cast<int>(hms.minutes().count()),
                  static_cast<int>(hms.seconds().count()));
    return buffer;
}

Result<Timestamp> parse_timestamp(std::string_view text) {
    using namespace std::chrono;

    auto fail = [&]() {
        return std::unexpected(parse_error(
            std::format("timestamp '{}' does not match YYYY-MM-DD HH:MM:SS", text)));
    };

    if (text.size() != TIMESTAMP_LENGTH ||
        text[4] != '-' || text[7] != '-' || text[10] != ' ' ||
        text[13] != ':' || text[16] != ':') {
        return fail();
    }

    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!read_field(text, 0, 4, y) || !read_field(text, 5, 2, mo) ||
        !read_field(text, 8, 2, d) || !read_field(text, 11, 2, h) ||
        !read_field(text, 14, 2, mi) || !read_field(text, 17, 2, s)) {
        return fail();
    }

    year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 59) {
        return fail();
    }

    return Timestamp{sys_days{ymd}} + hours{h} + minutes{mi} + seconds{s};
}

Timestamp now_timestamp() {
    return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
}

} // namespace diffdb
