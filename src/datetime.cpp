#include "stanza/datetime.hpp"

#include <cstdio>
#include <cstdlib>


namespace Stanza {

    namespace detail {
        using namespace std::chrono;

        std::string format_date_time(sys_time<microseconds> t, bool with_fraction) {
            auto day = floor<days>(t);
            year_month_day ymd{ day };
            hh_mm_ss<microseconds> tod{ t - day };

            char buf[48];
            int n = std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d",
                                  static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                                  static_cast<unsigned>(ymd.day()), static_cast<int>(tod.hours().count()),
                                  static_cast<int>(tod.minutes().count()), static_cast<int>(tod.seconds().count()));
            std::string out(buf, static_cast<std::size_t>(n));
            if (with_fraction) {
                n = std::snprintf(buf, sizeof(buf), ".%06lld", static_cast<long long>(tod.subseconds().count()));
                out.append(buf, static_cast<std::size_t>(n));
            }
            return out;
        }

        std::string format_offset(minutes offset) {
            long long total = offset.count();
            char sign = total < 0 ? '-' : '+';
            if (total < 0) total = -total;
            char buf[16];
            int n = std::snprintf(buf, sizeof(buf), "%c%02lld:%02lld", sign, total / 60, total % 60);
            return std::string(buf, static_cast<std::size_t>(n));
        }

        bool read_digits(std::string_view text, std::size_t& pos, std::size_t count, int& out) {
            if (pos + count > text.size()) return false;
            int v = 0;
            for (std::size_t i = 0; i < count; i++) {
                char c = text[pos + i];
                if (c < '0' || c > '9') return false;
                v = v * 10 + (c - '0');
            }
            pos += count;
            out = v;
            return true;
        }

        bool expect(std::string_view text, std::size_t& pos, char c) {
            if (pos >= text.size() || text[pos] != c) return false;
            pos++;
            return true;
        }
    } // namespace detail

    std::string format_iso8601(Date d) {
        return detail::format_date_time(std::chrono::time_point_cast<std::chrono::microseconds>(d), false) + "Z";
    }

    std::string format_iso8601(Timestamp ts) {
        return detail::format_date_time(ts, true) + "Z";
    }

    std::string format_iso8601(const TimestampTz& ts) {
        return detail::format_date_time(ts.utc + ts.offset, true) + detail::format_offset(ts.offset);
    }

    std::optional<std::chrono::minutes> parse_utc_offset(std::string_view text) {
        if (text == "Z" || text == "UTC") return std::chrono::minutes{ 0 };
        if (text.size() != 6 || (text[0] != '+' && text[0] != '-')) return std::nullopt;
        std::size_t pos = 1;
        int hh = 0, mm = 0;
        if (!detail::read_digits(text, pos, 2, hh) || !detail::expect(text, pos, ':') ||
            !detail::read_digits(text, pos, 2, mm))
            return std::nullopt;
        if (hh > 23 || mm > 59) return std::nullopt;
        std::chrono::minutes off{ hh * 60 + mm };
        return text[0] == '-' ? -off : off;
    }

    std::optional<TimestampTz> parse_iso8601(std::string_view text) {
        using namespace std::chrono;
        std::size_t pos = 0;
        int y = 0, mo = 0, d = 0, hh = 0, mi = 0, ss = 0;
        if (!detail::read_digits(text, pos, 4, y) || !detail::expect(text, pos, '-') ||
            !detail::read_digits(text, pos, 2, mo) || !detail::expect(text, pos, '-') ||
            !detail::read_digits(text, pos, 2, d) || !detail::expect(text, pos, 'T') ||
            !detail::read_digits(text, pos, 2, hh) || !detail::expect(text, pos, ':') ||
            !detail::read_digits(text, pos, 2, mi) || !detail::expect(text, pos, ':') ||
            !detail::read_digits(text, pos, 2, ss))
            return std::nullopt;

        year_month_day ymd{ year{ y }, month{ static_cast<unsigned>(mo) }, day{ static_cast<unsigned>(d) } };
        if (!ymd.ok() || hh > 23 || mi > 59 || ss > 59) return std::nullopt;

        microseconds fraction{ 0 };
        if (pos < text.size() && text[pos] == '.') {
            pos++;
            long long digits = 0, scale = 100000;
            std::size_t start = pos;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                if (scale > 0) {
                    digits += (text[pos] - '0') * scale;
                    scale /= 10;
                }
                pos++;
            }
            if (pos == start || pos - start > 9) return std::nullopt;
            fraction = microseconds{ digits };
        }

        minutes offset{ 0 };
        if (pos < text.size()) {
            auto off = parse_utc_offset(text.substr(pos));
            if (!off) return std::nullopt;
            offset = *off;
        }

        sys_time<microseconds> local = sys_days{ ymd } + hours{ hh } + minutes{ mi } + seconds{ ss } + fraction;
        return TimestampTz{ local - offset, offset };
    }

} // namespace Stanza
