#include "clouddrive/timestamp.hpp"

#include <cctype>
#include <ctime>

namespace clouddrive
{

    namespace
    {

        bool read_number(std::string_view text, std::size_t pos, std::size_t width, int &out)
        {
            if (pos + width > text.size())
            {
                return false;
            }
            int value = 0;
            for (std::size_t i = pos; i < pos + width; ++i)
            {
                const auto ch = static_cast<unsigned char>(text[i]);
                if (!std::isdigit(ch))
                {
                    return false;
                }
                value = value * 10 + (ch - '0');
            }
            out = value;
            return true;
        }

        bool expect(std::string_view text, std::size_t pos, char ch)
        {
            return pos < text.size() && text[pos] == ch;
        }

    } // namespace

    std::optional<TimePoint> parse_timestamp(std::string_view text)
    {
        std::tm tm{};
        int year = 0;
        int month = 0;
        if (!read_number(text, 0, 4, year) || !expect(text, 4, '-') || !read_number(text, 5, 2, month) ||
            !expect(text, 7, '-') || !read_number(text, 8, 2, tm.tm_mday) ||
            !(expect(text, 10, 'T') || expect(text, 10, 't') || expect(text, 10, ' ')) ||
            !read_number(text, 11, 2, tm.tm_hour) || !expect(text, 13, ':') || !read_number(text, 14, 2, tm.tm_min) ||
            !expect(text, 16, ':') || !read_number(text, 17, 2, tm.tm_sec))
        {
            return std::nullopt;
        }
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;

        std::size_t pos = 19;
        std::chrono::microseconds fraction{0};
        if (expect(text, pos, '.'))
        {
            ++pos;
            long long micros = 0;
            int digits = 0;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
            {
                if (digits < 6)
                {
                    micros = micros * 10 + (text[pos] - '0');
                    ++digits;
                }
                ++pos;
            }
            for (; digits < 6; ++digits)
            {
                micros *= 10;
            }
            fraction = std::chrono::microseconds{micros};
        }

        std::chrono::seconds offset{0};
        if (expect(text, pos, 'Z') || expect(text, pos, 'z'))
        {
            ++pos;
        }
        else if (expect(text, pos, '+') || expect(text, pos, '-'))
        {
            const int sign = text[pos] == '-' ? -1 : 1;
            int hours = 0;
            int minutes = 0;
            if (!read_number(text, pos + 1, 2, hours) || !expect(text, pos + 3, ':') ||
                !read_number(text, pos + 4, 2, minutes))
            {
                return std::nullopt;
            }
            offset = std::chrono::seconds{sign * (hours * 3600 + minutes * 60)};
            pos += 6;
        }
        if (pos != text.size())
        {
            return std::nullopt;
        }

        const auto seconds = timegm(&tm);
        if (seconds == static_cast<std::time_t>(-1))
        {
            return std::nullopt;
        }
        auto point = std::chrono::system_clock::from_time_t(seconds) - offset;
        return point + std::chrono::duration_cast<std::chrono::system_clock::duration>(fraction);
    }

    std::string format_timestamp(TimePoint time)
    {
        const auto seconds = std::chrono::system_clock::to_time_t(
            std::chrono::time_point_cast<std::chrono::seconds>(time));
        std::tm tm{};
        gmtime_r(&seconds, &tm);
        char buffer[32];
        const auto written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
        return std::string(buffer, written);
    }

} // namespace clouddrive
