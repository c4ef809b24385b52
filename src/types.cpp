#include <jsonverse-cpp/types.hpp>
#include <jsonverse-cpp/error.hpp>

#include <array>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <random>
#include <string>

namespace jsonverse_cpp {

auto now() -> Timestamp {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return Timestamp{std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count()};
}

auto to_rfc3339(Timestamp ts) -> std::string {
    using namespace std::chrono;
    const auto tp = sys_time<milliseconds>{milliseconds{ts.millis_since_epoch}};
    const auto day = floor<days>(tp);
    const auto date = year_month_day{day};
    const auto time = hh_mm_ss<milliseconds>{tp - day};

    auto buffer = std::array<char, 40>{};
    const auto n = std::snprintf(buffer.data(), buffer.size(),
        "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
        static_cast<int>(date.year()),
        static_cast<unsigned>(date.month()),
        static_cast<unsigned>(date.day()),
        static_cast<int>(time.hours().count()),
        static_cast<int>(time.minutes().count()),
        static_cast<int>(time.seconds().count()),
        static_cast<int>(time.subseconds().count()));
    return std::string(buffer.data(), static_cast<std::size_t>(n));
}

namespace {

class TimestampParser {
public:
    explicit TimestampParser(std::string_view text) : text_{text} {}

    auto number(std::size_t digits) -> int {
        if (pos_ + digits > text_.size()) fail();
        auto value = 0;
        const auto* first = text_.data() + pos_;
        auto [ptr, ec] = std::from_chars(first, first + digits, value);
        if (ec != std::errc{} || ptr != first + digits) fail();
        pos_ += digits;
        return value;
    }

    void expect(char c) {
        if (!accept(c)) fail();
    }

    auto accept(char c) -> bool {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    // Fraction of a second, truncated to milliseconds.
    auto fraction_millis() -> int {
        auto millis = 0;
        auto digits = 0;
        while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
            if (digits < 3) millis = millis * 10 + (text_[pos_] - '0');
            ++digits;
            ++pos_;
        }
        if (digits == 0) fail();
        for (; digits < 3; ++digits) millis *= 10;
        return millis;
    }

    auto done() const -> bool { return pos_ == text_.size(); }

    [[noreturn]] void fail() const {
        throw Exception{ErrorKind::invalid_content,
                        "malformed RFC 3339 timestamp \"" + std::string{text_} + "\""};
    }

private:
    std::string_view text_;
    std::size_t pos_{0};
};

}  // anonymous namespace

auto parse_rfc3339(std::string_view text) -> Timestamp {
    using namespace std::chrono;
    auto p = TimestampParser{text};

    const auto y = p.number(4);
    p.expect('-');
    const auto mo = p.number(2);
    p.expect('-');
    const auto d = p.number(2);
    if (!p.accept('T') && !p.accept('t') && !p.accept(' ')) p.fail();
    const auto h = p.number(2);
    p.expect(':');
    const auto mi = p.number(2);
    p.expect(':');
    const auto s = p.number(2);
    const auto ms = p.accept('.') ? p.fraction_millis() : 0;

    auto offset = minutes{0};
    if (!p.accept('Z') && !p.accept('z')) {
        auto sign = 0;
        if (p.accept('+')) {
            sign = 1;
        } else if (p.accept('-')) {
            sign = -1;
        } else {
            p.fail();
        }
        const auto oh = p.number(2);
        p.expect(':');
        const auto om = p.number(2);
        if (oh > 23 || om > 59) p.fail();
        offset = minutes{sign * (oh * 60 + om)};
    }
    if (!p.done()) p.fail();

    const auto date = year{y} / month{static_cast<unsigned>(mo)} / day{static_cast<unsigned>(d)};
    if (!date.ok() || h > 23 || mi > 59 || s > 60) p.fail();

    const auto tp = sys_days{date} + hours{h} + minutes{mi} + seconds{s} + milliseconds{ms} - offset;
    return Timestamp{duration_cast<milliseconds>(tp.time_since_epoch()).count()};
}

auto to_pointer(const Path& path) -> std::string {
    auto pointer = std::string{};
    for (const auto& element : path) {
        pointer.push_back('/');
        std::visit(overload{
            [&](const std::string& key) {
                for (auto c : key) {
                    if (c == '~') {
                        pointer += "~0";
                    } else if (c == '/') {
                        pointer += "~1";
                    } else {
                        pointer.push_back(c);
                    }
                }
            },
            [&](std::size_t index) { pointer += std::to_string(index); },
        }, element);
    }
    return pointer;
}

auto random_id() -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    thread_local auto engine = std::mt19937_64{std::random_device{}()};
    auto id = std::string{};
    id.reserve(32);
    for (auto half = 0; half < 2; ++half) {
        auto bits = engine();
        for (auto i = 0; i < 16; ++i) {
            id.push_back(hex_chars[bits & 0x0F]);
            bits >>= 4;
        }
    }
    return id;
}

}  // namespace jsonverse_cpp
