#include "catch2/catch_approx.hpp"

#include <catch2/catch_test_macros.hpp>
#include <udecode/udecode.hpp>

#include <chrono>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

using namespace udecode;

namespace {

    constexpr double kEpoch = 1700000000.0; // 2023-11-14T22:13:20Z

    struct Event {
        std::string name;
        Date at;

        static Event decode(Decoder& d) {
            auto c = d.container();
            Event e;
            e.name = c.decode<std::string>("name");
            e.at = c.decode<Date>("at");
            return e;
        }
    };

    struct Person {
        std::string name;
        std::optional<Url> home_page;

        static Person decode(Decoder& d) {
            auto c = d.container();
            Person p;
            p.name = c.decode<std::string>("name");
            p.home_page = c.decode_if_present<Url>("homePage");
            return p;
        }
    };

    struct Fruit {
        std::string name;
        Decimal price;

        static Fruit decode(Decoder& d) {
            auto c = d.container();
            Fruit f;
            f.name = c.decode<std::string>("name");
            f.price = c.decode<Decimal>("price");
            return f;
        }
    };

    Decoder decoder_with(DateDecodingStrategy strategy) {
        Decoder d;
        d.set_date_decoding_strategy(std::move(strategy));
        return d;
    }

} // namespace

TEST_CASE("date: deferred decoding reads seconds", "[udecode][date]") {
    const Value root = Value::object({{"name", "launch"}, {"at", kEpoch}});

    Decoder decoder;
    CHECK(decoder.date_decoding_strategy().kind() == DateDecodingStrategy::Kind::DeferredToDate);

    const auto e = decoder.decode<Event>(root);
    CHECK(e.name == "launch");
    CHECK(seconds_since_1970(e.at) == Catch::Approx(kEpoch));
}

TEST_CASE("date: now survives a seconds round trip", "[udecode][date]") {
    const auto now = std::chrono::system_clock::now();
    const Value root = seconds_since_1970(now);

    auto decoder = decoder_with(DateDecodingStrategy::seconds_since_1970());
    const auto d = decoder.decode<Date>(root);

    CHECK(std::chrono::abs(d - now) < std::chrono::milliseconds {1});
}

TEST_CASE("date: seconds and milliseconds", "[udecode][date]") {
    SECTION("seconds from integer") {
        const Value root = 1700000000;
        auto decoder = decoder_with(DateDecodingStrategy::seconds_since_1970());
        CHECK(decoder.decode<Date>(root) == date_from_seconds(kEpoch));
    }

    SECTION("milliseconds") {
        const Value root = 1700000000123LL;
        auto decoder = decoder_with(DateDecodingStrategy::milliseconds_since_1970());
        CHECK(seconds_since_1970(decoder.decode<Date>(root)) == Catch::Approx(kEpoch + 0.123));
    }

    SECTION("string is a type mismatch") {
        const Value root = "yesterday";
        auto decoder = decoder_with(DateDecodingStrategy::seconds_since_1970());
        CHECK(decoder.try_decode<Date>(root).error().code == ErrorCode::TypeMismatch);
    }

    SECTION("out of range is data corrupted") {
        const Value root = std::numeric_limits<double>::infinity();
        auto decoder = decoder_with(DateDecodingStrategy::seconds_since_1970());
        CHECK(decoder.try_decode<Date>(root).error().code == ErrorCode::DataCorrupted);
    }

    SECTION("null is value not found") {
        const Value root = Value::object({{"name", "n"}, {"at", nullptr}});
        auto decoder = decoder_with(DateDecodingStrategy::seconds_since_1970());
        const auto r = decoder.try_decode<Event>(root);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::ValueNotFound);
        CHECK(format_path(r.error().path) == "at");
    }
}

TEST_CASE("date: native date passes through every strategy", "[udecode][date][opaque]") {
    const Date when = date_from_seconds(kEpoch);
    const Value root = Value::opaque(when);

    auto decoder = decoder_with(DateDecodingStrategy::iso8601());
    CHECK(decoder.decode<Date>(root) == when);
}

TEST_CASE("date: iso8601", "[udecode][date][iso8601]") {
    auto decoder = decoder_with(DateDecodingStrategy::iso8601());

    const Value utc = "2023-11-14T22:13:20Z";
    const Value offset = "2023-11-14T23:13:20+01:00";
    const Value fraction = "2023-11-14T22:13:20.5Z";
    const Value bad_month = "2023-13-14T22:13:20Z";
    const Value no_zone = "2023-11-14T22:13:20";

    CHECK(decoder.decode<Date>(utc) == date_from_seconds(kEpoch));
    CHECK(decoder.decode<Date>(offset) == date_from_seconds(kEpoch));
    CHECK(seconds_since_1970(decoder.decode<Date>(fraction)) == Catch::Approx(kEpoch + 0.5));

    const auto r = decoder.try_decode<Date>(bad_month);
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().code == ErrorCode::DataCorrupted);
    CHECK(r.error().description == "Expected date string to be ISO8601-formatted.");

    CHECK(decoder.try_decode<Date>(no_zone).error().code == ErrorCode::DataCorrupted);
}

TEST_CASE("date: parse_iso8601", "[udecode][date][iso8601]") {
    CHECK(parse_iso8601("1970-01-01T00:00:00Z") == date_from_seconds(0.0));
    CHECK(parse_iso8601("2000-02-29T00:00:00Z").has_value());
    CHECK_FALSE(parse_iso8601("1900-02-29T00:00:00Z").has_value());
    CHECK_FALSE(parse_iso8601("2023-11-14 22:13:20Z").has_value());
    CHECK_FALSE(parse_iso8601("2023-11-14T22:13:20Zjunk").has_value());
    CHECK(parse_iso8601("1969-12-31T23:59:59-00:00") == date_from_seconds(-1.0));
    CHECK(parse_iso8601("2023-11-14T22:13:20+09:00") == date_from_seconds(kEpoch - 9 * 3600));
    CHECK_FALSE(parse_iso8601("2023-11-14T22:13:20+0900").has_value());
}

TEST_CASE("date: formatted", "[udecode][date][formatter]") {
    SECTION("utc") {
        auto decoder = decoder_with(DateDecodingStrategy::formatted(DateFormatter {"%Y-%m-%d %H:%M:%S"}));
        const Value root = "2023-11-14 22:13:20";
        CHECK(decoder.decode<Date>(root) == date_from_seconds(kEpoch));
    }

    SECTION("formatter offset") {
        auto decoder = decoder_with(DateDecodingStrategy::formatted(DateFormatter {"%d/%m/%Y %H:%M", 3600}));
        const Value root = "14/11/2023 23:13";
        CHECK(seconds_since_1970(decoder.decode<Date>(root)) == Catch::Approx(kEpoch - 20));
    }

    SECTION("mismatch") {
        auto decoder = decoder_with(DateDecodingStrategy::formatted(DateFormatter {"%Y-%m-%d"}));
        const Value root = "14.11.2023";
        const auto r = decoder.try_decode<Date>(root);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::DataCorrupted);
        CHECK(r.error().description == "Date string does not match format expected by formatter.");
    }

    SECTION("date only defaults to midnight") {
        const DateFormatter f {"%Y%m%d"};
        CHECK(f.date_from("20231114") == date_from_seconds(kEpoch - 22 * 3600 - 13 * 60 - 20));
        CHECK_FALSE(f.date_from("2023111").has_value());
        CHECK_FALSE(DateFormatter {"%Q"}.date_from("x").has_value());
    }

    SECTION("zone offset with or without colon") {
        const DateFormatter f {"%Y-%m-%dT%H:%M:%S%z"};
        CHECK(f.date_from("2023-11-14T22:13:20+0900") == date_from_seconds(kEpoch - 9 * 3600));
        CHECK(f.date_from("2023-11-14T22:13:20+09:00") == date_from_seconds(kEpoch - 9 * 3600));
    }
}

TEST_CASE("date: custom", "[udecode][date][custom]") {
    // "@<seconds>"
    auto decoder = decoder_with(DateDecodingStrategy::custom([](Decoder& d) {
        const auto text = d.single_value_container().decode<std::string>();
        if (text.size() < 2 || text.front() != '@')
            throw DecodingError {DecodeError {ErrorCode::DataCorrupted, d.coding_path(), {}, {}, {}, "expected @seconds"}};
        return date_from_seconds(std::stod(text.substr(1)));
    }));

    const Value root = Value::object({{"name", "x"}, {"at", "@1700000000"}});
    CHECK(decoder.decode<Event>(root).at == date_from_seconds(kEpoch));

    const Value bad = Value::object({{"name", "x"}, {"at", "1700000000"}});
    const auto r = decoder.try_decode<Event>(bad);
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().description == "expected @seconds");
    CHECK(format_path(r.error().path) == "at");

    CHECK(decoder.storage().empty());
    CHECK_THROWS_AS(DateDecodingStrategy::custom({}), std::invalid_argument);
}

TEST_CASE("url: decoding", "[udecode][url]") {
    Decoder decoder;

    SECTION("present") {
        const Value root = Value::object({{"name", "Li"}, {"homePage", "https://www.baidu.com"}});
        const auto p = decoder.decode<Person>(root);
        REQUIRE(p.home_page.has_value());
        CHECK(p.home_page->string() == "https://www.baidu.com");
        CHECK(p.home_page->host() == "www.baidu.com");
    }

    SECTION("absent") {
        const Value root = Value::object({{"name", "Li"}});
        CHECK_FALSE(decoder.decode<Person>(root).home_page.has_value());
    }

    SECTION("null") {
        const Value root = Value::object({{"name", "Li"}, {"homePage", nullptr}});
        CHECK_FALSE(decoder.decode<Person>(root).home_page.has_value());
    }

    SECTION("empty string") {
        const Value root = Value::object({{"name", "Li"}, {"homePage", ""}});
        const auto r = decoder.try_decode<Person>(root);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::ValueNotFound);
        CHECK(format_path(r.error().path) == "homePage");
    }

    SECTION("malformed") {
        const Value root = Value::object({{"name", "Li"}, {"homePage", "not a url"}});
        const auto r = decoder.try_decode<Person>(root);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::DataCorrupted);
        CHECK(r.error().description == "Invalid URL string.");
    }

    SECTION("native url") {
        const auto url = Url::parse("ftp://files.example.org/pub");
        REQUIRE(url.has_value());
        const Value root = Value::opaque(*url);
        CHECK(decoder.decode<Url>(root) == *url);
    }
}

TEST_CASE("url: components", "[udecode][url]") {
    const auto u = Url::parse("https://user:pw@example.com:8080/a/b%20c?x=1&y=2#frag");
    REQUIRE(u.has_value());
    CHECK(u->scheme() == "https");
    CHECK(u->user_info() == "user:pw");
    CHECK(u->host() == "example.com");
    CHECK(u->port() == std::optional<std::uint16_t> {8080});
    CHECK(u->path() == "/a/b%20c");
    CHECK(u->query() == "x=1&y=2");
    CHECK(u->fragment() == "frag");
    CHECK(u->is_absolute());
    CHECK(u->has_authority());

    const auto v6 = Url::parse("http://[::1]:80/");
    REQUIRE(v6.has_value());
    CHECK(v6->host() == "[::1]");
    CHECK(v6->port() == std::optional<std::uint16_t> {80});

    const auto rel = Url::parse("docs/index.html");
    REQUIRE(rel.has_value());
    CHECK_FALSE(rel->is_absolute());
    CHECK(rel->path() == "docs/index.html");

    const auto mail = Url::parse("mailto:someone@example.com");
    REQUIRE(mail.has_value());
    CHECK(mail->scheme() == "mailto");
    CHECK_FALSE(mail->has_authority());

    CHECK_FALSE(Url::parse("").has_value());
    CHECK_FALSE(Url::parse("http://exa mple.com").has_value());
    CHECK_FALSE(Url::parse("://missing-scheme").has_value());
    CHECK_FALSE(Url::parse("1http://bad-scheme").has_value());
    CHECK_FALSE(Url::parse("http://host:99999/").has_value());
    CHECK_FALSE(Url::parse("http://host/%zz").has_value());
    CHECK_FALSE(Url::parse("http://[::1/").has_value());
}

TEST_CASE("decimal: decoding", "[udecode][decimal]") {
    Decoder decoder;

    const Value root = Value::object({{"name", "Apple"}, {"price", 15.88}});
    const auto f = decoder.decode<Fruit>(root);

    CHECK(f.name == "Apple");
    CHECK(f.price == Decimal::from_double(15.88));
    CHECK(f.price.to_string() == "15.880000000000001");
    CHECK(f.price.to_double() == Catch::Approx(15.88));

    const Value integer = 42;
    CHECK(decoder.decode<Decimal>(integer).to_string() == "42");

    const Value text = "15.88";
    CHECK(decoder.try_decode<Decimal>(text).error().code == ErrorCode::TypeMismatch);

    const auto exact = Decimal::parse("15.88");
    REQUIRE(exact.has_value());
    const Value native = Value::opaque(*exact);
    CHECK(decoder.decode<Decimal>(native) == *exact);
}

TEST_CASE("decimal: parse and format", "[udecode][decimal]") {
    CHECK(Decimal::parse("15.88")->to_string() == "15.88");
    CHECK(Decimal::parse("-0.050")->to_string() == "-0.05");
    CHECK(Decimal::parse("1e3")->to_string() == "1000");
    CHECK(Decimal::parse("1.5E-2")->to_string() == "0.015");
    CHECK(Decimal::parse("000")->is_zero());
    CHECK(Decimal::parse("2.50") == Decimal::parse("2.5"));
    CHECK(Decimal::parse("-7")->is_negative());
    CHECK(Decimal::parse("123.45")->significand() == 12345);
    CHECK(Decimal::parse("123.45")->exponent() == -2);

    CHECK_FALSE(Decimal::parse("").has_value());
    CHECK_FALSE(Decimal::parse("abc").has_value());
    CHECK_FALSE(Decimal::parse("1.2.3").has_value());
    CHECK_FALSE(Decimal::parse("1e").has_value());
    CHECK_FALSE(Decimal::parse("99999999999999999999999").has_value());
    CHECK_FALSE(Decimal::parse("1.0e-9223372036854775808").has_value());
    CHECK_FALSE(Decimal::parse("1e9223372036854775807").has_value());

    CHECK(Decimal::parse("1.00000000000000000000") == Decimal::parse("1"));
    CHECK(Decimal::parse("184467440737095516150")->to_string() == "184467440737095516150");
    CHECK(Decimal::parse("100000000000000000000000")->exponent() == 23);
    CHECK(Decimal::parse("0.000000000000000000000000005")->to_string() == "0.000000000000000000000000005");

    CHECK(Decimal::from_double(0.0).is_zero());
    CHECK(Decimal::from_double(-2.5).to_string() == "-2.5");
    CHECK(Decimal::from_double(std::numeric_limits<double>::quiet_NaN()).is_nan());
    CHECK(Decimal::nan().to_string() == "NaN");
}

namespace {

    struct Member {
        std::string name;
        int age {};
        Date birthday;
        std::optional<Url> home_page;

        static Member decode(Decoder& d) {
            auto c = d.container();
            Member m;
            m.name = c.decode<std::string>("name");
            m.age = c.decode<int>("age");
            if (c.contains("birthday"))
                m.birthday = c.decode<Date>("birthday");
            m.home_page = c.decode_if_present<Url>("homePage");
            return m;
        }
    };

} // namespace

TEST_CASE("member with seconds birthday and no home page", "[udecode][date][url]") {
    const Value root = Value::object({{"name", "张三"}, {"age", 18}, {"birthday", kEpoch}});

    auto decoder = decoder_with(DateDecodingStrategy::seconds_since_1970());
    const auto m = decoder.decode<Member>(root);

    CHECK(m.name == "张三");
    CHECK(m.age == 18);
    CHECK(m.birthday == date_from_seconds(kEpoch));
    CHECK_FALSE(m.home_page.has_value());
}

TEST_CASE("date: each strategy reads back its own representation", "[udecode][date]") {
    const Date when {std::chrono::seconds {1700000000} + std::chrono::milliseconds {250}};

    SECTION("deferred") {
        const Value root = seconds_since_1970(when);
        Decoder decoder;
        CHECK(std::chrono::abs(decoder.decode<Date>(root) - when) < std::chrono::microseconds {1});
    }

    SECTION("seconds") {
        const Value root = seconds_since_1970(when);
        auto decoder = decoder_with(DateDecodingStrategy::seconds_since_1970());
        CHECK(std::chrono::abs(decoder.decode<Date>(root) - when) < std::chrono::microseconds {1});
    }

    SECTION("milliseconds") {
        const Value root = seconds_since_1970(when) * 1000.0;
        auto decoder = decoder_with(DateDecodingStrategy::milliseconds_since_1970());
        const auto d = decoder.decode<Date>(root);
        CHECK(std::chrono::abs(d - when) < std::chrono::milliseconds {1});
    }

    SECTION("iso8601 at second granularity") {
        const Value root = "2023-11-14T22:13:20Z";
        auto decoder = decoder_with(DateDecodingStrategy::iso8601());
        CHECK(std::chrono::floor<std::chrono::seconds>(decoder.decode<Date>(root)) == std::chrono::floor<std::chrono::seconds>(when));
    }

    SECTION("formatted with fraction") {
        const Value root = "2023-11-14 22:13:20.250";
        auto decoder = decoder_with(DateDecodingStrategy::formatted(DateFormatter {"%Y-%m-%d %H:%M:%S.%f"}));
        CHECK(decoder.decode<Date>(root) == when);
    }
}
