/*
 * udecode
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef UDECODE_HPP
#define UDECODE_HPP

#pragma once
#include <any>
#include <charconv>
#include <chrono>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#ifdef _MSC_VER
    #define UDECODE_FORCEINLINE __forceinline
#else
    #define UDECODE_FORCEINLINE __attribute__((always_inline)) inline
#endif

namespace udecode {

    enum class Type : std::uint8_t {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object,
        Opaque
    };

    [[nodiscard]] constexpr const char* type_name(const Type t) noexcept {
        switch (t) {
        case Type::Null:
            return "null";
        case Type::Bool:
            return "bool";
        case Type::Number:
            return "number";
        case Type::String:
            return "string";
        case Type::Array:
            return "array";
        case Type::Object:
            return "object";
        case Type::Opaque:
            return "opaque";
        }
        return "unknown";
    }

    enum class NumberKind : std::uint8_t {
        Integer,
        Unsigned, // only for values above int64 max
        Double
    };

    struct Number {
        NumberKind kind {NumberKind::Double};
        union {
            std::int64_t i;
            std::uint64_t u;
            double d;
        };

        constexpr Number() noexcept: d(0.0) { }

        static constexpr Number from_i64(const std::int64_t v) noexcept {
            Number n;
            n.kind = NumberKind::Integer;
            n.i = v;
            return n;
        }

        static constexpr Number from_u64(const std::uint64_t v) noexcept {
            if (v <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
                return from_i64(static_cast<std::int64_t>(v));
            Number n;
            n.kind = NumberKind::Unsigned;
            n.u = v;
            return n;
        }

        static constexpr Number from_double(const double v) noexcept {
            Number n;
            n.kind = NumberKind::Double;
            n.d = v;
            return n;
        }

        [[nodiscard]] constexpr bool is_integral() const noexcept {
            return kind != NumberKind::Double;
        }

        [[nodiscard]] constexpr double as_double() const noexcept {
            switch (kind) {
            case NumberKind::Integer:
                return static_cast<double>(i);
            case NumberKind::Unsigned:
                return static_cast<double>(u);
            case NumberKind::Double:
                return d;
            }
            return 0.0;
        }
    };

    class Value {
    public:
        using Array = std::vector<Value>;
        using Object = std::map<std::string, Value, std::less<>>;

        Value() = default;
        Value(std::nullptr_t) noexcept { }
        Value(const bool b): v_(std::in_place_type<bool>, b) { }

        template <class T>
            requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
        Value(const T n): v_(std::in_place_type<Number>, make_integer(n)) { }

        template <std::floating_point T>
        Value(const T n): v_(std::in_place_type<Number>, Number::from_double(static_cast<double>(n))) { }

        Value(const char* s): v_(std::in_place_type<std::string>, s ? s : "") { }
        Value(std::string s): v_(std::in_place_type<std::string>, std::move(s)) { }
        Value(const std::string_view s): v_(std::in_place_type<std::string>, s) { }
        Value(Array a): v_(std::in_place_type<Array>, std::move(a)) { }
        Value(Object o): v_(std::in_place_type<Object>, std::move(o)) { }

        [[nodiscard]] static Value object(const std::initializer_list<Object::value_type> init) {
            return Value {Object(init)};
        }

        [[nodiscard]] static Value array(const std::initializer_list<Value> init) {
            return Value {Array(init)};
        }

        // wraps an already-typed native value (Date, Url, Decimal or any application type)
        template <class T>
        [[nodiscard]] static Value opaque(T native) {
            Value v;
            v.v_.template emplace<std::any>(std::move(native));
            return v;
        }

        [[nodiscard]] UDECODE_FORCEINLINE Type type() const noexcept {
            return static_cast<Type>(v_.index());
        }

        [[nodiscard]] UDECODE_FORCEINLINE bool is_null() const noexcept {
            return type() == Type::Null;
        }
        [[nodiscard]] UDECODE_FORCEINLINE bool is_bool() const noexcept {
            return type() == Type::Bool;
        }
        [[nodiscard]] UDECODE_FORCEINLINE bool is_number() const noexcept {
            return type() == Type::Number;
        }
        [[nodiscard]] UDECODE_FORCEINLINE bool is_string() const noexcept {
            return type() == Type::String;
        }
        [[nodiscard]] UDECODE_FORCEINLINE bool is_array() const noexcept {
            return type() == Type::Array;
        }
        [[nodiscard]] UDECODE_FORCEINLINE bool is_object() const noexcept {
            return type() == Type::Object;
        }
        [[nodiscard]] UDECODE_FORCEINLINE bool is_opaque() const noexcept {
            return type() == Type::Opaque;
        }

        [[nodiscard]] UDECODE_FORCEINLINE const Number* number() const noexcept {
            return std::get_if<Number>(&v_);
        }

        [[nodiscard]] UDECODE_FORCEINLINE std::optional<bool> try_bool() const noexcept {
            if (const auto* b = std::get_if<bool>(&v_))
                return *b;
            return std::nullopt;
        }
        [[nodiscard]] UDECODE_FORCEINLINE std::optional<std::int64_t> try_i64() const noexcept {
            if (const auto* n = number(); n && n->kind == NumberKind::Integer)
                return n->i;
            return std::nullopt;
        }
        [[nodiscard]] UDECODE_FORCEINLINE std::optional<std::uint64_t> try_u64() const noexcept {
            const auto* n = number();
            if (!n)
                return std::nullopt;
            if (n->kind == NumberKind::Unsigned)
                return n->u;
            if (n->kind == NumberKind::Integer && n->i >= 0)
                return static_cast<std::uint64_t>(n->i);
            return std::nullopt;
        }
        [[nodiscard]] UDECODE_FORCEINLINE std::optional<double> try_double() const noexcept {
            if (const auto* n = number())
                return n->as_double();
            return std::nullopt;
        }
        [[nodiscard]] UDECODE_FORCEINLINE std::optional<std::string_view> try_string() const noexcept {
            if (const auto* s = std::get_if<std::string>(&v_))
                return std::string_view {*s};
            return std::nullopt;
        }

        template <class T>
        [[nodiscard]] const T* try_opaque() const noexcept {
            const auto* a = std::get_if<std::any>(&v_);
            return a ? std::any_cast<T>(a) : nullptr;
        }

        [[nodiscard]] const std::type_info& opaque_type() const noexcept {
            const auto* a = std::get_if<std::any>(&v_);
            return a ? a->type() : typeid(void);
        }

        [[nodiscard]] const std::string& as_string() const {
            return std::get<std::string>(v_);
        }
        [[nodiscard]] const Array& as_array() const {
            return std::get<Array>(v_);
        }
        [[nodiscard]] const Object& as_object() const {
            return std::get<Object>(v_);
        }

        [[nodiscard]] std::size_t size() const noexcept {
            if (const auto* a = std::get_if<Array>(&v_))
                return a->size();
            if (const auto* o = std::get_if<Object>(&v_))
                return o->size();
            return 0;
        }

        [[nodiscard]] const Value* get(const std::string_view key) const {
            const auto* o = std::get_if<Object>(&v_);
            if (!o)
                return nullptr;
            const auto it = o->find(key);
            return it != o->end() ? &it->second : nullptr;
        }

        [[nodiscard]] bool contains(const std::string_view key) const {
            return get(key) != nullptr;
        }

        [[nodiscard]] const Value* at(const std::size_t i) const noexcept {
            const auto* a = std::get_if<Array>(&v_);
            return a && i < a->size() ? &(*a)[i] : nullptr;
        }

    private:
        template <class T>
        static constexpr Number make_integer(const T n) noexcept {
            if constexpr (std::is_signed_v<T>)
                return Number::from_i64(static_cast<std::int64_t>(n));
            else
                return Number::from_u64(static_cast<std::uint64_t>(n));
        }

        // alternative order matches Type
        std::variant<std::monostate, bool, Number, std::string, Array, Object, std::any> v_ {};
    };

} // namespace udecode

namespace udecode {

    class AnyKey {
    public:
        AnyKey(std::string s): str_(std::move(s)) { }
        AnyKey(const char* s): str_(s ? s : "") { }
        AnyKey(const std::string_view s): str_(s) { }

        [[nodiscard]] static AnyKey index(const std::size_t i) {
            AnyKey k {"Index " + std::to_string(i)};
            k.int_ = i;
            return k;
        }

        [[nodiscard]] static AnyKey super_key() {
            return AnyKey {"super"};
        }

        [[nodiscard]] static std::optional<AnyKey> from_string(const std::string_view s) {
            return AnyKey {s};
        }

        [[nodiscard]] std::string_view string_value() const noexcept {
            return str_;
        }

        [[nodiscard]] std::optional<std::size_t> int_value() const noexcept {
            return int_;
        }

        friend bool operator==(const AnyKey&, const AnyKey&) = default;

    private:
        std::string str_;
        std::optional<std::size_t> int_ {};
    };

    using CodingPath = std::vector<AnyKey>;

    [[nodiscard]] inline std::string format_path(const CodingPath& path) {
        if (path.empty())
            return "<root>";

        std::string out;
        for (const auto& k : path) {
            if (const auto i = k.int_value()) {
                out.push_back('[');
                out.append(std::to_string(*i));
                out.push_back(']');
                continue;
            }
            if (!out.empty())
                out.push_back('.');
            out.append(k.string_value());
        }
        return out;
    }

    // Specialize for key types that cannot carry string_value()/from_string() members (enums).
    template <class K>
    struct KeyTraits {
        [[nodiscard]] static auto string_value(const K& k) -> decltype(k.string_value()) {
            return k.string_value();
        }
        [[nodiscard]] static auto from_string(const std::string_view s) -> decltype(K::from_string(s)) {
            return K::from_string(s);
        }
    };

    template <class K>
    concept CodingKey = requires(const K& k, std::string_view s) {
        { KeyTraits<K>::string_value(k) } -> std::convertible_to<std::string_view>;
        { KeyTraits<K>::from_string(s) } -> std::same_as<std::optional<K>>;
    };

} // namespace udecode

namespace udecode {

    enum class ErrorCode : std::uint8_t {
        None,
        TypeMismatch,
        ValueNotFound,
        KeyNotFound,
        DataCorrupted,
    };

    enum class ErrorFormat : std::uint8_t {
        Pretty,
        Compact
    };

    [[nodiscard]] constexpr const char* error_code_name(const ErrorCode c) noexcept {
        switch (c) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::TypeMismatch:
            return "TypeMismatch";
        case ErrorCode::ValueNotFound:
            return "ValueNotFound";
        case ErrorCode::KeyNotFound:
            return "KeyNotFound";
        case ErrorCode::DataCorrupted:
            return "DataCorrupted";
        }
        return "Unknown";
    }

    struct DecodeError {
        ErrorCode code {ErrorCode::None};
        CodingPath path {};
        std::string expected {}; // TypeMismatch, ValueNotFound
        std::string actual {};   // TypeMismatch
        std::string key {};      // KeyNotFound
        std::string description {};

        template <ErrorFormat Fmt>
        [[nodiscard]] std::string format() const;

        [[nodiscard]] std::string to_string() const {
            return error_code_name(code);
        }

        [[nodiscard]] bool ok() const noexcept {
            return code == ErrorCode::None;
        }

        [[nodiscard]] explicit operator bool() const noexcept {
            return ok();
        }
    };

    [[nodiscard]] inline std::string format_error_compact(const DecodeError& e) {
        if (e.code == ErrorCode::None)
            return {};

        std::string out;
        out.reserve(96);

        out.append("udecode: ");
        out.append(error_code_name(e.code));
        out.append(" at ");
        out.append(format_path(e.path));
        if (!e.description.empty()) {
            out.append(": ");
            out.append(e.description);
        }
        return out;
    }

    [[nodiscard]] inline std::string format_error(const DecodeError& e) {
        if (e.code == ErrorCode::None)
            return {};

        std::string out;
        out.reserve(160);

        out.append("udecode: ");
        out.append(error_code_name(e.code));
        out.push_back('\n');

        out.append(" --> ");
        out.append(format_path(e.path));
        out.push_back('\n');

        if (!e.key.empty()) {
            out.append("  key:      \"");
            out.append(e.key);
            out.append("\"\n");
        }
        if (!e.expected.empty()) {
            out.append("  expected: ");
            out.append(e.expected);
            out.push_back('\n');
        }
        if (!e.actual.empty()) {
            out.append("  found:    ");
            out.append(e.actual);
            out.push_back('\n');
        }
        if (!e.description.empty()) {
            out.push_back('\n');
            out.append(e.description);
            out.push_back('\n');
        }
        return out;
    }

    template <ErrorFormat Fmt>
    std::string DecodeError::format() const {
        if constexpr (Fmt == ErrorFormat::Compact)
            return format_error_compact(*this);
        if constexpr (Fmt == ErrorFormat::Pretty)
            return format_error(*this);

        return {};
    }

    class DecodingError : public std::runtime_error {
    public:
        explicit DecodingError(DecodeError e): std::runtime_error(e.format<ErrorFormat::Compact>()), error_(std::move(e)) { }

        [[nodiscard]] ErrorCode code() const noexcept {
            return error_.code;
        }

        [[nodiscard]] const CodingPath& path() const noexcept {
            return error_.path;
        }

        [[nodiscard]] const DecodeError& error() const noexcept {
            return error_;
        }

    private:
        DecodeError error_;
    };

    template <class T>
    class DecodeResult {
    public:
        DecodeResult(T v): value_(std::move(v)) { }
        DecodeResult(DecodeError e): error_(std::move(e)) { }

        [[nodiscard]] bool ok() const noexcept {
            return value_.has_value();
        }

        [[nodiscard]] explicit operator bool() const noexcept {
            return ok();
        }

        [[nodiscard]] const DecodeError& error() const noexcept {
            return error_;
        }

        [[nodiscard]] T& value() & {
            return value_.value();
        }
        [[nodiscard]] const T& value() const& {
            return value_.value();
        }
        [[nodiscard]] T&& value() && {
            return std::move(value_).value();
        }

        [[nodiscard]] const T& operator*() const& {
            return *value_;
        }
        [[nodiscard]] const T* operator->() const {
            return &*value_;
        }

    private:
        std::optional<T> value_ {};
        DecodeError error_ {};
    };

} // namespace udecode

namespace udecode {

    using Date = std::chrono::system_clock::time_point;

    [[nodiscard]] inline Date date_from_seconds(const double seconds) {
        return Date {std::chrono::round<Date::duration>(std::chrono::duration<double>(seconds))};
    }

    [[nodiscard]] inline double seconds_since_1970(const Date d) noexcept {
        return std::chrono::duration<double>(d.time_since_epoch()).count();
    }

} // namespace udecode

namespace udecode::detail {

    struct CivilTime {
        int year {1970};
        int month {1};
        int day {1};
        int hour {};
        int minute {};
        int second {};
        std::int64_t nanos {};
        std::int32_t offset {}; // seconds east of UTC
    };

    [[nodiscard]] constexpr bool is_digit(const char c) noexcept {
        return c >= '0' && c <= '9';
    }

    [[nodiscard]] constexpr bool is_alpha(const char c) noexcept {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }

    [[nodiscard]] constexpr bool is_hex(const char c) noexcept {
        return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    }

    [[nodiscard]] constexpr bool is_leap_year(const std::int64_t y) noexcept {
        return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    }

    [[nodiscard]] constexpr int days_in_month(const std::int64_t y, const int m) noexcept {
        constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        return m == 2 && is_leap_year(y) ? 29 : kDays[m - 1];
    }

    // proleptic Gregorian calendar, days relative to 1970-01-01
    [[nodiscard]] constexpr std::int64_t days_from_civil(std::int64_t y, const unsigned m, const unsigned d) noexcept {
        y -= m <= 2;
        const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
        const auto yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
    }

    [[nodiscard]] inline bool read_digits(const std::string_view s, std::size_t& pos, const std::size_t n, int& out) noexcept {
        if (pos + n > s.size())
            return false;
        int v = 0;
        for (std::size_t i = 0; i < n; ++i) {
            const char c = s[pos + i];
            if (!is_digit(c))
                return false;
            v = v * 10 + (c - '0');
        }
        out = v;
        pos += n;
        return true;
    }

    // digits past nanosecond resolution are consumed and dropped
    [[nodiscard]] inline bool read_fraction(const std::string_view s, std::size_t& pos, std::int64_t& nanos) noexcept {
        std::int64_t v = 0;
        std::size_t digits = 0;
        while (pos < s.size() && is_digit(s[pos])) {
            if (digits < 9) {
                v = v * 10 + (s[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0)
            return false;
        for (std::size_t i = digits; i < 9; ++i)
            v *= 10;
        nanos = v;
        return true;
    }

    // RFC 3339 offsets need the colon; strftime's %z also takes +HHMM
    [[nodiscard]] inline bool read_offset(const std::string_view s, std::size_t& pos, std::int32_t& offset, const bool colon_required) noexcept {
        if (pos >= s.size())
            return false;

        const char c = s[pos];
        if (c == 'Z' || c == 'z') {
            ++pos;
            offset = 0;
            return true;
        }
        if (c != '+' && c != '-')
            return false;
        ++pos;

        int hh = 0;
        int mm = 0;
        if (!read_digits(s, pos, 2, hh))
            return false;
        if (pos < s.size() && s[pos] == ':')
            ++pos;
        else if (colon_required)
            return false;
        if (!read_digits(s, pos, 2, mm))
            return false;
        if (hh > 23 || mm > 59)
            return false;

        const auto total = static_cast<std::int32_t>(hh * 3600 + mm * 60);
        offset = c == '-' ? -total : total;
        return true;
    }

    [[nodiscard]] inline std::optional<Date> make_date(const CivilTime& t) noexcept {
        if (t.month < 1 || t.month > 12)
            return std::nullopt;
        if (t.day < 1 || t.day > days_in_month(t.year, t.month))
            return std::nullopt;
        if (t.hour > 23 || t.minute > 59 || t.second > 59)
            return std::nullopt;

        const std::int64_t days = days_from_civil(t.year, static_cast<unsigned>(t.month), static_cast<unsigned>(t.day));
        const std::int64_t secs = days * 86400 + t.hour * 3600 + t.minute * 60 + t.second - t.offset;
        return Date {std::chrono::duration_cast<Date::duration>(std::chrono::seconds {secs} + std::chrono::nanoseconds {t.nanos})};
    }

} // namespace udecode::detail

namespace udecode {

    // RFC 3339 internet date-time: YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)
    [[nodiscard]] inline std::optional<Date> parse_iso8601(const std::string_view text) {
        detail::CivilTime t {};
        std::size_t pos = 0;

        const auto expect = [&](const char c) {
            if (pos < text.size() && text[pos] == c) {
                ++pos;
                return true;
            }
            return false;
        };

        if (!detail::read_digits(text, pos, 4, t.year) || !expect('-') || !detail::read_digits(text, pos, 2, t.month) || !expect('-') ||
            !detail::read_digits(text, pos, 2, t.day))
            return std::nullopt;

        if (!expect('T') && !expect('t'))
            return std::nullopt;

        if (!detail::read_digits(text, pos, 2, t.hour) || !expect(':') || !detail::read_digits(text, pos, 2, t.minute) || !expect(':') ||
            !detail::read_digits(text, pos, 2, t.second))
            return std::nullopt;

        if (expect('.') && !detail::read_fraction(text, pos, t.nanos))
            return std::nullopt;

        if (!detail::read_offset(text, pos, t.offset, true) || pos != text.size())
            return std::nullopt;

        return detail::make_date(t);
    }

    // strftime-style pattern reader: %Y %m %d %H %M %S %f %z %%; other characters match literally.
    // Fields missing from the pattern default to 1970-01-01 00:00:00 in the formatter's UTC offset.
    class DateFormatter {
    public:
        explicit DateFormatter(std::string format, const std::int32_t utc_offset_seconds = 0): format_(std::move(format)), utc_offset_(utc_offset_seconds) { }

        [[nodiscard]] const std::string& format() const noexcept {
            return format_;
        }

        [[nodiscard]] std::int32_t utc_offset() const noexcept {
            return utc_offset_;
        }

        [[nodiscard]] std::optional<Date> date_from(std::string_view text) const;

    private:
        std::string format_;
        std::int32_t utc_offset_ {};
    };

    inline std::optional<Date> DateFormatter::date_from(const std::string_view text) const {
        detail::CivilTime t {};
        t.offset = utc_offset_;

        std::size_t pos = 0;
        for (std::size_t i = 0; i < format_.size(); ++i) {
            const char c = format_[i];
            if (c != '%') {
                if (pos >= text.size() || text[pos] != c)
                    return std::nullopt;
                ++pos;
                continue;
            }

            if (++i >= format_.size())
                return std::nullopt;

            bool ok = false;
            switch (format_[i]) {
            case 'Y':
                ok = detail::read_digits(text, pos, 4, t.year);
                break;
            case 'm':
                ok = detail::read_digits(text, pos, 2, t.month);
                break;
            case 'd':
                ok = detail::read_digits(text, pos, 2, t.day);
                break;
            case 'H':
                ok = detail::read_digits(text, pos, 2, t.hour);
                break;
            case 'M':
                ok = detail::read_digits(text, pos, 2, t.minute);
                break;
            case 'S':
                ok = detail::read_digits(text, pos, 2, t.second);
                break;
            case 'f':
                ok = detail::read_fraction(text, pos, t.nanos);
                break;
            case 'z':
                ok = detail::read_offset(text, pos, t.offset, false);
                break;
            case '%':
                ok = pos < text.size() && text[pos] == '%';
                if (ok)
                    ++pos;
                break;
            default:
                return std::nullopt;
            }

            if (!ok)
                return std::nullopt;
        }

        if (pos != text.size())
            return std::nullopt;

        return detail::make_date(t);
    }

} // namespace udecode

namespace udecode {

    // RFC 3986 URI reference. Absolute and relative references are both accepted;
    // parse() rejects characters outside the URI alphabet and malformed components.
    class Url {
    public:
        [[nodiscard]] static std::optional<Url> parse(std::string_view text);

        [[nodiscard]] const std::string& string() const noexcept {
            return text_;
        }
        [[nodiscard]] const std::string& scheme() const noexcept {
            return scheme_;
        }
        [[nodiscard]] const std::string& user_info() const noexcept {
            return user_info_;
        }
        [[nodiscard]] const std::string& host() const noexcept {
            return host_;
        }
        [[nodiscard]] std::optional<std::uint16_t> port() const noexcept {
            return port_;
        }
        [[nodiscard]] const std::string& path() const noexcept {
            return path_;
        }
        [[nodiscard]] const std::string& query() const noexcept {
            return query_;
        }
        [[nodiscard]] const std::string& fragment() const noexcept {
            return fragment_;
        }
        [[nodiscard]] bool has_authority() const noexcept {
            return has_authority_;
        }
        [[nodiscard]] bool is_absolute() const noexcept {
            return !scheme_.empty();
        }

        friend bool operator==(const Url& a, const Url& b) noexcept {
            return a.text_ == b.text_;
        }

    private:
        Url() = default;

        bool parse_authority(std::string_view authority);

        std::string text_ {};
        std::string scheme_ {};
        std::string user_info_ {};
        std::string host_ {};
        std::optional<std::uint16_t> port_ {};
        std::string path_ {};
        std::string query_ {};
        std::string fragment_ {};
        bool has_authority_ {};
    };

} // namespace udecode

namespace udecode::detail {

    [[nodiscard]] constexpr bool is_uri_char(const char c) noexcept {
        if (is_alpha(c) || is_digit(c))
            return true;
        switch (c) {
        case '-':
        case '.':
        case '_':
        case '~':
        case ':':
        case '/':
        case '?':
        case '#':
        case '[':
        case ']':
        case '@':
        case '!':
        case '$':
        case '&':
        case '\'':
        case '(':
        case ')':
        case '*':
        case '+':
        case ',':
        case ';':
        case '=':
            return true;
        default:
            return false;
        }
    }

    [[nodiscard]] constexpr bool is_valid_scheme(const std::string_view s) noexcept {
        if (s.empty() || !is_alpha(s.front()))
            return false;
        for (const char c : s) {
            if (!is_alpha(c) && !is_digit(c) && c != '+' && c != '-' && c != '.')
                return false;
        }
        return true;
    }

    [[nodiscard]] constexpr bool has_any_of(const std::string_view s, const std::string_view chars) noexcept {
        return s.find_first_of(chars) != std::string_view::npos;
    }

} // namespace udecode::detail

namespace udecode {

    inline std::optional<Url> Url::parse(const std::string_view text) {
        if (text.empty())
            return std::nullopt;

        for (std::size_t i = 0; i < text.size(); ++i) {
            const char c = text[i];
            if (c == '%') {
                if (i + 2 >= text.size() || !detail::is_hex(text[i + 1]) || !detail::is_hex(text[i + 2]))
                    return std::nullopt;
                i += 2;
                continue;
            }
            if (!detail::is_uri_char(c))
                return std::nullopt;
        }

        Url url;
        url.text_ = std::string(text);

        std::string_view rest = text;

        if (const auto hash = rest.find('#'); hash != std::string_view::npos) {
            const auto fragment = rest.substr(hash + 1);
            if (detail::has_any_of(fragment, "#[]"))
                return std::nullopt;
            url.fragment_ = std::string(fragment);
            rest = rest.substr(0, hash);
        }

        if (const auto q = rest.find('?'); q != std::string_view::npos) {
            const auto query = rest.substr(q + 1);
            if (detail::has_any_of(query, "[]"))
                return std::nullopt;
            url.query_ = std::string(query);
            rest = rest.substr(0, q);
        }

        // a colon ahead of the first slash can only introduce a scheme
        const auto colon = rest.find(':');
        if (const auto slash = rest.find('/'); colon != std::string_view::npos && (slash == std::string_view::npos || colon < slash)) {
            const auto scheme = rest.substr(0, colon);
            if (!detail::is_valid_scheme(scheme))
                return std::nullopt;
            url.scheme_ = std::string(scheme);
            rest = rest.substr(colon + 1);
        }

        if (rest.starts_with("//")) {
            rest.remove_prefix(2);
            const auto end = rest.find('/');
            if (!url.parse_authority(rest.substr(0, end)))
                return std::nullopt;
            rest = end == std::string_view::npos ? std::string_view {} : rest.substr(end);
        }

        if (detail::has_any_of(rest, "[]"))
            return std::nullopt;
        url.path_ = std::string(rest);

        return url;
    }

    inline bool Url::parse_authority(const std::string_view authority) {
        has_authority_ = true;

        std::string_view host_port = authority;
        if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
            const auto info = authority.substr(0, at);
            if (detail::has_any_of(info, "@[]"))
                return false;
            user_info_ = std::string(info);
            host_port = authority.substr(at + 1);
        }

        std::string_view port_text {};
        if (host_port.starts_with('[')) {
            const auto close = host_port.find(']');
            if (close == std::string_view::npos || close < 2)
                return false;
            for (const char c : host_port.substr(1, close - 1)) {
                if (!detail::is_hex(c) && c != ':' && c != '.')
                    return false;
            }
            host_ = std::string(host_port.substr(0, close + 1));
            const auto after = host_port.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':')
                    return false;
                port_text = after.substr(1);
            }
        } else {
            const auto pc = host_port.rfind(':');
            const auto host = host_port.substr(0, pc);
            if (detail::has_any_of(host, ":[]"))
                return false;
            host_ = std::string(host);
            if (pc != std::string_view::npos)
                port_text = host_port.substr(pc + 1);
        }

        if (port_text.empty())
            return true;

        std::uint32_t port = 0;
        const auto* first = port_text.data();
        const auto* last = first + port_text.size();
        const auto [ptr, ec] = std::from_chars(first, last, port);
        if (ec != std::errc {} || ptr != last || port > std::numeric_limits<std::uint16_t>::max())
            return false;
        port_ = static_cast<std::uint16_t>(port);
        return true;
    }

} // namespace udecode

namespace udecode {

    // value = (negative ? -1 : 1) * significand * 10^exponent, kept normalized
    // (no trailing zeros in the significand, zero is always +0e0).
    class Decimal {
    public:
        constexpr Decimal() noexcept = default;

        // 17 significant digits of the binary double: 15.88 becomes 15.880000000000001
        [[nodiscard]] static Decimal from_double(double d) noexcept;

        [[nodiscard]] static std::optional<Decimal> parse(std::string_view text) noexcept;

        [[nodiscard]] static constexpr Decimal nan() noexcept {
            Decimal d;
            d.nan_ = true;
            return d;
        }

        [[nodiscard]] constexpr bool is_nan() const noexcept {
            return nan_;
        }
        [[nodiscard]] constexpr bool is_zero() const noexcept {
            return !nan_ && significand_ == 0;
        }
        [[nodiscard]] constexpr bool is_negative() const noexcept {
            return negative_;
        }
        [[nodiscard]] constexpr std::uint64_t significand() const noexcept {
            return significand_;
        }
        [[nodiscard]] constexpr std::int32_t exponent() const noexcept {
            return exponent_;
        }

        [[nodiscard]] double to_double() const noexcept;
        [[nodiscard]] std::string to_string() const;

        friend constexpr bool operator==(const Decimal&, const Decimal&) noexcept = default;

    private:
        static constexpr Decimal make(bool negative, std::uint64_t significand, std::int32_t exponent) noexcept {
            Decimal d;
            if (significand == 0)
                return d;
            while (significand % 10 == 0) {
                significand /= 10;
                ++exponent;
            }
            d.negative_ = negative;
            d.significand_ = significand;
            d.exponent_ = exponent;
            return d;
        }

        std::uint64_t significand_ {};
        std::int32_t exponent_ {};
        bool negative_ {};
        bool nan_ {};
    };

    inline Decimal Decimal::from_double(const double d) noexcept {
        if (!std::isfinite(d))
            return nan();
        if (d == 0.0)
            return {};

        char buf[64];
        const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::scientific, 16);
        if (ec != std::errc {})
            return nan();

        const auto parsed = parse(std::string_view {buf, static_cast<std::size_t>(ptr - buf)});
        return parsed ? *parsed : nan();
    }

    inline std::optional<Decimal> Decimal::parse(const std::string_view text) noexcept {
        constexpr std::int64_t kMaxExponent = 1'000'000;

        std::size_t pos = 0;
        bool negative = false;
        if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
            negative = text[pos] == '-';
            ++pos;
        }

        std::uint64_t significand = 0;
        std::int64_t scale = 0;
        std::size_t digits = 0;
        // zeros are held back until a nonzero digit follows, so trailing ones never overflow
        std::int64_t pending_zeros = 0;

        const auto accumulate = [&](const char c) {
            ++digits;
            if (c == '0') {
                ++pending_zeros;
                return pending_zeros <= kMaxExponent;
            }
            for (; pending_zeros > 0; --pending_zeros) {
                if (significand > std::numeric_limits<std::uint64_t>::max() / 10)
                    return false;
                significand *= 10;
            }
            const auto digit = static_cast<std::uint64_t>(c - '0');
            if (significand > (std::numeric_limits<std::uint64_t>::max() - digit) / 10)
                return false;
            significand = significand * 10 + digit;
            return true;
        };

        while (pos < text.size() && detail::is_digit(text[pos])) {
            if (!accumulate(text[pos++]))
                return std::nullopt;
        }
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            while (pos < text.size() && detail::is_digit(text[pos])) {
                if (!accumulate(text[pos++]))
                    return std::nullopt;
                if (--scale < -kMaxExponent)
                    return std::nullopt;
            }
        }
        if (digits == 0)
            return std::nullopt;
        scale += pending_zeros;

        if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
            ++pos;
            if (pos < text.size() && text[pos] == '+')
                ++pos;
            std::int64_t e = 0;
            const auto* first = text.data() + pos;
            const auto* last = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(first, last, e);
            if (ec != std::errc {} || ptr == first || e > kMaxExponent || e < -kMaxExponent)
                return std::nullopt;
            pos += static_cast<std::size_t>(ptr - first);
            scale += e;
        }

        if (pos != text.size() || scale > kMaxExponent || scale < -kMaxExponent)
            return std::nullopt;

        return make(negative, significand, static_cast<std::int32_t>(scale));
    }

    inline std::string Decimal::to_string() const {
        if (nan_)
            return "NaN";

        std::string digits = std::to_string(significand_);
        std::string out;
        if (negative_)
            out.push_back('-');

        if (exponent_ >= 0) {
            out.append(digits);
            if (significand_ != 0)
                out.append(static_cast<std::size_t>(exponent_), '0');
            return out;
        }

        const auto point = static_cast<std::int64_t>(digits.size()) + exponent_;
        if (point > 0) {
            out.append(digits, 0, static_cast<std::size_t>(point));
            out.push_back('.');
            out.append(digits, static_cast<std::size_t>(point));
        } else {
            out.append("0.");
            out.append(static_cast<std::size_t>(-point), '0');
            out.append(digits);
        }
        return out;
    }

    inline double Decimal::to_double() const noexcept {
        if (nan_)
            return std::numeric_limits<double>::quiet_NaN();

        char buf[64];
        auto r = std::to_chars(buf, buf + sizeof(buf), significand_);
        *r.ptr++ = 'e';
        r = std::to_chars(r.ptr, buf + sizeof(buf), exponent_);

        double d = 0.0;
        if (const auto [ptr, ec] = std::from_chars(buf, r.ptr, d); ec != std::errc {})
            return std::numeric_limits<double>::quiet_NaN();
        return negative_ ? -d : d;
    }

} // namespace udecode

namespace udecode {

    class Decoder;
    class SingleValueContainer;
    class UnkeyedContainer;
    template <CodingKey Key>
    class KeyedContainer;

    using UserInfo = std::unordered_map<std::string, std::any>;

    class DateDecodingStrategy {
    public:
        enum class Kind : std::uint8_t {
            DeferredToDate,
            SecondsSince1970,
            MillisecondsSince1970,
            Iso8601,
            Formatted,
            Custom
        };

        using CustomFn = std::function<Date(Decoder&)>;

        DateDecodingStrategy() = default;

        [[nodiscard]] static DateDecodingStrategy deferred_to_date() {
            return {};
        }
        [[nodiscard]] static DateDecodingStrategy seconds_since_1970() {
            return DateDecodingStrategy {Kind::SecondsSince1970};
        }
        [[nodiscard]] static DateDecodingStrategy milliseconds_since_1970() {
            return DateDecodingStrategy {Kind::MillisecondsSince1970};
        }
        [[nodiscard]] static DateDecodingStrategy iso8601() {
            return DateDecodingStrategy {Kind::Iso8601};
        }
        [[nodiscard]] static DateDecodingStrategy formatted(DateFormatter formatter) {
            DateDecodingStrategy s {Kind::Formatted};
            s.formatter_ = std::move(formatter);
            return s;
        }
        [[nodiscard]] static DateDecodingStrategy custom(CustomFn fn) {
            if (!fn)
                throw std::invalid_argument("udecode: custom date decoding strategy needs a callable");
            DateDecodingStrategy s {Kind::Custom};
            s.custom_ = std::move(fn);
            return s;
        }

        [[nodiscard]] Kind kind() const noexcept {
            return kind_;
        }

        [[nodiscard]] const DateFormatter* formatter() const noexcept {
            return formatter_ ? &*formatter_ : nullptr;
        }

        [[nodiscard]] const CustomFn& custom() const noexcept {
            return custom_;
        }

    private:
        explicit DateDecodingStrategy(const Kind k) noexcept: kind_(k) { }

        Kind kind_ {Kind::DeferredToDate};
        std::optional<DateFormatter> formatter_ {};
        CustomFn custom_ {};
    };

    struct Options {
        DateDecodingStrategy date_strategy {};
        UserInfo user_info {};
    };

    // Customization point: a specialization provides `static T decode(Decoder&)`.
    // Types exposing such a static member function are picked up without one.
    template <class T>
    struct Decodable;

    template <class T>
    concept SelfDecodable = requires(Decoder& d) {
        { T::decode(d) } -> std::convertible_to<T>;
    };

    template <SelfDecodable T>
    struct Decodable<T> {
        static T decode(Decoder& d) {
            return T::decode(d);
        }
    };

    template <class T>
    concept DecodableType = requires(Decoder& d) {
        { Decodable<T>::decode(d) } -> std::convertible_to<T>;
    };

    class Storage {
    public:
        void push(const Value& v) {
            items_.push_back(&v);
        }

        void pop() noexcept {
            if (!items_.empty())
                items_.pop_back();
        }

        [[nodiscard]] const Value* top() const noexcept {
            return items_.empty() ? nullptr : items_.back();
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return items_.size();
        }

        [[nodiscard]] bool empty() const noexcept {
            return items_.empty();
        }

    private:
        std::vector<const Value*> items_ {};
    };

} // namespace udecode

namespace udecode::detail {

    template <class T>
    inline constexpr bool is_optional_v = false;

    template <class T>
    inline constexpr bool is_optional_v<std::optional<T>> = true;

    template <class T>
    inline constexpr bool is_char_v = std::is_same_v<T, char> || std::is_same_v<T, wchar_t> || std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> ||
                                      std::is_same_v<T, char32_t>;

    template <class T>
    inline constexpr bool is_integer_v = std::is_integral_v<T> && !std::is_same_v<T, bool> && !is_char_v<T>;

    template <class T>
    inline constexpr bool is_scalar_v = std::is_same_v<T, bool> || is_integer_v<T> || std::is_floating_point_v<T> || std::is_same_v<T, std::string>;

    template <class T>
    [[nodiscard]] std::string type_name() {
        if constexpr (std::is_same_v<T, bool>)
            return "bool";
        else if constexpr (std::is_same_v<T, std::string>)
            return "string";
        else if constexpr (is_integer_v<T>)
            return (std::is_signed_v<T> ? "int" : "uint") + std::to_string(sizeof(T) * 8);
        else if constexpr (std::is_same_v<T, float>)
            return "float";
        else if constexpr (std::is_same_v<T, double>)
            return "double";
        else if constexpr (std::is_same_v<T, long double>)
            return "long double";
        else if constexpr (std::is_same_v<T, Date>)
            return "Date";
        else if constexpr (std::is_same_v<T, Url>)
            return "Url";
        else if constexpr (std::is_same_v<T, Decimal>)
            return "Decimal";
        else if constexpr (is_optional_v<T>)
            return "optional<" + type_name<typename T::value_type>() + ">";
        else
            return "object";
    }

    [[nodiscard]] inline std::string number_text(const Number& n) {
        switch (n.kind) {
        case NumberKind::Integer:
            return std::to_string(n.i);
        case NumberKind::Unsigned:
            return std::to_string(n.u);
        case NumberKind::Double:
            break;
        }
        char buf[32];
        const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), n.d);
        return ec == std::errc {} ? std::string(buf, ptr) : std::string("nan");
    }

    [[nodiscard]] inline std::string describe(const Value& v) {
        if (const auto* n = v.number())
            return n->is_integral() ? "integer" : "double";
        return udecode::type_name(v.type());
    }

    [[nodiscard]] inline CodingPath appended(CodingPath path, AnyKey key) {
        path.push_back(std::move(key));
        return path;
    }

    template <class K>
    [[nodiscard]] AnyKey to_any_key(const K& k) {
        if constexpr (std::is_same_v<K, AnyKey>)
            return k;
        else
            return AnyKey {std::string_view {KeyTraits<K>::string_value(k)}};
    }

    [[noreturn]] inline void throw_type_mismatch(std::string expected, const Value& actual, CodingPath path) {
        DecodeError e;
        e.code = ErrorCode::TypeMismatch;
        e.actual = describe(actual);
        e.description = "Expected to decode " + expected + " but found " + e.actual + " instead.";
        e.expected = std::move(expected);
        e.path = std::move(path);
        throw DecodingError {std::move(e)};
    }

    [[noreturn]] inline void throw_value_not_found(std::string expected, CodingPath path, std::string description) {
        DecodeError e;
        e.code = ErrorCode::ValueNotFound;
        e.expected = std::move(expected);
        e.path = std::move(path);
        e.description = std::move(description);
        throw DecodingError {std::move(e)};
    }

    [[noreturn]] inline void throw_key_not_found(std::string key, CodingPath path) {
        DecodeError e;
        e.code = ErrorCode::KeyNotFound;
        e.description = "No value associated with key \"" + key + "\".";
        e.key = std::move(key);
        e.path = std::move(path);
        throw DecodingError {std::move(e)};
    }

    [[noreturn]] inline void throw_data_corrupted(CodingPath path, std::string description) {
        DecodeError e;
        e.code = ErrorCode::DataCorrupted;
        e.path = std::move(path);
        e.description = std::move(description);
        throw DecodingError {std::move(e)};
    }

    template <class T>
    [[nodiscard]] T number_to_integer(const Number& n, const Value& v, const CodingPath& path) {
        switch (n.kind) {
        case NumberKind::Integer:
            if (std::in_range<T>(n.i))
                return static_cast<T>(n.i);
            break;
        case NumberKind::Unsigned:
            if (std::in_range<T>(n.u))
                return static_cast<T>(n.u);
            break;
        case NumberKind::Double: {
            double whole = 0.0;
            if (!std::isfinite(n.d) || std::modf(n.d, &whole) != 0.0)
                throw_type_mismatch(type_name<T>(), v, path);

            const double upper = std::ldexp(1.0, std::numeric_limits<T>::digits);
            const double lower = std::is_signed_v<T> ? -upper : 0.0;
            if (n.d >= lower && n.d < upper)
                return static_cast<T>(n.d);
            break;
        }
        }
        throw_data_corrupted(path, "Parsed number <" + number_text(n) + "> does not fit in " + type_name<T>() + ".");
    }

    template <class T>
    [[nodiscard]] T number_to_floating(const Number& n, const CodingPath& path) {
        const double d = n.as_double();
        if constexpr (std::is_same_v<T, float>) {
            if (std::isfinite(d) && std::fabs(d) > static_cast<double>(std::numeric_limits<float>::max()))
                throw_data_corrupted(path, "Parsed number <" + number_text(n) + "> does not fit in float.");
        }
        return static_cast<T>(d);
    }

    [[nodiscard]] inline Date checked_date(const double seconds, const CodingPath& path) {
        const double limit = std::chrono::duration<double>(Date::duration::max()).count();
        if (!std::isfinite(seconds) || std::fabs(seconds) >= limit)
            throw_data_corrupted(path, "Date value " + number_text(Number::from_double(seconds)) + " is out of range.");
        return date_from_seconds(seconds);
    }

    struct CursorAdvance {
        std::size_t& index;

        ~CursorAdvance() {
            ++index;
        }
    };

} // namespace udecode::detail

namespace udecode {

    // Decoding engine. Holds the storage stack of nodes being decoded, the
    // current coding path and a shared, read-only snapshot of the options.
    // The value tree handed to decode() must outlive the decoder and every
    // container or super decoder obtained from it.
    class Decoder {
    public:
        Decoder(): options_(std::make_shared<const Options>()) { }

        explicit Decoder(Options options): options_(std::make_shared<const Options>(std::move(options))) { }

        explicit Decoder(const Value& container, CodingPath path = {}): options_(std::make_shared<const Options>()), path_(std::move(path)) {
            storage_.push(container);
        }

        Decoder(const Decoder&) = delete;
        Decoder& operator=(const Decoder&) = delete;

        Decoder(Decoder&&) noexcept = default;
        Decoder& operator=(Decoder&&) noexcept = default;

        template <class T>
        [[nodiscard]] T decode(const Value& root) {
            return unbox<T>(root);
        }

        template <class T>
        [[nodiscard]] DecodeResult<T> try_decode(const Value& root) {
            try {
                return DecodeResult<T> {decode<T>(root)};
            } catch (const DecodingError& e) {
                return DecodeResult<T> {e.error()};
            }
        }

        template <CodingKey Key = AnyKey>
        [[nodiscard]] KeyedContainer<Key> container();

        [[nodiscard]] UnkeyedContainer unkeyed_container();

        [[nodiscard]] SingleValueContainer single_value_container();

        [[nodiscard]] const CodingPath& coding_path() const noexcept {
            return path_;
        }

        [[nodiscard]] const Storage& storage() const noexcept {
            return storage_;
        }

        [[nodiscard]] const Options& options() const noexcept {
            return *options_;
        }

        [[nodiscard]] const DateDecodingStrategy& date_decoding_strategy() const noexcept {
            return options_->date_strategy;
        }

        void set_date_decoding_strategy(DateDecodingStrategy strategy) {
            auto next = std::make_shared<Options>(*options_);
            next->date_strategy = std::move(strategy);
            options_ = std::move(next);
        }

        [[nodiscard]] const UserInfo& user_info() const noexcept {
            return options_->user_info;
        }

        void set_user_info(UserInfo info) {
            auto next = std::make_shared<Options>(*options_);
            next->user_info = std::move(info);
            options_ = std::move(next);
        }

    private:
        template <CodingKey>
        friend class KeyedContainer;
        friend class UnkeyedContainer;
        friend class SingleValueContainer;

        Decoder(const Value& container, CodingPath path, std::shared_ptr<const Options> options): options_(std::move(options)), path_(std::move(path)) {
            storage_.push(container);
        }

        class StorageScope {
        public:
            StorageScope(Decoder& d, const Value& v): d_(d) {
                d_.storage_.push(v);
            }
            ~StorageScope() {
                d_.storage_.pop();
            }

            StorageScope(const StorageScope&) = delete;
            StorageScope& operator=(const StorageScope&) = delete;

        private:
            Decoder& d_;
        };

        // Sets the decoder's path to base + key for the lifetime of the scope.
        class PathScope {
        public:
            PathScope(Decoder& d, const CodingPath& base, AnyKey key): d_(d), saved_(std::exchange(d.path_, base)) {
                d_.path_.push_back(std::move(key));
            }
            ~PathScope() {
                d_.path_ = std::move(saved_);
            }

            PathScope(const PathScope&) = delete;
            PathScope& operator=(const PathScope&) = delete;

        private:
            Decoder& d_;
            CodingPath saved_;
        };

        template <class T>
        T unbox(const Value& value);

        template <class T>
        T unbox_scalar(const Value& value);

        Date unbox_date(const Value& value);
        Url unbox_url(const Value& value);
        Decimal unbox_decimal(const Value& value);

        [[nodiscard]] const Value& current(const std::string& expected) const {
            const Value* top = storage_.top();
            if (!top)
                detail::throw_value_not_found(expected, path_, "Expected " + expected + " but found no value instead.");
            return *top;
        }

        std::shared_ptr<const Options> options_ {};
        Storage storage_ {};
        CodingPath path_ {};
    };

    class SingleValueContainer {
    public:
        [[nodiscard]] const CodingPath& coding_path() const noexcept {
            return path_;
        }

        // true only when there is no node at all; a null node is a value
        [[nodiscard]] bool decode_nil() const noexcept {
            return decoder_->storage_.top() == nullptr;
        }

        template <class T>
        [[nodiscard]] T decode() {
            const Value& v = decoder_->current(detail::type_name<T>());
            return decoder_->template unbox<T>(v);
        }

    private:
        friend class Decoder;

        explicit SingleValueContainer(Decoder& d): decoder_(&d), path_(d.path_) { }

        Decoder* decoder_;
        CodingPath path_;
    };

    class UnkeyedContainer {
    public:
        [[nodiscard]] const CodingPath& coding_path() const noexcept {
            return path_;
        }

        [[nodiscard]] std::size_t count() const noexcept {
            return array_->size();
        }

        [[nodiscard]] std::size_t remaining() const noexcept {
            return array_->size() - index_;
        }

        [[nodiscard]] std::size_t current_index() const noexcept {
            return index_;
        }

        [[nodiscard]] bool is_at_end() const noexcept {
            return index_ >= array_->size();
        }

        // the cursor moves past the element whether or not decoding succeeds
        template <class T>
        [[nodiscard]] T decode() {
            check_index(detail::type_name<T>());

            detail::CursorAdvance advance {index_};
            Decoder::PathScope scope {*decoder_, path_, AnyKey::index(index_)};
            return decoder_->template unbox<T>((*array_)[index_]);
        }

        // an exhausted cursor counts as absent
        template <class T>
        [[nodiscard]] std::optional<T> decode_if_present() {
            if (is_at_end() || decode_nil())
                return std::nullopt;
            return decode<T>();
        }

        // consumes the element only when it is null
        [[nodiscard]] bool decode_nil() {
            check_index("null");
            if (!(*array_)[index_].is_null())
                return false;
            ++index_;
            return true;
        }

        template <CodingKey NestedKey = AnyKey>
        [[nodiscard]] KeyedContainer<NestedKey> nested_container();

        [[nodiscard]] UnkeyedContainer nested_unkeyed_container() {
            check_index("array");

            const Value& v = (*array_)[index_];
            CodingPath path = detail::appended(path_, AnyKey::index(index_));
            if (v.is_null())
                detail::throw_value_not_found("array", std::move(path), "Cannot get unkeyed decoding container -- found null value instead.");
            if (!v.is_array())
                detail::throw_type_mismatch("array", v, std::move(path));

            ++index_;
            return UnkeyedContainer {*decoder_, v.as_array(), std::move(path)};
        }

        [[nodiscard]] Decoder super_decoder() {
            check_index("value");

            const Value& v = (*array_)[index_];
            CodingPath path = detail::appended(path_, AnyKey::index(index_));
            ++index_;
            return Decoder {v, std::move(path), decoder_->options_};
        }

    private:
        friend class Decoder;
        template <CodingKey>
        friend class KeyedContainer;

        UnkeyedContainer(Decoder& d, const Value::Array& array, CodingPath path): decoder_(&d), array_(&array), path_(std::move(path)) { }

        void check_index(const std::string& expected) const {
            if (is_at_end())
                detail::throw_value_not_found(expected, detail::appended(path_, AnyKey::index(index_)), "Unkeyed container is at end.");
        }

        Decoder* decoder_;
        const Value::Array* array_;
        CodingPath path_;
        std::size_t index_ {};
    };

    template <CodingKey Key>
    class KeyedContainer {
    public:
        [[nodiscard]] const CodingPath& coding_path() const noexcept {
            return path_;
        }

        // entries whose name is not a valid Key are skipped
        [[nodiscard]] std::vector<Key> all_keys() const {
            std::vector<Key> keys;
            keys.reserve(object_->size());
            for (const auto& entry : *object_) {
                if (auto k = KeyTraits<Key>::from_string(entry.first))
                    keys.push_back(std::move(*k));
            }
            return keys;
        }

        [[nodiscard]] bool contains(const Key& key) const {
            return object_->find(std::string_view {KeyTraits<Key>::string_value(key)}) != object_->end();
        }

        template <class T>
        [[nodiscard]] T decode(const Key& key) {
            const Value& entry = find(key);
            Decoder::PathScope scope {*decoder_, path_, detail::to_any_key(key)};
            return decoder_->template unbox<T>(entry);
        }

        // absent or null entries yield an empty optional, anything else must decode
        template <class T>
        [[nodiscard]] std::optional<T> decode_if_present(const Key& key) {
            const auto it = object_->find(std::string_view {KeyTraits<Key>::string_value(key)});
            if (it == object_->end() || it->second.is_null())
                return std::nullopt;

            Decoder::PathScope scope {*decoder_, path_, detail::to_any_key(key)};
            return decoder_->template unbox<T>(it->second);
        }

        [[nodiscard]] bool decode_nil(const Key& key) const {
            return find(key).is_null();
        }

        template <CodingKey NestedKey = AnyKey>
        [[nodiscard]] KeyedContainer<NestedKey> nested_container(const Key& key) {
            const Value& entry = find(key);
            CodingPath path = detail::appended(path_, detail::to_any_key(key));
            if (entry.is_null())
                detail::throw_value_not_found("object", std::move(path), "Cannot get keyed decoding container -- found null value instead.");
            if (!entry.is_object())
                detail::throw_type_mismatch("object", entry, std::move(path));

            return KeyedContainer<NestedKey> {*decoder_, entry.as_object(), std::move(path)};
        }

        [[nodiscard]] UnkeyedContainer nested_unkeyed_container(const Key& key) {
            const Value& entry = find(key);
            CodingPath path = detail::appended(path_, detail::to_any_key(key));
            if (entry.is_null())
                detail::throw_value_not_found("array", std::move(path), "Cannot get unkeyed decoding container -- found null value instead.");
            if (!entry.is_array())
                detail::throw_type_mismatch("array", entry, std::move(path));

            return UnkeyedContainer {*decoder_, entry.as_array(), std::move(path)};
        }

        [[nodiscard]] Decoder super_decoder() {
            return make_super_decoder(AnyKey::super_key());
        }

        [[nodiscard]] Decoder super_decoder(const Key& key) {
            return make_super_decoder(detail::to_any_key(key));
        }

    private:
        friend class Decoder;
        friend class UnkeyedContainer;
        template <CodingKey>
        friend class KeyedContainer;

        KeyedContainer(Decoder& d, const Value::Object& object, CodingPath path): decoder_(&d), object_(&object), path_(std::move(path)) { }

        [[nodiscard]] const Value& find_named(const std::string_view name) const {
            const auto it = object_->find(name);
            if (it == object_->end())
                detail::throw_key_not_found(std::string(name), path_);
            return it->second;
        }

        [[nodiscard]] const Value& find(const Key& key) const {
            return find_named(std::string_view {KeyTraits<Key>::string_value(key)});
        }

        [[nodiscard]] Decoder make_super_decoder(AnyKey key) const {
            const Value& entry = find_named(key.string_value());
            return Decoder {entry, detail::appended(path_, std::move(key)), decoder_->options_};
        }

        Decoder* decoder_;
        const Value::Object* object_;
        CodingPath path_;
    };

    // a date describes itself as seconds since the Unix epoch
    template <>
    struct Decodable<Date> {
        static Date decode(Decoder& d) {
            auto c = d.single_value_container();
            return detail::checked_date(c.decode<double>(), d.coding_path());
        }
    };

    template <CodingKey NestedKey>
    KeyedContainer<NestedKey> UnkeyedContainer::nested_container() {
        check_index("object");

        const Value& v = (*array_)[index_];
        CodingPath path = detail::appended(path_, AnyKey::index(index_));
        if (v.is_null())
            detail::throw_value_not_found("object", std::move(path), "Cannot get keyed decoding container -- found null value instead.");
        if (!v.is_object())
            detail::throw_type_mismatch("object", v, std::move(path));

        ++index_;
        return KeyedContainer<NestedKey> {*decoder_, v.as_object(), std::move(path)};
    }

    template <CodingKey Key>
    KeyedContainer<Key> Decoder::container() {
        const Value& top = current("object");
        if (top.is_null())
            detail::throw_value_not_found("object", path_, "Cannot get keyed decoding container -- found null value instead.");
        if (!top.is_object())
            detail::throw_type_mismatch("object", top, path_);

        return KeyedContainer<Key> {*this, top.as_object(), path_};
    }

    inline UnkeyedContainer Decoder::unkeyed_container() {
        const Value& top = current("array");
        if (top.is_null())
            detail::throw_value_not_found("array", path_, "Cannot get unkeyed decoding container -- found null value instead.");
        if (!top.is_array())
            detail::throw_type_mismatch("array", top, path_);

        return UnkeyedContainer {*this, top.as_array(), path_};
    }

    inline SingleValueContainer Decoder::single_value_container() {
        return SingleValueContainer {*this};
    }

    // Dispatch order: special types, optional, raw Value, scalars, then the
    // target type's own Decodable implementation.
    template <class T>
    T Decoder::unbox(const Value& value) {
        if constexpr (std::is_same_v<T, Date>) {
            return unbox_date(value);
        } else if constexpr (std::is_same_v<T, Url>) {
            return unbox_url(value);
        } else if constexpr (std::is_same_v<T, Decimal>) {
            return unbox_decimal(value);
        } else if constexpr (detail::is_optional_v<T>) {
            if (value.is_null())
                return std::nullopt;
            return T {unbox<typename T::value_type>(value)};
        } else if constexpr (std::is_same_v<T, Value>) {
            return value;
        } else if constexpr (detail::is_scalar_v<T>) {
            return unbox_scalar<T>(value);
        } else {
            static_assert(DecodableType<T>, "udecode: provide static T decode(udecode::Decoder&) or specialize udecode::Decodable<T>");

            if constexpr (std::is_copy_constructible_v<T>) {
                if (const T* native = value.template try_opaque<T>())
                    return *native;
            }

            StorageScope scope {*this, value};
            return Decodable<T>::decode(*this);
        }
    }

    template <class T>
    T Decoder::unbox_scalar(const Value& value) {
        if (const T* native = value.template try_opaque<T>())
            return *native;

        if (value.is_null())
            detail::throw_value_not_found(detail::type_name<T>(), path_, "Expected " + detail::type_name<T>() + " value but found null instead.");

        if constexpr (std::is_same_v<T, bool>) {
            if (const auto b = value.try_bool())
                return *b;
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (const auto s = value.try_string())
                return std::string(*s);
        } else if constexpr (detail::is_integer_v<T>) {
            if (const Number* n = value.number())
                return detail::number_to_integer<T>(*n, value, path_);
        } else if constexpr (std::is_floating_point_v<T>) {
            if (const Number* n = value.number())
                return detail::number_to_floating<T>(*n, path_);
        }

        detail::throw_type_mismatch(detail::type_name<T>(), value, path_);
    }

    inline Date Decoder::unbox_date(const Value& value) {
        if (value.is_null())
            detail::throw_value_not_found("Date", path_, "Expected Date but found null value instead.");

        if (const Date* native = value.try_opaque<Date>())
            return *native;

        // keeps the strategy alive even if a custom routine replaces the options
        const auto options = options_;
        const auto& strategy = options->date_strategy;

        switch (strategy.kind()) {
        case DateDecodingStrategy::Kind::DeferredToDate: {
            StorageScope scope {*this, value};
            return Decodable<Date>::decode(*this);
        }
        case DateDecodingStrategy::Kind::SecondsSince1970:
            return detail::checked_date(unbox<double>(value), path_);
        case DateDecodingStrategy::Kind::MillisecondsSince1970:
            return detail::checked_date(unbox<double>(value) / 1000.0, path_);
        case DateDecodingStrategy::Kind::Iso8601: {
            const auto text = unbox<std::string>(value);
            if (const auto date = parse_iso8601(text))
                return *date;
            detail::throw_data_corrupted(path_, "Expected date string to be ISO8601-formatted.");
        }
        case DateDecodingStrategy::Kind::Formatted: {
            const auto text = unbox<std::string>(value);
            if (const auto date = strategy.formatter()->date_from(text))
                return *date;
            detail::throw_data_corrupted(path_, "Date string does not match format expected by formatter.");
        }
        case DateDecodingStrategy::Kind::Custom: {
            StorageScope scope {*this, value};
            return strategy.custom()(*this);
        }
        }

        detail::throw_data_corrupted(path_, "Unknown date decoding strategy.");
    }

    inline Url Decoder::unbox_url(const Value& value) {
        if (value.is_null())
            detail::throw_value_not_found("Url", path_, "Expected Url but found null value instead.");

        if (const Url* native = value.try_opaque<Url>())
            return *native;

        const auto text = unbox<std::string>(value);
        if (text.empty())
            detail::throw_value_not_found("Url", path_, "Expected Url but found \"\" instead.");

        auto url = Url::parse(text);
        if (!url)
            detail::throw_data_corrupted(path_, "Invalid URL string.");
        return std::move(*url);
    }

    // goes through double, so the binary representation error is kept
    inline Decimal Decoder::unbox_decimal(const Value& value) {
        if (value.is_null())
            detail::throw_value_not_found("Decimal", path_, "Expected Decimal but found null value instead.");

        if (const Decimal* native = value.try_opaque<Decimal>())
            return *native;

        return Decimal::from_double(unbox<double>(value));
    }

    template <class T, class Alloc>
    struct Decodable<std::vector<T, Alloc>> {
        static std::vector<T, Alloc> decode(Decoder& d) {
            auto c = d.unkeyed_container();
            std::vector<T, Alloc> out;
            out.reserve(c.count());
            while (!c.is_at_end())
                out.push_back(c.decode<T>());
            return out;
        }
    };

    template <class T, class Compare, class Alloc>
    struct Decodable<std::map<std::string, T, Compare, Alloc>> {
        static std::map<std::string, T, Compare, Alloc> decode(Decoder& d) {
            auto c = d.container();
            std::map<std::string, T, Compare, Alloc> out;
            for (const auto& key : c.all_keys())
                out.emplace(std::string(key.string_value()), c.decode<T>(key));
            return out;
        }
    };

    template <class T, class Hash, class Eq, class Alloc>
    struct Decodable<std::unordered_map<std::string, T, Hash, Eq, Alloc>> {
        static std::unordered_map<std::string, T, Hash, Eq, Alloc> decode(Decoder& d) {
            auto c = d.container();
            std::unordered_map<std::string, T, Hash, Eq, Alloc> out;
            out.reserve(c.all_keys().size());
            for (const auto& key : c.all_keys())
                out.emplace(std::string(key.string_value()), c.decode<T>(key));
            return out;
        }
    };

} // namespace udecode

#endif // UDECODE_HPP
