// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// value.cpp - Value utilities and byte-level encodings

#include <objgraph/value.h>
#include <objgraph/builders.h>
#include <objgraph/serialization.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <locale>
#include <span>
#include <sstream>
#include <string_view>

namespace objgraph {

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << std::setprecision(15) << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::filesystem::path>) {
            return "path(" + arg.generic_string() + ")";
        } else if constexpr (std::is_same_v<T, Value::boxed_ndarray>) {
            return "ndarray<" + std::string(dtype_name(arg->dtype())) + ">" + shape_to_string(arg->shape());
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{map:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[vector:" + std::to_string(arg.size()) + "]";
        } else {
            return "null";
        }
    }, val.data);
}

// ============================================================
// Binary format
//
// One tag byte per node, then the payload. Multi-byte fields are copied
// in native byte order; strings and keys are u32 length + bytes.
//
//   null     0x00
//   double   0x03  f64
//   bool     0x04  u8
//   string   0x05  str
//   map      0x06  u32 count, (str key, node)*
//   vector   0x07  u32 count, node*
//   int64    0x0A  i64
//   path     0x17  str (generic form)
//   ndarray  0x18  u8 dtype, u32 ndim, u64 extent*, raw elements
// ============================================================

namespace {

enum class Tag : uint8_t {
    null    = 0x00,
    f64     = 0x03,
    boolean = 0x04,
    string  = 0x05,
    map     = 0x06,
    vector  = 0x07,
    i64     = 0x0A,
    path    = 0x17,
    ndarray = 0x18,
};

/// Sink that only counts bytes (serialized_size)
struct CountingSink {
    std::size_t total = 0;

    void put(const void*, std::size_t n) { total += n; }
};

/// Sink that appends to a buffer (to_bytes)
struct BufferSink {
    ByteBuffer& out;

    void put(const void* p, std::size_t n)
    {
        const auto* bytes = static_cast<const uint8_t*>(p);
        out.insert(out.end(), bytes, bytes + n);
    }
};

/// Walks a Value and feeds its encoding to `Sink`
template <typename Sink>
class Encoder {
public:
    explicit Encoder(Sink& sink) : sink_(sink) {}

    void node(const Value& val) { std::visit(*this, val.data); }

    void operator()(std::monostate) { tag(Tag::null); }

    void operator()(bool b)
    {
        tag(Tag::boolean);
        scalar<uint8_t>(b ? 1 : 0);
    }

    void operator()(int64_t i)
    {
        tag(Tag::i64);
        scalar(i);
    }

    void operator()(double d)
    {
        tag(Tag::f64);
        scalar(d);
    }

    void operator()(const std::string& s)
    {
        tag(Tag::string);
        text(s);
    }

    void operator()(const std::filesystem::path& p)
    {
        tag(Tag::path);
        text(p.generic_string());
    }

    void operator()(const Value::boxed_ndarray& boxed)
    {
        const NdArray& a = boxed.get();
        tag(Tag::ndarray);
        scalar(static_cast<uint8_t>(a.dtype()));
        scalar(static_cast<uint32_t>(a.ndim()));
        for (std::size_t extent : a.shape()) {
            scalar(static_cast<uint64_t>(extent));
        }
        sink_.put(a.data(), a.nbytes());
    }

    void operator()(const ValueMap& m)
    {
        tag(Tag::map);
        scalar(static_cast<uint32_t>(m.size()));
        for (const auto& [key, child] : m) {
            text(key);
            node(child.get());
        }
    }

    void operator()(const ValueVector& v)
    {
        tag(Tag::vector);
        scalar(static_cast<uint32_t>(v.size()));
        for (const auto& child : v) {
            node(child.get());
        }
    }

private:
    void tag(Tag t) { scalar(static_cast<uint8_t>(t)); }

    template <typename T>
    void scalar(T v) { sink_.put(&v, sizeof(T)); }

    void text(std::string_view s)
    {
        scalar(static_cast<uint32_t>(s.size()));
        sink_.put(s.data(), s.size());
    }

    Sink& sink_;
};

class Decoder {
public:
    explicit Decoder(std::span<const uint8_t> input) : rest_(input) {}

    Value node()
    {
        const auto tag = static_cast<Tag>(take<uint8_t>());
        switch (tag) {
            case Tag::null:    return Value{};
            case Tag::boolean: return Value{take<uint8_t>() != 0};
            case Tag::i64:     return Value{take<int64_t>()};
            case Tag::f64:     return Value{take<double>()};
            case Tag::string:  return Value{take_text()};
            case Tag::path:    return Value{std::filesystem::path{take_text()}};
            case Tag::ndarray: return Value{take_ndarray()};
            case Tag::map: {
                const auto count = take<uint32_t>();
                auto t = ValueMap{}.transient();
                for (uint32_t i = 0; i < count; ++i) {
                    std::string key = take_text();
                    t.set(std::move(key), ValueBox{node()});
                }
                return Value{t.persistent()};
            }
            case Tag::vector: {
                const auto count = take<uint32_t>();
                auto t = ValueVector{}.transient();
                for (uint32_t i = 0; i < count; ++i) {
                    t.push_back(ValueBox{node()});
                }
                return Value{t.persistent()};
            }
        }
        throw Error("from_bytes: unknown tag 0x" + hex(static_cast<uint8_t>(tag)));
    }

private:
    std::span<const uint8_t> consume(std::size_t n)
    {
        if (n > rest_.size()) {
            throw Error("from_bytes: buffer ends " + std::to_string(n - rest_.size()) + " byte(s) early");
        }
        auto head = rest_.first(n);
        rest_ = rest_.subspan(n);
        return head;
    }

    template <typename T>
    T take()
    {
        T v;
        std::memcpy(&v, consume(sizeof(T)).data(), sizeof(T));
        return v;
    }

    std::string take_text()
    {
        auto bytes = consume(take<uint32_t>());
        return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }

    NdArray take_ndarray()
    {
        const auto raw_dtype = take<uint8_t>();
        if (raw_dtype > static_cast<uint8_t>(DType::float64)) {
            throw Error("from_bytes: unknown dtype code " + std::to_string(raw_dtype));
        }
        const auto dtype = static_cast<DType>(raw_dtype);

        Shape shape(take<uint32_t>());
        for (auto& extent : shape) {
            extent = static_cast<std::size_t>(take<uint64_t>());
        }

        auto raw = consume(shape_size(shape) * dtype_size(dtype));
        std::vector<std::byte> bytes(raw.size());
        if (!raw.empty()) std::memcpy(bytes.data(), raw.data(), raw.size());
        return NdArray{dtype, std::move(shape), std::move(bytes)};
    }

    static std::string hex(uint8_t v)
    {
        char buf[3];
        std::snprintf(buf, sizeof(buf), "%02X", static_cast<unsigned>(v));
        return buf;
    }

    std::span<const uint8_t> rest_;
};

} // anonymous namespace

std::size_t serialized_size(const Value& val)
{
    CountingSink sink;
    Encoder<CountingSink>(sink).node(val);
    return sink.total;
}

ByteBuffer to_bytes(const Value& val)
{
    ByteBuffer out;
    out.reserve(serialized_size(val));
    BufferSink sink{out};
    Encoder<BufferSink>(sink).node(val);
    return out;
}

Value from_bytes(const ByteBuffer& buffer)
{
    return from_bytes(buffer.data(), buffer.size());
}

Value from_bytes(const uint8_t* data, std::size_t size)
{
    if (size == 0) return Value{};
    return Decoder({data, size}).node();
}

// ============================================================
// JSON
// ============================================================

namespace {

class JsonWriter {
public:
    explicit JsonWriter(bool compact) : compact_(compact) { out_.imbue(std::locale::classic()); }

    std::string str() const { return out_.str(); }

    void node(const Value& val)
    {
        std::visit([this](const auto& arg) { write(arg); }, val.data);
    }

private:
    void write(std::monostate) { out_ << "null"; }
    void write(bool b) { out_ << (b ? "true" : "false"); }
    void write(int64_t i) { out_ << i; }

    void write(double d)
    {
        std::ostringstream num;
        num.imbue(std::locale::classic());
        num << std::setprecision(17) << d;
        std::string text = num.str();
        // A float must not read back as an int
        if (text.find_first_of(".eEn") == std::string::npos) text += ".0";
        out_ << text;
    }

    void write(const std::string& s) { quoted(s); }
    void write(const std::filesystem::path& p) { quoted(p.generic_string()); }

    void write(const Value::boxed_ndarray& boxed)
    {
        std::size_t flat = 0;
        array_axis(boxed.get(), 0, flat);
    }

    void write(const ValueMap& m)
    {
        block('{', '}', m, [this](const auto& entry) {
            quoted(entry.first);
            out_ << (compact_ ? ":" : ": ");
            node(entry.second.get());
        });
    }

    void write(const ValueVector& v)
    {
        block('[', ']', v, [this](const auto& child) { node(child.get()); });
    }

    template <typename Range, typename Fn>
    void block(char open, char close, const Range& range, Fn each)
    {
        if (range.size() == 0) {
            out_ << open << close;
            return;
        }
        out_ << open;
        ++depth_;
        bool first = true;
        for (const auto& item : range) {
            if (!first) out_ << ',';
            first = false;
            newline();
            each(item);
        }
        --depth_;
        newline();
        out_ << close;
    }

    void newline()
    {
        if (compact_) return;
        out_ << '\n' << std::string(static_cast<std::size_t>(depth_) * 2, ' ');
    }

    /// Arrays become nested lists following their shape
    void array_axis(const NdArray& a, std::size_t axis, std::size_t& flat)
    {
        if (axis == a.ndim()) {
            element(a, flat++);
            return;
        }
        out_ << '[';
        for (std::size_t i = 0; i < a.shape()[axis]; ++i) {
            if (i > 0) out_ << ',';
            array_axis(a, axis + 1, flat);
        }
        out_ << ']';
    }

    void element(const NdArray& a, std::size_t flat)
    {
        switch (a.dtype()) {
            case DType::float32: out_ << std::setprecision(7) << a.element_as_double(flat); break;
            case DType::float64: out_ << std::setprecision(15) << a.element_as_double(flat); break;
            case DType::uint64:  out_ << a.at<uint64_t>(flat); break;
            default:             out_ << a.element_as_int64(flat); break;
        }
    }

    void quoted(std::string_view s)
    {
        out_ << '"';
        for (char c : s) {
            switch (c) {
                case '"':  out_ << "\\\""; break;
                case '\\': out_ << "\\\\"; break;
                case '\b': out_ << "\\b"; break;
                case '\f': out_ << "\\f"; break;
                case '\n': out_ << "\\n"; break;
                case '\r': out_ << "\\r"; break;
                case '\t': out_ << "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[7];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                        out_ << buf;
                    } else {
                        out_ << c;
                    }
            }
        }
        out_ << '"';
    }

    std::ostringstream out_;
    bool compact_;
    int depth_ = 0;
};

/// Recursive-descent reader; every failure throws Error with the offset
class JsonReader {
public:
    explicit JsonReader(std::string_view text) : text_(text) {}

    Value document()
    {
        skip_space();
        if (at_end()) throw Error("empty JSON input");
        Value result = node();
        skip_space();
        if (!at_end()) fail("trailing characters");
        return result;
    }

private:
    Value node()
    {
        skip_space();
        switch (peek()) {
            case '{': return object();
            case '[': return array();
            case '"': return Value{string()};
            case 't': return literal("true", Value{true});
            case 'f': return literal("false", Value{false});
            case 'n': return literal("null", Value{});
            default: break;
        }
        if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek()))) return number();
        fail(at_end() ? "unexpected end of input" : "unexpected character '" + std::string(1, peek()) + "'");
    }

    Value object()
    {
        ++pos_;
        auto t = ValueMap{}.transient();
        if (accept('}')) return Value{t.persistent()};
        do {
            skip_space();
            std::string key = string();
            if (!accept(':')) fail("expected ':' after object key");
            t.set(std::move(key), ValueBox{node()});
        } while (accept(','));
        if (!accept('}')) fail("expected ',' or '}' in object");
        return Value{t.persistent()};
    }

    Value array()
    {
        ++pos_;
        auto t = ValueVector{}.transient();
        if (accept(']')) return Value{t.persistent()};
        do {
            t.push_back(ValueBox{node()});
        } while (accept(','));
        if (!accept(']')) fail("expected ',' or ']' in array");
        return Value{t.persistent()};
    }

    std::string string()
    {
        if (peek() != '"') fail("expected string");
        ++pos_;
        std::string result;
        while (!at_end()) {
            const char c = text_[pos_++];
            if (c == '"') return result;
            if (c != '\\') {
                result += c;
                continue;
            }
            if (at_end()) break;
            const char esc = text_[pos_++];
            switch (esc) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u':  append_utf8(result, codepoint()); break;
                default:   fail("invalid escape '\\" + std::string(1, esc) + "'");
            }
        }
        fail("unterminated string");
    }

    unsigned codepoint()
    {
        unsigned cp = 0;
        const char* first = text_.data() + pos_;
        const char* last = first + std::min<std::size_t>(4, text_.size() - pos_);
        auto [ptr, ec] = std::from_chars(first, last, cp, 16);
        if (ec != std::errc{} || ptr != first + 4) fail("invalid unicode escape");
        pos_ += 4;
        return cp;
    }

    static void append_utf8(std::string& out, unsigned cp)
    {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    /// Integers without '.' or exponent stay int64 unless they overflow
    Value number()
    {
        const std::size_t start = pos_;
        bool integral = true;
        if (peek() == '-') ++pos_;
        while (!at_end()) {
            const char c = peek();
            if (std::isdigit(static_cast<unsigned char>(c))) {
                ++pos_;
            } else if (c == '.' || c == 'e' || c == 'E') {
                integral = false;
                ++pos_;
                if ((c == 'e' || c == 'E') && (peek() == '+' || peek() == '-')) ++pos_;
            } else {
                break;
            }
        }

        const std::string_view token = text_.substr(start, pos_ - start);
        if (integral) {
            int64_t i = 0;
            auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), i);
            if (ec == std::errc{} && ptr == token.data() + token.size()) return Value{i};
        }

        std::istringstream in{std::string(token)};
        in.imbue(std::locale::classic());
        double d = 0.0;
        in >> d;
        if (in.fail() || in.peek() != std::char_traits<char>::eof()) {
            fail("invalid number '" + std::string(token) + "'");
        }
        return Value{d};
    }

    Value literal(std::string_view word, Value result)
    {
        if (text_.substr(pos_, word.size()) != word) fail("expected '" + std::string(word) + "'");
        pos_ += word.size();
        return result;
    }

    bool accept(char c)
    {
        skip_space();
        if (peek() != c) return false;
        ++pos_;
        return true;
    }

    void skip_space()
    {
        while (!at_end() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
    }

    [[nodiscard]] bool at_end() const { return pos_ >= text_.size(); }
    [[nodiscard]] char peek() const { return at_end() ? '\0' : text_[pos_]; }

    [[noreturn]] void fail(const std::string& what) const
    {
        throw Error("JSON: " + what + " at offset " + std::to_string(pos_));
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

} // anonymous namespace

std::string to_json(const Value& val, bool compact)
{
    JsonWriter writer(compact);
    writer.node(val);
    return writer.str();
}

Value from_json(const std::string& json_str, std::string* error_out)
{
    try {
        return JsonReader(json_str).document();
    } catch (const Error& e) {
        if (error_out) *error_out = e.what();
        return Value{};
    }
}

// ============================================================
// Explicit Template Instantiations
//
// Matching 'extern template' declarations live in value.h and builders.h.
// ============================================================

template struct BasicValue<unsafe_memory_policy>;
template class BasicMapBuilder<unsafe_memory_policy>;
template class BasicVectorBuilder<unsafe_memory_policy>;

} // namespace objgraph
