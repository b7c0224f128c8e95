#include "kvlog.hpp"
#include <algorithm>
#include <cassert>
#include <vector>

namespace kvlog
{
namespace detail
{
//=============================================================================
// Adapters from captures to the visitor interfaces
//=============================================================================
namespace
{
class CapturedDebug : public Debug
{
public:
    explicit CapturedDebug(DebugCapture const& capture_) : capture(capture_) {}

    void write(std::ostream& os) const override { capture.write(capture.object, os); }

private:
    DebugCapture const& capture;
};

class CapturedDisplay : public Display
{
public:
    explicit CapturedDisplay(DisplayCapture const& capture_) : capture(capture_) {}

    void write(std::ostream& os) const override { capture.write(capture.object, os); }

private:
    DisplayCapture const& capture;
};

class CapturedStructured : public Structured
{
public:
    explicit CapturedStructured(StructuredCapture const& capture_) : capture(capture_) {}

    bool stream(Stream& s) const override { return capture.stream(capture.object, s); }

private:
    StructuredCapture const& capture;
};

class DisplayAsDebug : public Debug
{
public:
    explicit DisplayAsDebug(Display const& display_) : display(display_) {}

    void write(std::ostream& os) const override { display.write(os); }

private:
    Display const& display;
};

class StructuredAsDebug : public Debug
{
public:
    explicit StructuredAsDebug(Structured const& structured_) : structured(structured_) {}

    void write(std::ostream& os) const override { writeStructure(os, structured); }

private:
    Structured const& structured;
};

/// Writes an exception's message followed by its nested causes
class ErrorChainDisplay : public Display
{
public:
    explicit ErrorChainDisplay(std::exception const& error_) : error(error_) {}

    void write(std::ostream& os) const override
    {
        auto first = true;
        visitErrorChain(error, [&os, &first] (std::exception const& e)
        {
            if (! std::exchange(first, false))
                os << ": ";

            os << e.what();
        });
    }

private:
    std::exception const& error;
};

//=============================================================================
// Formatting visitor
//=============================================================================

/*
 * Writes values to an ostream. Nested values are written in the
 * {key: value} / [element] notation with strings and characters quoted,
 * top-level strings and characters are written as they are.
 */
class FmtVisitor : public Stream
{
public:
    explicit FmtVisitor(std::ostream& os_) : os(os_) {}

    bool signedInt(std::int64_t v) override   { beginValue(); os << v; return ok(); }
    bool unsignedInt(std::uint64_t v) override { beginValue(); os << v; return ok(); }
    bool floating(double v) override          { beginValue(); os << std::format("{}", v); return ok(); }
    bool boolean(bool v) override             { beginValue(); os << (v ? "true" : "false"); return ok(); }
    bool none() override                      { beginValue(); os << "None"; return ok(); }

    bool character(char32_t v) override
    {
        beginValue();

        if (isNested())
            writeQuoted(os, v);
        else
            writeUtf8(os, v);

        return ok();
    }

    bool str(std::string_view v) override
    {
        beginValue();

        if (isNested())
            writeQuoted(os, v);
        else
            os << v;

        return ok();
    }

    bool debug(Debug const& v) override
    {
        beginValue();
        v.write(os);
        return ok();
    }

    bool display(Display const& v) override
    {
        beginValue();
        v.write(os);
        return ok();
    }

    bool mapBegin(std::optional<std::size_t>) override
    {
        beginValue();
        os << '{';
        frames.push_back({ true, true });
        return ok();
    }

    bool mapKey(std::string_view key) override
    {
        assert(! frames.empty() && frames.back().isMap);

        if (! std::exchange(frames.back().first, false))
            os << ", ";

        os << key << ": ";
        return ok();
    }

    bool mapEnd() override
    {
        frames.pop_back();
        os << '}';
        return ok();
    }

    bool seqBegin(std::optional<std::size_t>) override
    {
        beginValue();
        os << '[';
        frames.push_back({ false, true });
        return ok();
    }

    bool seqEnd() override
    {
        frames.pop_back();
        os << ']';
        return ok();
    }

private:
    struct Frame
    {
        bool isMap;
        bool first;
    };

    bool isNested() const noexcept { return ! frames.empty(); }
    bool ok() const { return ! os.fail(); }

    // map entries are separated by mapKey
    void beginValue()
    {
        if (frames.empty() || frames.back().isMap)
            return;

        if (! std::exchange(frames.back().first, false))
            os << ", ";
    }

    std::ostream& os;
    std::vector<Frame> frames;
};

//=============================================================================
// Cast visitor
//=============================================================================

/// Extracts a primitive, or an owned string, from a visit. Formatting is never invoked.
class CastVisitor : public Visitor
{
public:
    bool signedInt(std::int64_t v) override         { result = Primitive(v); return true; }
    bool unsignedInt(std::uint64_t v) override      { result = Primitive(v); return true; }
    bool floating(double v) override                { result = Primitive(v); return true; }
    bool boolean(bool v) override                   { result = Primitive(v); return true; }
    bool character(char32_t v) override             { result = Primitive(v); return true; }
    bool str(std::string_view v) override           { result = std::string(v); return true; }
    bool borrowedStr(std::string_view v) override   { result = Primitive(v); return true; }
    bool none() override                            { result = Primitive(); return true; }
    bool debug(Debug const&) override               { return true; }
    bool display(Display const&) override           { return true; }
    bool error(std::exception const&) override      { return true; }
    bool structured(Structured const&) override     { return true; }

    Cast result;
};

//=============================================================================
// Short-lived visitor
//=============================================================================

/// Forwards to another visitor, announcing borrowed strings as short-lived ones
class ShortLivedVisitor : public Visitor
{
public:
    explicit ShortLivedVisitor(Visitor& visitor_) : visitor(visitor_) {}

    bool signedInt(std::int64_t v) override         { return visitor.signedInt(v); }
    bool unsignedInt(std::uint64_t v) override      { return visitor.unsignedInt(v); }
    bool floating(double v) override                { return visitor.floating(v); }
    bool boolean(bool v) override                   { return visitor.boolean(v); }
    bool character(char32_t v) override             { return visitor.character(v); }
    bool str(std::string_view v) override           { return visitor.str(v); }
    bool borrowedStr(std::string_view v) override   { return visitor.str(v); }
    bool none() override                            { return visitor.none(); }
    bool debug(Debug const& v) override             { return visitor.debug(v); }
    bool display(Display const& v) override         { return visitor.display(v); }
    bool error(std::exception const& e) override    { return visitor.error(e); }
    bool structured(Structured const& v) override   { return visitor.structured(v); }

private:
    Visitor& visitor;
};
} // namespace

void writeStructure(std::ostream& os, Structured const& value)
{
    FmtVisitor visitor(os);
    if (! value.stream(visitor))
        os.setstate(std::ios_base::failbit);
}

void writeUtf8(std::ostream& os, char32_t c)
{
    // surrogates and values beyond the unicode range are not scalar values
    if ((c >= 0xd800 && c < 0xe000) || c > 0x10ffff)
        c = 0xfffd;

    if (c < 0x80)
    {
        os.put(static_cast<char>(c));
    }
    else if (c < 0x800)
    {
        os.put(static_cast<char>(0xc0 | (c >> 6)));
        os.put(static_cast<char>(0x80 | (c & 0x3f)));
    }
    else if (c < 0x10000)
    {
        os.put(static_cast<char>(0xe0 | (c >> 12)));
        os.put(static_cast<char>(0x80 | ((c >> 6) & 0x3f)));
        os.put(static_cast<char>(0x80 | (c & 0x3f)));
    }
    else
    {
        os.put(static_cast<char>(0xf0 | (c >> 18)));
        os.put(static_cast<char>(0x80 | ((c >> 12) & 0x3f)));
        os.put(static_cast<char>(0x80 | ((c >> 6) & 0x3f)));
        os.put(static_cast<char>(0x80 | (c & 0x3f)));
    }
}

namespace
{
/// Writes one code point of a quoted literal, escaping it if needed
void writeEscaped(std::ostream& os, char32_t c, char32_t quote)
{
    switch (c)
    {
        case U'\0': os << "\\0"; return;
        case U'\t': os << "\\t"; return;
        case U'\n': os << "\\n"; return;
        case U'\r': os << "\\r"; return;
        case U'\\': os << "\\\\"; return;
        default: break;
    }

    if (c == quote)
        os << '\\' << static_cast<char>(c);
    else if (c < 0x20 || c == 0x7f)
        os << std::format("\\u{{{:x}}}", static_cast<std::uint32_t>(c));
    else
        writeUtf8(os, c);
}
} // namespace

void writeQuoted(std::ostream& os, char32_t c)
{
    os << '\'';
    writeEscaped(os, c, U'\'');
    os << '\'';
}

void writeQuoted(std::ostream& os, std::string_view s)
{
    os << '"';

    for (auto const ch : s)
    {
        auto const byte = static_cast<unsigned char>(ch);

        // multi-byte UTF-8 sequences are never escaped
        if (byte >= 0x80)
            os.put(ch);
        else
            writeEscaped(os, byte, U'"');
    }

    os << '"';
}
} // namespace detail

//=============================================================================
// Primitive implementations
//=============================================================================
std::optional<std::uint64_t> Primitive::asU64() const noexcept
{
    switch (kind())
    {
        case Kind::signedInt:   return static_cast<std::uint64_t>(*std::get_if<std::int64_t>(&storage));
        case Kind::unsignedInt: return *std::get_if<std::uint64_t>(&storage);
        case Kind::floating:    return detail::saturatingCast<std::uint64_t>(*std::get_if<double>(&storage));
        default:                return std::nullopt;
    }
}

std::optional<std::int64_t> Primitive::asI64() const noexcept
{
    switch (kind())
    {
        case Kind::signedInt:   return *std::get_if<std::int64_t>(&storage);
        case Kind::unsignedInt: return static_cast<std::int64_t>(*std::get_if<std::uint64_t>(&storage));
        case Kind::floating:    return detail::saturatingCast<std::int64_t>(*std::get_if<double>(&storage));
        default:                return std::nullopt;
    }
}

std::optional<double> Primitive::asF64() const noexcept
{
    switch (kind())
    {
        case Kind::signedInt:   return static_cast<double>(*std::get_if<std::int64_t>(&storage));
        case Kind::unsignedInt: return static_cast<double>(*std::get_if<std::uint64_t>(&storage));
        case Kind::floating:    return *std::get_if<double>(&storage);
        default:                return std::nullopt;
    }
}

std::optional<bool> Primitive::asBool() const noexcept
{
    if (auto const* v = std::get_if<bool>(&storage))
        return *v;

    return std::nullopt;
}

std::optional<char32_t> Primitive::asChar() const noexcept
{
    if (auto const* v = std::get_if<char32_t>(&storage))
        return *v;

    return std::nullopt;
}

std::optional<std::string_view> Primitive::asStr() const noexcept
{
    if (auto const* v = std::get_if<std::string_view>(&storage))
        return *v;

    return std::nullopt;
}

bool Primitive::visit(Visitor& visitor) const
{
    return std::visit(cxxutils::multilambda(
        [&visitor] (None)                { return visitor.none(); },
        [&visitor] (std::int64_t v)      { return visitor.signedInt(v); },
        [&visitor] (std::uint64_t v)     { return visitor.unsignedInt(v); },
        [&visitor] (double v)            { return visitor.floating(v); },
        [&visitor] (bool v)              { return visitor.boolean(v); },
        [&visitor] (char32_t v)          { return visitor.character(v); },
        [&visitor] (std::string_view v)  { return visitor.borrowedStr(v); }
    ), storage);
}

//=============================================================================
// Debug and Display implementations
//=============================================================================
std::string Debug::toString() const
{
    std::ostringstream ss;
    write(ss);
    return ss.str();
}

std::string Display::toString() const
{
    std::ostringstream ss;
    write(ss);
    return ss.str();
}

//=============================================================================
// Visitor implementations
//=============================================================================
bool Visitor::display(Display const& v)
{
    return debug(detail::DisplayAsDebug(v));
}

bool Visitor::error(std::exception const& e)
{
    return display(detail::ErrorChainDisplay(e));
}

bool Visitor::structured(Structured const& v)
{
    return debug(detail::StructuredAsDebug(v));
}

//=============================================================================
// Slot implementations
//=============================================================================
bool Slot::fillValue(Value const& value)
{
    if (std::exchange(filled, true))
        throw FillError("kvlog::Slot was filled more than once");

    detail::ShortLivedVisitor shortLived(visitor);
    return value.visit(shortLived);
}

bool Slot::fillPrimitive(Primitive value)
{
    return fillValue(Value(value));
}

bool Slot::fillError(std::exception const& e)
{
    return fillValue(Value::fromError(e));
}

//=============================================================================
// Text implementations
//=============================================================================
std::string_view Text::view() const noexcept
{
    if (auto const* borrowed = std::get_if<std::string_view>(&storage))
        return *borrowed;

    return *std::get_if<std::string>(&storage);
}

//=============================================================================
// Value implementations
//=============================================================================
Value Value::fromError(std::exception const& error)
{
    return Value(detail::Inner(detail::ErrorCapture { &error, nullptr, nullptr }));
}

Value Value::fromFill(Fill const& fill)
{
    return Value(detail::Inner(detail::FillCapture { &fill }));
}

bool Value::visit(Visitor& visitor) const
{
    return std::visit(cxxutils::multilambda(
        [&visitor] (Primitive const& primitive)
        {
            return primitive.visit(visitor);
        },
        [&visitor] (detail::FillCapture const& capture)
        {
            Slot slot(visitor);
            if (! capture.fill->fill(slot))
                return false;

            // a fill that decided on nothing is still visited exactly once
            return slot.isFilled() || visitor.none();
        },
        [&visitor] (detail::DebugCapture const& capture)
        {
            return visitor.debug(detail::CapturedDebug(capture));
        },
        [&visitor] (detail::DisplayCapture const& capture)
        {
            return visitor.display(detail::CapturedDisplay(capture));
        },
        [&visitor] (detail::ErrorCapture const& capture)
        {
            return visitor.error(*capture.error);
        },
        [&visitor] (detail::StructuredCapture const& capture)
        {
            return visitor.structured(detail::CapturedStructured(capture));
        }
    ), inner);
}

bool Value::stream(Stream& stream) const
{
    return visit(stream);
}

detail::Cast Value::cast() const
{
    if (auto const* primitive = std::get_if<Primitive>(&inner))
        return *primitive;

    detail::CastVisitor visitor;
    if (! visit(visitor))
        return Primitive();

    return std::move(visitor.result);
}

std::optional<Text> Value::toStr() const
{
    auto c = cast();

    if (auto* owned = std::get_if<std::string>(&c))
        return Text(std::move(*owned));

    if (auto const borrowed = std::get_if<Primitive>(&c)->asStr())
        return Text(*borrowed);

    return std::nullopt;
}

std::string Value::toString() const
{
    std::ostringstream ss;
    ss << *this;
    return ss.str();
}

std::ostream& operator<<(std::ostream& o, Value const& v)
{
    detail::FmtVisitor visitor(o);
    if (! v.visit(visitor))
        o.setstate(std::ios_base::failbit);

    return o;
}

//=============================================================================
// Source implementations
//=============================================================================
namespace
{
class KeyFinder : public SourceVisitor
{
public:
    explicit KeyFinder(Key key_) : key(key_) {}

    bool visitPair(Key k, Value const& v) override
    {
        if (k != key)
            return true;

        found = v;
        return false;
    }

    Key key;
    std::optional<Value> found;
};

class PairCounter : public SourceVisitor
{
public:
    bool visitPair(Key, Value const&) override
    {
        ++count;
        return true;
    }

    std::size_t count = 0;
};

class PairStreamer : public SourceVisitor
{
public:
    explicit PairStreamer(Stream& stream_) : stream(stream_) {}

    bool visitPair(Key k, Value const& v) override { return stream.mapKey(k.asStr()) && v.stream(stream); }

private:
    Stream& stream;
};

class EmptySource : public Source
{
public:
    bool visit(SourceVisitor&) const override { return true; }
    std::optional<Value> get(Key) const override { return std::nullopt; }
    std::size_t count() const override { return 0; }
};
} // namespace

std::optional<Value> Source::get(Key key) const
{
    KeyFinder finder(key);

    // the finder stops the visit on the first match
    if (visit(finder))
        return std::nullopt;

    return finder.found;
}

std::size_t Source::count() const
{
    PairCounter counter;
    auto success = visit(counter);
    assert(success);
    (void)success;

    return counter.count;
}

Source const& Source::empty()
{
    static EmptySource const kEmpty {};
    return kEmpty;
}

bool PairList::visit(SourceVisitor& visitor) const
{
    for (auto const& [key, value] : pairs)
        if (! visitor.visitPair(key, value))
            return false;

    return true;
}

std::optional<Value> PairList::get(Key key) const
{
    auto it = std::ranges::find_if(pairs, [key] (auto const& pair) { return pair.first == key; });
    if (it == pairs.end())
        return std::nullopt;

    return it->second;
}

bool Chain::visit(SourceVisitor& visitor) const
{
    return first.visit(visitor) && second.visit(visitor);
}

std::optional<Value> Chain::get(Key key) const
{
    if (auto v = first.get(key))
        return v;

    return second.get(key);
}

std::size_t Chain::count() const
{
    return first.count() + second.count();
}

bool streamSource(Source const& source, Stream& stream)
{
    PairStreamer streamer(stream);
    return stream.mapBegin(source.count()) && source.visit(streamer) && stream.mapEnd();
}

std::ostream& operator<<(std::ostream& o, Source const& s)
{
    detail::FmtVisitor visitor(o);
    if (! streamSource(s, visitor))
        o.setstate(std::ios_base::failbit);

    return o;
}

//=============================================================================
// Level implementations
//=============================================================================
std::string_view toString(Level level) noexcept
{
    switch (level)
    {
        case Level::error: return "ERROR";
        case Level::warn:  return "WARN";
        case Level::info:  return "INFO";
        case Level::debug: return "DEBUG";
        case Level::trace: return "TRACE";
    }

    return {};
}

std::string_view toString(LevelFilter filter) noexcept
{
    if (filter == LevelFilter::off)
        return "OFF";

    return toString(static_cast<Level>(filter));
}

std::ostream& operator<<(std::ostream& o, Level level)
{
    return o << toString(level);
}

std::ostream& operator<<(std::ostream& o, LevelFilter filter)
{
    return o << toString(filter);
}

bool log(Log& logger, Record const& record)
{
    if (record.level() > kStaticMaxLevel || ! logger.enabled(record.metadata()))
        return false;

    logger.log(record);
    return true;
}
} // namespace kvlog
