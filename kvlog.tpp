#pragma once

namespace kvlog
{

//=============================================================================
// Default formatting
//=============================================================================
namespace detail
{
/// Writes a structured value in the {key: value} / [element] notation
void writeStructure(std::ostream& os, Structured const& value);

template <typename T>
concept DefaultDebuggable = kIsKnownPrimitive<T> || Streamable<T> || Structurable<T>
                         || (is_optional<T>::value && Debuggable<typename T::value_type>);

template <typename T>
concept DefaultDisplayable = PrimitiveSource<T> || StringLike<T> || Streamable<T> || std::formattable<T, char>;

template <typename T>
bool streamStructure(Stream& stream, T const& value);

/// Presents a value that is known at compile-time to be structured
template <typename T>
class ErasedStructured : public Structured
{
public:
    explicit ErasedStructured(T const& value_) : value(value_) {}

    bool stream(Stream& s) const override { return streamStructure(s, value); }

private:
    T const& value;
};

template <typename T>
void writeDebug(std::ostream& os, T const& v)
{
    if constexpr (Boolean<T>)
        os << (v ? "true" : "false");
    else if constexpr (Character<T>)
        writeQuoted(os, toChar32(v));
    else if constexpr (SignedInteger<T>)
        os << static_cast<std::int64_t>(v);
    else if constexpr (UnsignedInteger<T>)
        os << static_cast<std::uint64_t>(v);
    else if constexpr (FloatingPoint<T>)
        os << std::format("{}", v);
    else if constexpr (std::same_as<T, char const*>)
    {
        if (v == nullptr)
            os << "None";
        else
            writeQuoted(os, std::string_view(v));
    }
    else if constexpr (StringLike<T>)
        writeQuoted(os, std::string_view(v));
    else if constexpr (is_optional<T>::value)
    {
        if (v.has_value())
            DebugFormatter<typename T::value_type>::write(os, *v);
        else
            os << "None";
    }
    else if constexpr (Streamable<T>)
        os << v;
    else if constexpr (Structurable<T>)
        writeStructure(os, ErasedStructured<T>(v));
    else
        static_assert(kAlwaysFalse<T>, "Type has no debug representation");
}

template <typename T>
void writeDisplay(std::ostream& os, T const& v)
{
    if constexpr (Boolean<T>)
        os << (v ? "true" : "false");
    else if constexpr (Character<T>)
        writeUtf8(os, toChar32(v));
    else if constexpr (SignedInteger<T>)
        os << static_cast<std::int64_t>(v);
    else if constexpr (UnsignedInteger<T>)
        os << static_cast<std::uint64_t>(v);
    else if constexpr (FloatingPoint<T>)
        os << std::format("{}", v);
    else if constexpr (std::same_as<T, char const*>)
    {
        if (v != nullptr)
            os << v;
    }
    else if constexpr (StringLike<T>)
        os << std::string_view(v);
    else if constexpr (Streamable<T>)
        os << v;
    else
        std::format_to(std::ostreambuf_iterator<char>(os), "{}", v);
}
} // namespace detail

template <typename T>
    requires detail::DefaultDebuggable<T>
struct DebugFormatter<T>
{
    static void write(std::ostream& os, T const& v) { detail::writeDebug(os, v); }
};

template <typename T>
    requires detail::DefaultDisplayable<T>
struct DisplayFormatter<T>
{
    static void write(std::ostream& os, T const& v) { detail::writeDisplay(os, v); }
};

template <typename... Args>
struct DebugFormatter<Arguments<Args...>>
{
    static void write(std::ostream& os, Arguments<Args...> const& args) { args.write(os); }
};

template <typename... Args>
struct DisplayFormatter<Arguments<Args...>>
{
    static void write(std::ostream& os, Arguments<Args...> const& args) { args.write(os); }
};

//=============================================================================
// Structured streaming
//=============================================================================
namespace detail
{
/// Streams a single field or element: as a value, a nested structure or its debug text
template <typename T>
bool streamElement(Stream& stream, T const& element)
{
    if constexpr (ConvertibleToValue<T>)
        return kvlog::toValue(element).stream(stream);
    else if constexpr (Streamable<T>)
        return Value::fromDebug(element).stream(stream);
    else if constexpr (Structurable<T>)
        return Value::fromStructured(element).stream(stream);
    else if constexpr (Debuggable<T>)
        return Value::fromDebug(element).stream(stream);
    else
        static_assert(kAlwaysFalse<T>, "Field type can neither be converted to a Value nor formatted");
}

/// Announces the key of a map entry. Keys that aren't strings are written as text.
template <typename K>
bool streamMapKey(Stream& stream, K const& key)
{
    if constexpr (StringLike<K>)
        return stream.mapKey(std::string_view(key));
    else if constexpr (ConvertibleToValue<K>)
        return stream.mapKey(kvlog::toValue(key).toString());
    else if constexpr (Debuggable<K>)
        return stream.mapKey(Value::fromDebug(key).toString());
    else
        static_assert(kAlwaysFalse<K>, "Map key type can neither be converted to a Value nor formatted");
}

template <typename T>
bool streamStructure(Stream& stream, T const& value)
{
    if constexpr (MapLike<T>)
    {
        std::optional<std::size_t> len;
        if constexpr (std::ranges::sized_range<T const>)
            len = static_cast<std::size_t>(std::ranges::size(value));

        if (! stream.mapBegin(len))
            return false;

        for (auto const& [key, element] : value)
            if (! streamMapKey(stream, key) || ! streamElement(stream, element))
                return false;

        return stream.mapEnd();
    }
    else if constexpr (Sequence<T>)
    {
        std::optional<std::size_t> len;
        if constexpr (std::ranges::sized_range<T const>)
            len = static_cast<std::size_t>(std::ranges::size(value));

        if (! stream.seqBegin(len))
            return false;

        for (auto const& element : value)
            if (! streamElement(stream, element))
                return false;

        return stream.seqEnd();
    }
    else
    {
        auto const names = boost::pfr::names_as_array<T>();

        if (! stream.mapBegin(names.size()))
            return false;

        auto success = true;
        boost::pfr::for_each_field(value, [&stream, &success, &names] (auto const& field, std::size_t idx)
        {
            if (success)
                success = stream.mapKey(names[idx]) && streamElement(stream, field);
        });

        return success && stream.mapEnd();
    }
}

template <typename T>
bool streamErased(void const* object, Stream& stream)
{
    return streamStructure(stream, *static_cast<T const*>(object));
}

template <typename Formatter, typename T>
void writeErased(void const* object, std::ostream& os)
{
    Formatter::write(os, *static_cast<T const*>(object));
}

/// Converts one of the known primitive types without erasing it
template <typename T>
    requires kIsKnownPrimitive<T>
Primitive toPrimitive(T const& v)
{
    if constexpr (is_optional<T>::value)
        return v.has_value() ? toPrimitive(*v) : Primitive();
    else if constexpr (std::same_as<T, std::string>)
        return Primitive(std::string_view(v));
    else if constexpr (std::is_array_v<T>)
        return Primitive(static_cast<char const*>(v));
    else
        return Primitive(v);
}

template <typename... Pairs>
constexpr std::size_t indexOfKey(std::string_view key)
{
    constexpr std::array<std::string_view, sizeof...(Pairs)> keys { Pairs::kName... };

    for (std::size_t i = 0; i < keys.size(); ++i)
        if (keys[i] == key)
            return i;

    return keys.size();
}
} // namespace detail

//=============================================================================
// Value implementations
//=============================================================================
template <ConvertibleToValue T>
Value Value::fromAny(T const& value)
{
    return ToValue<T>::toValue(value);
}

template <Debuggable T>
Value Value::fromDebug(T const& value)
{
    return Value(detail::Inner(detail::DebugCapture { std::addressof(value), &detail::writeErased<DebugFormatter<T>, T>, nullptr }));
}

template <Displayable T>
Value Value::fromDisplay(T const& value)
{
    return Value(detail::Inner(detail::DisplayCapture { std::addressof(value), &detail::writeErased<DisplayFormatter<T>, T>, nullptr }));
}

template <Structurable T>
Value Value::fromStructured(T const& value)
{
    return Value(detail::Inner(detail::StructuredCapture { std::addressof(value), &detail::streamErased<T>, nullptr }));
}

template <Debuggable T>
Value Value::captureDebug(T const& value)
{
    if constexpr (detail::kIsKnownPrimitive<T>)
        return Value(detail::toPrimitive(value));
    else
        return Value(detail::Inner(detail::DebugCapture { std::addressof(value), &detail::writeErased<DebugFormatter<T>, T>, &typeid(T) }));
}

template <Displayable T>
Value Value::captureDisplay(T const& value)
{
    if constexpr (detail::kIsKnownPrimitive<T>)
        return Value(detail::toPrimitive(value));
    else
        return Value(detail::Inner(detail::DisplayCapture { std::addressof(value), &detail::writeErased<DisplayFormatter<T>, T>, &typeid(T) }));
}

template <typename E>
    requires std::derived_from<E, std::exception>
Value Value::captureError(E const& error)
{
    return Value(detail::Inner(detail::ErrorCapture { &error, std::addressof(error), &typeid(E) }));
}

template <Structurable T>
Value Value::captureStructured(T const& value)
{
    return Value(detail::Inner(detail::StructuredCapture { std::addressof(value), &detail::streamErased<T>, &typeid(T) }));
}

template <typename T>
std::optional<T> Value::to() const
{
    auto const c = cast();
    auto const* primitive = std::get_if<Primitive>(&c);

    // an owned string is neither a number nor borrowable
    if (primitive == nullptr)
        return std::nullopt;

    if constexpr (std::is_same_v<T, bool>)
        return primitive->asBool();
    else if constexpr (std::is_same_v<T, char32_t>)
        return primitive->asChar();
    else if constexpr (std::is_same_v<T, std::string_view>)
        return primitive->asStr();
    else if constexpr (std::is_floating_point_v<T>)
    {
        if (auto const v = primitive->asF64())
            return static_cast<T>(*v);

        return std::nullopt;
    }
    else if constexpr (std::is_integral_v<T>)
    {
        switch (primitive->kind())
        {
            case Primitive::Kind::signedInt:   return static_cast<T>(*primitive->asI64());
            case Primitive::Kind::unsignedInt: return static_cast<T>(*primitive->asU64());
            case Primitive::Kind::floating:
            {
                // saturate at 64 bits first, then narrow like any other integer
                using Wide = std::conditional_t<std::is_signed_v<T>, std::int64_t, std::uint64_t>;
                return static_cast<T>(detail::saturatingCast<Wide>(*primitive->asF64()));
            }
            default:                           return std::nullopt;
        }
    }
    else
        static_assert(detail::kAlwaysFalse<T>, "Values can only be converted to arithmetic types, bool, char32_t or std::string_view");
}

template <typename T>
T const* Value::downcastRef() const
{
    return std::visit([] <typename Capture> (Capture const& capture) -> T const*
    {
        if constexpr (requires (Capture const& c) { c.type; c.object; })
        {
            if (capture.type != nullptr && *capture.type == typeid(T))
                return static_cast<T const*>(capture.object);
        }

        return nullptr;
    }, inner);
}

//=============================================================================
// Slot implementations
//=============================================================================
template <ConvertibleToValue T>
bool Slot::fillAny(T const& value)
{
    return fillValue(kvlog::toValue(value));
}

template <Debuggable T>
bool Slot::fillDebug(T const& value)
{
    return fillValue(Value::fromDebug(value));
}

template <Displayable T>
bool Slot::fillDisplay(T const& value)
{
    return fillValue(Value::fromDisplay(value));
}

template <Structurable T>
bool Slot::fillStructured(T const& value)
{
    return fillValue(Value::fromStructured(value));
}

template <typename Lambda>
    requires std::is_invocable_r_v<bool, Lambda const&, Slot&>
FillFn<std::decay_t<Lambda>> makeFill(Lambda && lambda)
{
    return FillFn<std::decay_t<Lambda>>(std::forward<Lambda>(lambda));
}

//=============================================================================
// Error chains
//=============================================================================
template <std::invocable<std::exception const&> Lambda>
void visitErrorChain(std::exception const& e, Lambda && lambda)
{
    lambda(e);

    auto const* nested = dynamic_cast<std::nested_exception const*>(&e);
    if (nested == nullptr || nested->nested_ptr() == nullptr)
        return;

    try
    {
        nested->rethrow_nested();
    }
    catch (std::exception const& cause)
    {
        visitErrorChain(cause, lambda);
    }
}

//=============================================================================
// ToValue specializations
//=============================================================================
namespace detail
{
/// Captures a referenced object, preferring the cheapest representation that keeps its type
template <typename T>
Value referencedToValue(T const& value)
{
    if constexpr (ConvertibleToValue<T>)
        return kvlog::toValue(value);
    else if constexpr (Streamable<T>)
        return Value::captureDebug(value);
    else if constexpr (Structurable<T>)
        return Value::captureStructured(value);
    else
        return Value::captureDebug(value);
}

template <typename T>
concept Referenceable = ConvertibleToValue<T> || Streamable<T> || Structurable<T> || Debuggable<T>;
} // namespace detail

template <detail::PrimitiveSource T>
struct ToValue<T>
{
    static Value toValue(T const& v) { return Value(v); }
};

template <>
struct ToValue<std::string>
{
    static Value toValue(std::string const& v) { return Value(v); }
};

template <std::size_t N>
struct ToValue<char[N]>
{
    static Value toValue(char const (&v)[N]) { return Value(static_cast<char const*>(v)); }
};

template <ConvertibleToValue T>
struct ToValue<std::optional<T>>
{
    static Value toValue(std::optional<T> const& v) { return v.has_value() ? kvlog::toValue(*v) : Value(); }
};

template <>
struct ToValue<std::nullopt_t>
{
    static Value toValue(std::nullopt_t) { return {}; }
};

template <>
struct ToValue<std::monostate>
{
    static Value toValue(std::monostate) { return {}; }
};

template <>
struct ToValue<None>
{
    static Value toValue(None) { return {}; }
};

template <>
struct ToValue<Primitive>
{
    static Value toValue(Primitive const& v) { return Value(v); }
};

template <>
struct ToValue<Value>
{
    static Value toValue(Value const& v) { return v; }
};

template <typename T>
    requires detail::Referenceable<std::remove_const_t<T>>
struct ToValue<std::reference_wrapper<T>>
{
    static Value toValue(std::reference_wrapper<T> const& v) { return detail::referencedToValue<std::remove_const_t<T>>(v.get()); }
};

template <typename T>
    requires detail::Referenceable<std::remove_const_t<T>>
struct ToValue<std::unique_ptr<T>>
{
    static Value toValue(std::unique_ptr<T> const& p)
    {
        if (p == nullptr)
            return {};

        return detail::referencedToValue<std::remove_const_t<T>>(*p);
    }
};

template <typename T>
    requires detail::Referenceable<std::remove_const_t<T>>
struct ToValue<std::shared_ptr<T>>
{
    static Value toValue(std::shared_ptr<T> const& p)
    {
        if (p == nullptr)
            return {};

        return detail::referencedToValue<std::remove_const_t<T>>(*p);
    }
};

template <typename... Args>
struct ToValue<Arguments<Args...>>
{
    static Value toValue(Arguments<Args...> const& args) { return Value::fromDebug(args); }
};

template <>
struct ToValue<std::error_code>
{
    static Value toValue(std::error_code const& ec) { return Value::fromDisplay(ec); }
};

template <ConvertibleToValue T>
Value toValue(T const& value)
{
    return ToValue<T>::toValue(value);
}

//=============================================================================
// Arguments implementations
//=============================================================================
template <typename... Args>
void Arguments<Args...>::write(std::ostream& os) const
{
    std::apply([this, &os] (Args const&... a)
    {
        std::vformat_to(std::ostreambuf_iterator<char>(os), fmt, std::make_format_args(a...));
    }, args);
}

template <typename... Args>
std::string Arguments<Args...>::toString() const
{
    std::ostringstream ss;
    write(ss);
    return ss.str();
}

template <typename... Args>
Arguments<Args...> formatArgs(std::format_string<Args const&...> fmt, Args const&... args)
{
    return Arguments<Args...>(fmt.get(), args...);
}

//=============================================================================
// operator""_key implementation
//=============================================================================
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#ifdef __clang__
#    pragma GCC diagnostic ignored "-Wgnu-string-literal-operator-template"
#endif
template <typename T, T... chars>
constexpr StaticKey<fixstr::fixed_string<sizeof...(chars)>({chars...})> operator""_key()
{
    return { };
}
#pragma GCC diagnostic pop

//=============================================================================
// Source implementations
//=============================================================================
template <fixstr::fixed_string Name, ConvertibleToValue T>
std::optional<Value> Pair<Name, T>::get(Key k) const
{
    if (k != key())
        return std::nullopt;

    return value();
}

template <fixstr::fixed_string Name, typename T>
    requires ConvertibleToValue<std::decay_t<T>>
Pair<Name, std::decay_t<T>> kv(T && value)
{
    return Pair<Name, std::decay_t<T>>(std::forward<T>(value));
}

template <typename... Pairs>
bool KeyValues<Pairs...>::visit(SourceVisitor& visitor) const
{
    return std::apply([&visitor] (auto const&... pair) { return (pair.visit(visitor) && ...); }, pairs);
}

template <typename... Pairs>
std::optional<Value> KeyValues<Pairs...>::get(Key key) const
{
    std::optional<Value> result;

    std::apply([&result, key] (auto const&... pair)
    {
        // first match wins
        (void) ((pair.key() == key && (result = pair.value(), true)) || ...);
    }, pairs);

    return result;
}

template <typename... Pairs>
template <fixstr::fixed_string Name>
Value KeyValues<Pairs...>::get() const
{
    static constexpr auto kIndex = detail::indexOfKey<Pairs...>(std::string_view(Name));
    static_assert(kIndex < sizeof...(Pairs), "There is no pair with this key");

    return std::get<kIndex>(pairs).value();
}

template <typename... Pairs>
KeyValues<std::decay_t<Pairs>...> keyValues(Pairs && ... pairs)
{
    return KeyValues<std::decay_t<Pairs>...>(std::forward<Pairs>(pairs)...);
}

} // namespace kvlog
