/**
 * @file kvlog.hpp
 * @brief Structured key-value capture for a logging facade
 *
 * This file implements the value capture and visitation core that lets a caller
 * attach arbitrary typed values to a log record. A captured value is a cheap,
 * copyable handle that borrows the caller's data for the duration of a single
 * log call. It supports:
 *   - Zero-allocation capture of integers, floats, booleans, characters and strings
 *   - Type-erased capture of anything formattable (debug or display), of
 *     std::exception errors and of aggregates reflected with Boost.PFR
 *   - Deferred capture via the Fill/Slot protocol
 *   - Single-dispatch visitation with a Visitor
 *   - Cheap coercion back to primitive types and downcasting to the captured type
 *
 * Usage example:
 *   struct Point { float x; float y; };
 *
 *   Point origin { 0.0f, 0.0f };
 *   auto kvs = keyValues(kv<"count">(42), kv<"origin">(std::cref(origin)));
 *
 *   kvs("count"_key).toU8();           // std::optional<std::uint8_t> { 42 }
 *   std::cout << kvs;                  // {count: 42, origin: {x: 0, y: 0}}
 *
 * @note A Value never owns what it refers to. It must not outlive the log call
 *       (or more generally the objects) it was created from.
 */

#pragma once

#ifndef KVLOG_STATIC_MAX_LEVEL
 #define KVLOG_STATIC_MAX_LEVEL trace
#endif

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <format>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <source_location>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <typeinfo>
#include <utility>
#include <variant>
#include "fixed_string.hpp"
#include "CxxUtilities.hpp"
#include "kvlog_detail.hpp"

namespace kvlog
{

// Forward declarations
class Value;
class Visitor;
class Stream;
class Slot;
class Source;
template <typename T> struct ToValue;

/// The empty primitive, announced through Visitor::none()
struct None
{
    friend constexpr bool operator==(None, None) noexcept { return true; }
};

//=============================================================================
// Primitive
//=============================================================================

/**
 * @brief A copyable, non-owning scalar
 *
 * Primitive represents the closed set of scalar kinds that most logged values
 * fall into, without any type erasure. Construction from native types widens
 * losslessly:
 *   - signed integers to std::int64_t
 *   - unsigned integers to std::uint64_t
 *   - float and double to double
 *   - all character types to char32_t
 *   - string views and C strings to a borrowed std::string_view
 *
 * A null C string is captured as None.
 */
class Primitive
{
public:
    /// The kind of scalar held. The order matches the variant's alternatives.
    enum class Kind
    {
        none,
        signedInt,
        unsignedInt,
        floating,
        boolean,
        character,
        string
    };

    /// Default constructor - creates a None primitive
    constexpr Primitive() = default;

    constexpr Primitive(None) {}

    template <detail::SignedInteger T>
    constexpr Primitive(T v) : storage(std::in_place_type<std::int64_t>, static_cast<std::int64_t>(v)) {}

    template <detail::UnsignedInteger T>
    constexpr Primitive(T v) : storage(std::in_place_type<std::uint64_t>, static_cast<std::uint64_t>(v)) {}

    template <detail::FloatingPoint T>
    constexpr Primitive(T v) : storage(std::in_place_type<double>, static_cast<double>(v)) {}

    template <detail::Boolean T>
    constexpr Primitive(T v) : storage(std::in_place_type<bool>, v) {}

    template <detail::Character T>
    constexpr Primitive(T v) : storage(std::in_place_type<char32_t>, detail::toChar32(v)) {}

    constexpr Primitive(std::string_view v) : storage(std::in_place_type<std::string_view>, v) {}

    constexpr Primitive(char const* v)
    {
        if (v != nullptr)
            storage.emplace<std::string_view>(v);
    }

    /// Returns which scalar kind is held
    constexpr Kind kind() const noexcept { return static_cast<Kind>(storage.index()); }

    /// Returns true if this is the None primitive
    constexpr bool isNone() const noexcept { return kind() == Kind::none; }

    /**
     * @brief Numeric conversions
     *
     * These are cross-kind permissive: any numeric kind converts to any other
     * following native static_cast semantics (float to integer truncates towards
     * zero and saturates at the bounds). Non-numeric kinds yield an empty optional.
     */
    std::optional<std::uint64_t> asU64() const noexcept;
    std::optional<std::int64_t>  asI64() const noexcept;
    std::optional<double>        asF64() const noexcept;

    /// Exact kind conversions
    std::optional<bool>             asBool() const noexcept;
    std::optional<char32_t>         asChar() const noexcept;
    std::optional<std::string_view> asStr()  const noexcept;

    /**
     * @brief Announce this primitive to a visitor
     *
     * Exactly one visitor method is called. Strings are announced through
     * Visitor::borrowedStr as they outlive the visit.
     *
     * @return The visitor's result
     */
    bool visit(Visitor& visitor) const;

    friend bool operator==(Primitive const&, Primitive const&) = default;

private:
    std::variant<None, std::int64_t, std::uint64_t, double, bool, char32_t, std::string_view> storage;
};

//=============================================================================
// Formatting capabilities
//=============================================================================

/**
 * @brief A value that can be written in its debug representation
 *
 * Visitors receive this interface from Visitor::debug() for values whose
 * concrete type was erased.
 */
class Debug
{
public:
    virtual ~Debug() = default;

    /// Write the debug representation to os
    virtual void write(std::ostream& os) const = 0;

    /// Returns the debug representation as a string
    std::string toString() const;
};

/**
 * @brief A value that can be written in its user-facing representation
 *
 * Visitors receive this interface from Visitor::display().
 */
class Display
{
public:
    virtual ~Display() = default;

    /// Write the display representation to os
    virtual void write(std::ostream& os) const = 0;

    /// Returns the display representation as a string
    std::string toString() const;
};

/**
 * @brief Customization point for debug formatting
 *
 * Specialize this for your type to make it Debuggable:
 * @code
 * template <>
 * struct kvlog::DebugFormatter<Widget>
 * {
 *     static void write(std::ostream& os, Widget const& w) { os << "Widget(" << w.id << ")"; }
 * };
 * @endcode
 *
 * Out of the box, scalars are written the way a debugger would show them (strings
 * and characters quoted), anything with an operator<< uses it, and aggregates or
 * ranges without one are written structurally, e.g. {x: 1, y: 2} or [1, 2].
 */
template <typename T>
struct DebugFormatter {};

/**
 * @brief Customization point for display formatting
 *
 * Anything with an operator<< or a std::formatter is Displayable out of the box.
 */
template <typename T>
struct DisplayFormatter {};

template <typename T>
concept Debuggable = requires (std::ostream& os, T const& v) { DebugFormatter<T>::write(os, v); };

template <typename T>
concept Displayable = requires (std::ostream& os, T const& v) { DisplayFormatter<T>::write(os, v); };

/// Types that can be captured with Value::fromStructured(): reflectable aggregates and ranges
template <typename T>
concept Structurable = detail::Reflectable<T> || detail::Sequence<T>;

/**
 * @brief A value from the structured-value integration
 *
 * A structured value streams its structure (maps, sequences and leaves) into a
 * Stream. Reflectable aggregates become maps of field name to field value and
 * ranges become sequences.
 */
class Structured
{
public:
    virtual ~Structured() = default;

    /// Stream this value's structure. Returns false if the stream failed.
    virtual bool stream(Stream& stream) const = 0;
};

//=============================================================================
// Visitor
//=============================================================================

/**
 * @brief The callback surface a Value announces itself through
 *
 * Visiting a Value calls exactly one of these methods, exactly once,
 * synchronously. Every method returns true on success. A false return signals a
 * formatting failure and is propagated out of Value::visit().
 *
 * Implementers must handle the scalar kinds and debug(). The remaining methods
 * have defaults that fall back to debug():
 *   - display() writes the display representation through debug()
 *   - error() displays the exception's message (and its nested causes)
 *   - structured() writes the structure through debug()
 *   - borrowedStr() forwards to str()
 */
class Visitor
{
public:
    virtual ~Visitor() = default;

    virtual bool signedInt(std::int64_t v) = 0;
    virtual bool unsignedInt(std::uint64_t v) = 0;
    virtual bool floating(double v) = 0;
    virtual bool boolean(bool v) = 0;
    virtual bool character(char32_t v) = 0;

    /// A string that is only valid for the duration of this call
    virtual bool str(std::string_view v) = 0;

    /**
     * @brief A string that stays valid for as long as the visited Value's referent
     *
     * Visitors that want to keep a reference to the string beyond this call
     * (without copying it) can override this.
     */
    virtual bool borrowedStr(std::string_view v) { return str(v); }

    virtual bool none() = 0;

    /// Mandatory fallback for values whose type was erased
    virtual bool debug(Debug const& v) = 0;

    virtual bool display(Display const& v);
    virtual bool error(std::exception const& e);
    virtual bool structured(Structured const& v);
};

/**
 * @brief A Visitor that also receives the structure of structured values
 *
 * Leaves arrive through the ordinary Visitor methods. A map announces
 * mapBegin(), then for every entry mapKey() followed by exactly one value, and
 * finally mapEnd(). A sequence announces seqBegin(), its elements and seqEnd().
 * Nested structured values recurse through structured().
 */
class Stream : public Visitor
{
public:
    virtual bool mapBegin(std::optional<std::size_t> len) = 0;
    virtual bool mapKey(std::string_view key) = 0;
    virtual bool mapEnd() = 0;

    virtual bool seqBegin(std::optional<std::size_t> len) = 0;
    virtual bool seqEnd() = 0;

    bool structured(Structured const& v) override { return v.stream(*this); }
};

//=============================================================================
// Errors
//=============================================================================

/**
 * @brief Thrown when a Slot is filled more than once
 *
 * This is a bug in the Fill implementation, not a data condition.
 */
class FillError : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

/**
 * @brief Walks an exception and its std::nested_exception causes
 *
 * The lambda is called with the outermost exception first. A cause that is not
 * derived from std::exception is rethrown to the caller.
 *
 * @param lambda Callable taking std::exception const&
 */
template <std::invocable<std::exception const&> Lambda>
void visitErrorChain(std::exception const& e, Lambda && lambda);

//=============================================================================
// Fill and Slot
//=============================================================================

/**
 * @brief A value whose representation is decided while it is being visited
 *
 * Fill bridges code that cannot pick a representation until it holds a visitor,
 * e.g. adapters from other logging ecosystems. Implementations fill the slot they
 * are given exactly once.
 *
 * @code
 * struct FillSigned : kvlog::Fill
 * {
 *     bool fill(kvlog::Slot& slot) const override { return slot.fillAny(42); }
 * };
 *
 * FillSigned filler;
 * auto value = Value::fromFill(filler);
 * value.toI32();   // 42
 * @endcode
 */
class Fill
{
public:
    virtual ~Fill() = default;

    /// Fill the slot. Returns false if the underlying visitor failed.
    virtual bool fill(Slot& slot) const = 0;
};

template <typename T>
concept ConvertibleToValue = requires (T const& v) { { ToValue<T>::toValue(v) } -> std::same_as<Value>; };

/**
 * @brief A one-shot handle to the visitor a Fill is being visited with
 *
 * Every fill method forwards to the single visitor call appropriate to its kind.
 * Only one fill method may be called per slot: the second throws FillError
 * before reaching the visitor.
 *
 * Values filled through a slot are assumed to be short lived. Strings are
 * therefore announced through Visitor::str() and never Visitor::borrowedStr().
 */
class Slot
{
public:
    Slot(Slot const&) = delete;
    Slot& operator=(Slot const&) = delete;

    /// Fill with anything that converts to a Value
    template <ConvertibleToValue T>
    bool fillAny(T const& value);

    /// Fill with a primitive
    bool fillPrimitive(Primitive value);

    /// Fill with a debuggable value
    template <Debuggable T>
    bool fillDebug(T const& value);

    /// Fill with a displayable value
    template <Displayable T>
    bool fillDisplay(T const& value);

    /// Fill with an error
    bool fillError(std::exception const& e);

    /// Fill with a structured value
    template <Structurable T>
    bool fillStructured(T const& value);

    /// Returns true once a fill method has been called
    bool isFilled() const noexcept { return filled; }

private:
    friend class Value;

    explicit Slot(Visitor& visitor_) : visitor(visitor_) {}

    bool fillValue(Value const& value);

    Visitor& visitor;
    bool filled = false;
};

/**
 * @brief Adapts a callable taking Slot& into a Fill
 *
 * @see makeFill
 */
template <typename Lambda>
class FillFn : public Fill
{
public:
    explicit FillFn(Lambda lambda_) : lambda(std::move(lambda_)) {}

    bool fill(Slot& slot) const override { return std::invoke(lambda, slot); }

private:
    Lambda lambda;
};

/// Creates a FillFn. The result must outlive any Value created from it.
template <typename Lambda>
    requires std::is_invocable_r_v<bool, Lambda const&, Slot&>
FillFn<std::decay_t<Lambda>> makeFill(Lambda && lambda);

//=============================================================================
// Capture representation
//=============================================================================
namespace detail
{
/*
 * The erasure boundary. Every non-primitive capture holds a pointer to the
 * caller's object together with the function that knows its concrete type.
 * The function pointers are instantiated from the same template argument as the
 * object pointer, so the object is always cast back to the type it came from.
 *
 * type is only recorded by the capture* constructors and enables downcasting.
 */
struct FillCapture
{
    Fill const* fill;
};

struct DebugCapture
{
    void const* object;
    void (*write)(void const*, std::ostream&);
    std::type_info const* type;
};

struct DisplayCapture
{
    void const* object;
    void (*write)(void const*, std::ostream&);
    std::type_info const* type;
};

struct ErrorCapture
{
    std::exception const* error;
    void const* object;
    std::type_info const* type;
};

struct StructuredCapture
{
    void const* object;
    bool (*stream)(void const*, Stream&);
    std::type_info const* type;
};

using Inner = std::variant<Primitive, FillCapture, DebugCapture, DisplayCapture, ErrorCapture, StructuredCapture>;

/// The result of casting a value: a primitive or a string that had to be copied
using Cast = std::variant<Primitive, std::string>;
} // namespace detail

//=============================================================================
// Text
//=============================================================================

/**
 * @brief A string that is either borrowed from the captured value or owned
 *
 * Returned by Value::toStr(). The string is only owned if it could not be
 * borrowed, e.g. because it was produced by a Fill.
 */
class Text
{
public:
    explicit Text(std::string_view borrowed) : storage(std::in_place_type<std::string_view>, borrowed) {}
    explicit Text(std::string owned) : storage(std::in_place_type<std::string>, std::move(owned)) {}

    /// Returns true if the string is borrowed from the captured value
    bool isBorrowed() const noexcept { return std::holds_alternative<std::string_view>(storage); }

    /// Returns a view of the string (into this object if it is owned)
    std::string_view view() const noexcept;

    operator std::string_view() const noexcept { return view(); }

    friend bool operator==(Text const& a, std::string_view b) noexcept { return a.view() == b; }

private:
    std::variant<std::string_view, std::string> storage;
};

//=============================================================================
// ToValue
//=============================================================================

/**
 * @brief Customization point that lets a type produce a Value borrowing itself
 *
 * Specialize this for your type to make it ConvertibleToValue:
 * @code
 * template <>
 * struct kvlog::ToValue<UserId>
 * {
 *     static Value toValue(UserId const& id) { return Value(id.raw); }
 * };
 * @endcode
 *
 * Specializations ship for all native scalars, the standard string types,
 * std::optional, smart pointers, std::reference_wrapper, std::error_code,
 * Arguments and Value itself.
 */
template <typename T>
struct ToValue {};

/// Converts anything ConvertibleToValue into a Value borrowing it
template <ConvertibleToValue T>
Value toValue(T const& value);

//=============================================================================
// Value
//=============================================================================

/**
 * @brief A captured value in a structured key-value pair
 *
 * There are a few ways to capture a value:
 *   - Implicit construction from primitives and strings: Value(42), Value("text")
 *   - The ToValue customization point: toValue(x)
 *   - Value::from*: cheap, works with any object but can't be downcast later
 *   - Value::capture*: turns known primitive types into primitives, otherwise
 *     records the type so that the value can be downcast later
 *   - Value::fromFill: defers the decision to visit time
 *
 * @code
 * int answer = 42;
 * Value::captureDebug(answer).toI32();   // 42: captured as a primitive
 * Value::fromDebug(answer).toI32();      // std::nullopt: only debug-formattable
 *
 * Widget w;
 * Value::captureDebug(w).downcastRef<Widget>();   // &w
 * Value::fromDebug(w).downcastRef<Widget>();      // nullptr
 * @endcode
 *
 * A Value is immutable and cheap to copy: copies share the referent. It borrows
 * its referent and must not outlive it.
 */
class Value
{
public:
    /// Default constructor - creates a None value
    Value() = default;

    Value(Primitive value) : inner(value) {}

    template <detail::PrimitiveSource T>
    Value(T value) : inner(Primitive(value)) {}

    /// Borrows the string's buffer
    Value(std::string const& value) : inner(Primitive(std::string_view(value))) {}

    /// A Value can't borrow from a temporary string
    Value(std::string&&) = delete;

    /// Get a value from anything ConvertibleToValue
    template <ConvertibleToValue T>
    static Value fromAny(T const& value);

    /**
     * @brief Get a value from a debuggable type
     *
     * The value is always captured as debug-formattable, even if it is a
     * primitive: coercions will yield nothing and downcasting is not supported.
     */
    template <Debuggable T>
    static Value fromDebug(T const& value);

    /// Get a value from a displayable type. See fromDebug().
    template <Displayable T>
    static Value fromDisplay(T const& value);

    /// Get a value from an error. Downcasting is not supported.
    static Value fromError(std::exception const& error);

    /// Get a value from a structured type. Downcasting is not supported.
    template <Structurable T>
    static Value fromStructured(T const& value);

    /// Get a value that is filled when it is visited
    static Value fromFill(Fill const& fill);

    /**
     * @brief Capture a debuggable value
     *
     * If T is one of the known primitive types (native scalars, strings or an
     * std::optional of them) it is captured as a primitive and Debug is never
     * invoked. Otherwise the value is captured as debug-formattable together with
     * its type, so that downcastRef<T>() can recover it.
     */
    template <Debuggable T>
    static Value captureDebug(T const& value);

    /// Capture a displayable value. See captureDebug().
    template <Displayable T>
    static Value captureDisplay(T const& value);

    /// Capture an error so that downcastRef<E>() can recover it
    template <typename E>
        requires std::derived_from<E, std::exception>
    static Value captureError(E const& error);

    /// Capture a structured value so that downcastRef<T>() can recover it
    template <Structurable T>
    static Value captureStructured(T const& value);

    // Values may not borrow from temporaries
    template <typename T> static Value fromAny(T const&&) = delete;
    template <typename T> static Value fromDebug(T const&&) = delete;
    template <typename T> static Value fromDisplay(T const&&) = delete;
    template <typename T> static Value fromStructured(T const&&) = delete;
    template <typename T> static Value captureDebug(T const&&) = delete;
    template <typename T> static Value captureDisplay(T const&&) = delete;
    template <typename T> static Value captureError(T const&&) = delete;
    template <typename T> static Value captureStructured(T const&&) = delete;
    static Value fromError(std::exception const&&) = delete;
    static Value fromFill(Fill const&&) = delete;

    /**
     * @brief Visit the value
     *
     * Calls exactly one method of the visitor, once. A Fill is filled with a
     * fresh Slot wrapping the visitor.
     *
     * @return false if the visitor (or a formatter it invoked) failed
     */
    bool visit(Visitor& visitor) const;

    /**
     * @brief Present the value as a node of a structured stream
     *
     * Primitives and formattable values arrive as leaves, structured values
     * announce their maps and sequences.
     */
    bool stream(Stream& stream) const;

    /**
     * @brief Try to get the value as a T
     *
     * T may be any native arithmetic or character type, bool or
     * std::string_view. Numeric conversions are cross-kind permissive: a value
     * captured as -1 converts to std::uint32_t(-1), 1.9 converts to the integer 1.
     *
     * This is cheap for primitives, but runs a visit (and possibly a Fill) for
     * everything else. Values that are only formattable yield nothing.
     */
    template <typename T>
    std::optional<T> to() const;

    std::optional<std::uint8_t>  toU8()    const { return to<std::uint8_t>(); }
    std::optional<std::uint16_t> toU16()   const { return to<std::uint16_t>(); }
    std::optional<std::uint32_t> toU32()   const { return to<std::uint32_t>(); }
    std::optional<std::uint64_t> toU64()   const { return to<std::uint64_t>(); }
    std::optional<std::size_t>   toUsize() const { return to<std::size_t>(); }

    std::optional<std::int8_t>    toI8()    const { return to<std::int8_t>(); }
    std::optional<std::int16_t>   toI16()   const { return to<std::int16_t>(); }
    std::optional<std::int32_t>   toI32()   const { return to<std::int32_t>(); }
    std::optional<std::int64_t>   toI64()   const { return to<std::int64_t>(); }
    std::optional<std::ptrdiff_t> toIsize() const { return to<std::ptrdiff_t>(); }

    std::optional<float>  toF32() const { return to<float>(); }
    std::optional<double> toF64() const { return to<double>(); }

    std::optional<bool>     toBool() const { return to<bool>(); }
    std::optional<char32_t> toChar() const { return to<char32_t>(); }

    /// Returns the string if it is borrowed from the referent. Never allocates.
    std::optional<std::string_view> toBorrowedStr() const { return to<std::string_view>(); }

    /**
     * @brief Returns the string, copying it if it can't be borrowed
     *
     * A string that a visit only announced through Visitor::str() (such as one
     * filled into a Slot) is copied into the returned Text.
     */
    std::optional<Text> toStr() const;

    /**
     * @brief Try to recover the captured object
     *
     * Only values created with the capture* constructors remember their type.
     *
     * @return Pointer to the captured object or nullptr if T does not match
     */
    template <typename T>
    T const* downcastRef() const;

    /// Returns true if downcastRef<T>() would succeed
    template <typename T>
    bool is() const { return downcastRef<T>() != nullptr; }

    /// Returns the formatted value, as written by operator<<
    std::string toString() const;

private:
    explicit Value(detail::Inner inner_) : inner(inner_) {}

    detail::Cast cast() const;

    detail::Inner inner;
};

//=============================================================================
// Deferred format arguments
//=============================================================================

/**
 * @brief A std::format call that is only evaluated when the value is written
 *
 * Holds references to its arguments, so it must not outlive them.
 *
 * @see formatArgs
 */
template <typename... Args>
class Arguments
{
public:
    explicit Arguments(std::string_view fmt_, Args const&... args_) : fmt(fmt_), args(args_...) {}

    /// Format into os without an intermediate string
    void write(std::ostream& os) const;

    /// Format into a string
    std::string toString() const;

private:
    std::string_view fmt;
    std::tuple<Args const&...> args;
};

/**
 * @brief Creates a deferred, compile-time checked std::format call
 *
 * @code
 * auto message = formatArgs("user {} logged in after {} attempts", name, attempts);
 * Record record({Level::info, "auth"}, toValue(message));
 * @endcode
 */
template <typename... Args>
Arguments<Args...> formatArgs(std::format_string<Args const&...> fmt, Args const&... args);

//=============================================================================
// Keys and sources
//=============================================================================

/// A key in a key-value pair. Borrows its string.
class Key
{
public:
    constexpr Key(std::string_view key_) : key(key_) {}
    constexpr Key(char const* key_) : key(key_) {}

    constexpr std::string_view asStr() const noexcept { return key; }

    friend constexpr bool operator==(Key, Key) noexcept = default;
    friend constexpr auto operator<=>(Key, Key) noexcept = default;

private:
    std::string_view key;
};

/**
 * @brief Compile-time key, created with the "_key" literal
 *
 * @tparam Name The compile-time fixed string representing the key
 */
template <fixstr::fixed_string Name>
struct StaticKey
{
    static constexpr std::string_view kName = std::string_view(Name);

    constexpr operator Key() const noexcept { return Key(kName); }
};

/**
 * @brief User-defined literal for compile-time keys
 *
 * @code
 * auto kvs = keyValues(kv<"user">(userId));
 * kvs("user"_key).toU64();
 * @endcode
 */
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#ifdef __clang__
#    pragma GCC diagnostic ignored "-Wgnu-string-literal-operator-template"
#endif
template <typename T, T... chars>
constexpr StaticKey<fixstr::fixed_string<sizeof...(chars)>({chars...})> operator""_key();
#pragma GCC diagnostic pop

/// Receives the key-value pairs of a Source
class SourceVisitor
{
public:
    virtual ~SourceVisitor() = default;

    /// Visit a pair. Returning false stops the visit.
    virtual bool visitPair(Key key, Value const& value) = 0;
};

/**
 * @brief A source of key-value pairs
 *
 * A source may be a single pair, a set of pairs or a combination of sources. It
 * does not guarantee ordering or uniqueness of keys, but yields the same pairs to
 * every visitor.
 */
class Source
{
public:
    virtual ~Source() = default;

    /// Visit all pairs. Stops early and returns false if the visitor fails.
    virtual bool visit(SourceVisitor& visitor) const = 0;

    /**
     * @brief Get the value of the first pair with the given key
     *
     * Sources that can look keys up more efficiently override this.
     */
    virtual std::optional<Value> get(Key key) const;

    /// Count the pairs a visit yields
    virtual std::size_t count() const;

    /// A source without any pairs
    static Source const& empty();
};

/**
 * @brief A single key-value pair with a compile-time key
 *
 * The pair owns a copy of its value, so pass std::cref() to borrow large objects.
 *
 * @tparam Name Compile-time key
 * @tparam T The value type (must be ConvertibleToValue)
 */
template <fixstr::fixed_string Name, ConvertibleToValue T>
class Pair : public Source
{
public:
    static constexpr std::string_view kName = std::string_view(Name);

    explicit Pair(T value_) : underlying(std::move(value_)) {}

    static constexpr Key key() noexcept { return Key(kName); }
    Value value() const { return toValue(underlying); }

    bool visit(SourceVisitor& visitor) const override { return visitor.visitPair(key(), value()); }
    std::optional<Value> get(Key k) const override;
    std::size_t count() const override { return 1; }

private:
    T underlying;
};

/// Creates a Pair. kv<"user">(id)
template <fixstr::fixed_string Name, typename T>
    requires ConvertibleToValue<std::decay_t<T>>
Pair<Name, std::decay_t<T>> kv(T && value);

/**
 * @brief A fixed set of compile-time keyed pairs
 *
 * Pairs are stored in a tuple, so no allocation takes place. Keys can be looked
 * up at compile-time with get<"name">() or operator()("name"_key).
 */
template <typename... Pairs>
class KeyValues : public Source
{
public:
    explicit KeyValues(Pairs... pairs_) : pairs(std::move(pairs_)...) {}

    bool visit(SourceVisitor& visitor) const override;
    std::optional<Value> get(Key key) const override;
    std::size_t count() const override { return sizeof...(Pairs); }

    /// Compile-time lookup. Fails to compile if there is no pair with this key.
    template <fixstr::fixed_string Name>
    Value get() const;

    template <fixstr::fixed_string Name>
    Value operator()(StaticKey<Name>) const { return get<Name>(); }

private:
    std::tuple<Pairs...> pairs;
};

/// Creates KeyValues from Pairs
template <typename... Pairs>
KeyValues<std::decay_t<Pairs>...> keyValues(Pairs && ... pairs);

/// A source over a runtime list of pairs
class PairList : public Source
{
public:
    explicit PairList(std::span<std::pair<Key, Value> const> pairs_) : pairs(pairs_) {}

    bool visit(SourceVisitor& visitor) const override;
    std::optional<Value> get(Key key) const override;
    std::size_t count() const override { return pairs.size(); }

private:
    std::span<std::pair<Key, Value> const> pairs;
};

/// Two sources visited one after the other
class Chain : public Source
{
public:
    Chain(Source const& first_, Source const& second_) : first(first_), second(second_) {}

    bool visit(SourceVisitor& visitor) const override;
    std::optional<Value> get(Key key) const override;
    std::size_t count() const override;

private:
    Source const& first;
    Source const& second;
};

/**
 * @brief Present a whole source as a map to a structured stream
 *
 * Emits mapBegin(count), then mapKey and the value for each pair, then mapEnd().
 */
bool streamSource(Source const& source, Stream& stream);

//=============================================================================
// Records and the Log interface
//=============================================================================

/// The severity of a record. Lower is more severe.
enum class Level
{
    error = 1,
    warn,
    info,
    debug,
    trace
};

/// A threshold for records. off lets nothing through.
enum class LevelFilter
{
    off,
    error,
    warn,
    info,
    debug,
    trace
};

constexpr bool operator==(Level a, LevelFilter b) noexcept { return static_cast<int>(a) == static_cast<int>(b); }
constexpr auto operator<=>(Level a, LevelFilter b) noexcept { return static_cast<int>(a) <=> static_cast<int>(b); }

/// The compile-time maximum level, configured with KVLOG_STATIC_MAX_LEVEL
inline constexpr LevelFilter kStaticMaxLevel = LevelFilter::KVLOG_STATIC_MAX_LEVEL;

/// Returns "ERROR", "WARN", "INFO", "DEBUG" or "TRACE"
std::string_view toString(Level level) noexcept;

/// Returns "OFF" or the name of the corresponding Level
std::string_view toString(LevelFilter filter) noexcept;

/// Information about a record that is known before its contents are formatted
struct Metadata
{
    Level level;
    std::string_view target;
};

/**
 * @brief A log record
 *
 * A record borrows its message and key-values for the duration of the log call.
 */
class Record
{
public:
    Record(Metadata metadata_, Value message_,
           Source const& keyValues_ = Source::empty(),
           std::source_location location_ = std::source_location::current())
        : meta(metadata_), msg(message_), kvs(keyValues_), loc(location_)
    {}

    Metadata const& metadata() const noexcept { return meta; }
    Level level() const noexcept { return meta.level; }
    std::string_view target() const noexcept { return meta.target; }
    Value const& message() const noexcept { return msg; }
    Source const& keyValues() const noexcept { return kvs; }
    std::source_location const& location() const noexcept { return loc; }

private:
    Metadata meta;
    Value msg;
    Source const& kvs;
    std::source_location loc;
};

/// A logger backend
class Log
{
public:
    virtual ~Log() = default;

    /// Returns true if a record with this metadata would be logged
    virtual bool enabled(Metadata const& metadata) const = 0;

    /// Log the record. Implementations should check enabled() themselves.
    virtual void log(Record const& record) = 0;

    virtual void flush() {}
};

/**
 * @brief Hand a record to a logger if it passes the static and dynamic filters
 *
 * @return true if the record was handed to the logger
 */
bool log(Log& logger, Record const& record);

// Stream output operators
std::ostream& operator<<(std::ostream& o, Value const& v);
std::ostream& operator<<(std::ostream& o, Source const& s);
std::ostream& operator<<(std::ostream& o, Level level);
std::ostream& operator<<(std::ostream& o, LevelFilter filter);
} // namespace kvlog

// std::formatter specializations
template <>
struct std::formatter<kvlog::Value> : std::formatter<std::string>
{
    auto format(kvlog::Value const& v, format_context& ctx) const
    {
        return std::formatter<std::string>::format(v.toString(), ctx);
    }
};

template <>
struct std::formatter<kvlog::Level> : std::formatter<std::string_view>
{
    auto format(kvlog::Level level, format_context& ctx) const
    {
        return std::formatter<std::string_view>::format(kvlog::toString(level), ctx);
    }
};

// Include template implementations
#include "kvlog.tpp"
