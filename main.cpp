#include <iostream>
#include <memory>
#include <vector>
#include "kvlog.hpp"

// Example usage
using namespace kvlog;

struct Point
{
    float x;
    float y;
};

struct Route
{
    std::string name;
    std::vector<Point> stops;
};

class Session
{
public:
    explicit Session(std::uint64_t id_) : id(id_) {}

    std::uint64_t id;
};

template <>
struct kvlog::DebugFormatter<Session>
{
    static void write(std::ostream& os, Session const& s) { os << "Session#" << s.id; }
};

// Writes records to std::cout
class StreamLogger : public Log
{
public:
    explicit StreamLogger(LevelFilter max_) : max(max_) {}

    bool enabled(Metadata const& metadata) const override
    {
        return metadata.level <= max;
    }

    void log(Record const& record) override
    {
        if (! enabled(record.metadata()))
            return;

        std::cout << "[" << record.level() << " " << record.target() << "] " << record.message();

        if (record.keyValues().count() > 0)
            std::cout << " " << record.keyValues();

        std::cout << std::endl;
    }

    void flush() override { std::cout.flush(); }

private:
    LevelFilter max;
};

// A backend that only cares about numbers
class Totaliser : public SourceVisitor
{
public:
    bool visitPair(Key key, Value const& value) override
    {
        if (auto const v = value.toF64())
        {
            std::cout << "  " << key.asStr() << " contributes " << *v << "\n";
            total += *v;
        }
        else
            std::cout << "  " << key.asStr() << " is not a number: " << value << "\n";

        return true;
    }

    double total = 0.0;
};

void valueExamples()
{
    std::cout << "=== Values ===\n\n";

    std::string user = "ada";
    Session session(17);

    auto count = Value(42);
    auto name = Value(user);
    auto captured = Value::captureDebug(session);

    std::cout << "count as u8: " << static_cast<int>(*count.toU8()) << "\n";
    std::cout << "name borrowed: " << *name.toBorrowedStr() << "\n";
    std::cout << "session: " << captured << "\n";
    std::cout << "session downcast id: " << captured.downcastRef<Session>()->id << "\n";
    std::cout << std::format("formatted: {} / {} / {}", count, name, captured) << "\n";

    std::uint64_t counter = 0;
    auto lazy = makeFill([&counter] (Slot& slot) { return slot.fillAny(++counter); });
    auto deferred = Value::fromFill(lazy);
    std::cout << "deferred: " << deferred << ", then " << deferred << "\n";
}

void sourceExamples()
{
    std::cout << "\n=== Sources ===\n\n";

    Route route { "coastal", { { 0.0f, 0.0f }, { 1.5f, 2.5f } } };
    auto kvs = keyValues(kv<"distance">(12.5), kv<"stops">(route.stops.size()), kv<"route">(std::cref(route)));

    std::cout << kvs << "\n";
    std::cout << "route: " << kvs("route"_key) << "\n";

    Totaliser totaliser;
    auto success = kvs.visit(totaliser);
    std::cout << "total " << totaliser.total << " (complete: " << std::boolalpha << success << ")\n";
}

void logExamples()
{
    std::cout << "\n=== Logging ===\n\n";

    StreamLogger logger(LevelFilter::info);

    int attempts = 3;
    auto message = formatArgs("login succeeded after {} attempts", attempts);
    auto kvs = keyValues(kv<"user">("ada"), kv<"attempts">(attempts));
    log(logger, Record({ Level::info, "auth" }, toValue(message), kvs));

    try
    {
        try
        {
            throw std::runtime_error("connection reset");
        }
        catch (std::exception const&)
        {
            std::throw_with_nested(std::runtime_error("sync failed"));
        }
    }
    catch (std::exception const& e)
    {
        auto error = keyValues(kv<"cause">(Value::captureError(e)));
        log(logger, Record({ Level::error, "sync" }, Value("giving up"), error));
    }

    if (! log(logger, Record({ Level::debug, "auth" }, Value("not shown"))))
        std::cout << "debug records are filtered\n";

    logger.flush();
}

int main()
{
    valueExamples();
    sourceExamples();
    logExamples();
    return 0;
}
