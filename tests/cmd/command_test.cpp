#include "respkv/cmd/command.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace respkv::cmd::test {

using net::Value;

namespace {

Value frame(const std::vector<std::string>& parts) {
    std::vector<Value> elements;
    for (const auto& part : parts) {
        elements.push_back(Value::bulk(part));
    }
    return Value::array(std::move(elements));
}

Command parse(const std::vector<std::string>& parts) {
    return parse_command(to_request(frame(parts)));
}

// message of the CommandError thrown while parsing, empty if nothing was thrown
std::string parse_error(const std::vector<std::string>& parts) {
    try {
        (void)parse(parts);
    } catch (const CommandError& e) {
        return e.what();
    }
    return "";
}

}  // namespace

// FRAME -> REQUEST -------------------------------------------------------------------------

TEST(ToRequestTest, SplitsNameAndArgs) {
    auto request = to_request(frame({"SET", "k", "v"}));
    EXPECT_EQ(request.name, "SET");
    EXPECT_EQ(request.args, (std::vector<std::string>{"k", "v"}));
}

TEST(ToRequestTest, RejectsNonArray) {
    EXPECT_THROW((void)to_request(Value::bulk("PING")), CommandError);
    EXPECT_THROW((void)to_request(Value::integer_value(1)), CommandError);
}

TEST(ToRequestTest, RejectsEmptyAndNullArrays) {
    try {
        (void)to_request(Value::array({}));
        FAIL() << "expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_STREQ(e.what(), "ERR empty command");
    }
    EXPECT_THROW((void)to_request(Value::null_array()), CommandError);
}

TEST(ToRequestTest, RejectsNonBulkElements) {
    EXPECT_THROW((void)to_request(Value::array({Value::bulk("GET"), Value::integer_value(1)})),
                 CommandError);
    EXPECT_THROW((void)to_request(Value::array({Value::bulk("GET"), Value::null_bulk()})),
                 CommandError);
}

// REQUEST -> COMMAND -----------------------------------------------------------------------

TEST(ParseCommandTest, NamesAreCaseInsensitive) {
    EXPECT_TRUE(std::holds_alternative<Ping>(parse({"ping"})));
    EXPECT_TRUE(std::holds_alternative<Ping>(parse({"PiNg"})));
    EXPECT_TRUE(std::holds_alternative<Get>(parse({"get", "k"})));
}

TEST(ParseCommandTest, Ping) {
    auto plain = std::get<Ping>(parse({"PING"}));
    EXPECT_FALSE(plain.message.has_value());

    auto with_message = std::get<Ping>(parse({"PING", "hello"}));
    EXPECT_EQ(with_message.message, "hello");

    EXPECT_NE(parse_error({"PING", "a", "b"}).find("wrong number of arguments for 'ping'"),
              std::string::npos);
}

TEST(ParseCommandTest, EchoAndGet) {
    EXPECT_EQ(std::get<Echo>(parse({"ECHO", "hi"})).message, "hi");
    EXPECT_EQ(std::get<Get>(parse({"GET", "key"})).key, "key");
}

TEST(ParseCommandTest, ArityErrors) {
    EXPECT_EQ(parse_error({"GET"}),
              "ERR wrong number of arguments for 'get' command (usage: GET key)");
    EXPECT_EQ(parse_error({"GET", "a", "b"}),
              "ERR wrong number of arguments for 'get' command (usage: GET key)");
    EXPECT_NE(parse_error({"SET", "k"}).find("wrong number of arguments for 'set'"),
              std::string::npos);
    EXPECT_NE(parse_error({"ECHO"}).find("'echo'"), std::string::npos);
    EXPECT_NE(parse_error({"DEL"}).find("'del'"), std::string::npos);
    EXPECT_NE(parse_error({"EXPIRE", "k"}).find("'expire'"), std::string::npos);
    EXPECT_NE(parse_error({"DBSIZE", "x"}).find("'dbsize'"), std::string::npos);
    EXPECT_NE(parse_error({"KEYS"}).find("'keys'"), std::string::npos);
}

TEST(ParseCommandTest, UnknownCommand) {
    EXPECT_EQ(parse_error({"FOO", "a", "b"}),
              "ERR unknown command 'FOO', with args beginning with: 'a' 'b' ");
    EXPECT_EQ(parse_error({"hset"}), "ERR unknown command 'hset', with args beginning with: ");
}

TEST(ParseCommandTest, UnknownCommandEchoIsBounded) {
    std::string big(100000, 'x');
    auto message = parse_error({big, big, big});
    EXPECT_LT(message.size(), 512u);
    EXPECT_EQ(message, "ERR unknown command '" + std::string(128, 'x') +
                           "', with args beginning with: '" + std::string(128, 'x') + "' ");
}

TEST(ParseCommandTest, SetPlain) {
    auto set = std::get<Set>(parse({"SET", "k", "v"}));
    EXPECT_EQ(set.key, "k");
    EXPECT_EQ(set.value, "v");
    EXPECT_FALSE(set.options.ttl.has_value());
    EXPECT_EQ(set.options.condition, core::SetCondition::Always);
    EXPECT_FALSE(set.options.keep_ttl);
}

TEST(ParseCommandTest, SetExpiryOptions) {
    auto ex = std::get<Set>(parse({"SET", "k", "v", "EX", "10"}));
    ASSERT_TRUE(ex.options.ttl.has_value());
    EXPECT_EQ(ex.options.ttl->count(), 10000);

    auto px = std::get<Set>(parse({"SET", "k", "v", "px", "10"}));
    ASSERT_TRUE(px.options.ttl.has_value());
    EXPECT_EQ(px.options.ttl->count(), 10);

    auto keep = std::get<Set>(parse({"SET", "k", "v", "KEEPTTL"}));
    EXPECT_TRUE(keep.options.keep_ttl);
}

TEST(ParseCommandTest, SetConditionsCombineWithExpiry) {
    auto nx = std::get<Set>(parse({"SET", "k", "v", "NX", "EX", "5"}));
    EXPECT_EQ(nx.options.condition, core::SetCondition::IfAbsent);
    ASSERT_TRUE(nx.options.ttl.has_value());
    EXPECT_EQ(nx.options.ttl->count(), 5000);

    auto xx = std::get<Set>(parse({"SET", "k", "v", "PX", "5", "xx"}));
    EXPECT_EQ(xx.options.condition, core::SetCondition::IfExists);
    ASSERT_TRUE(xx.options.ttl.has_value());
    EXPECT_EQ(xx.options.ttl->count(), 5);
}

TEST(ParseCommandTest, SetSyntaxErrors) {
    EXPECT_EQ(parse_error({"SET", "k", "v", "EX"}), "ERR syntax error");
    EXPECT_EQ(parse_error({"SET", "k", "v", "BOGUS"}), "ERR syntax error");
    EXPECT_EQ(parse_error({"SET", "k", "v", "NX", "XX"}), "ERR syntax error");
    EXPECT_EQ(parse_error({"SET", "k", "v", "EX", "1", "PX", "1"}), "ERR syntax error");
    EXPECT_EQ(parse_error({"SET", "k", "v", "EX", "1", "KEEPTTL"}), "ERR syntax error");
}

TEST(ParseCommandTest, SetInvalidExpiry) {
    EXPECT_EQ(parse_error({"SET", "k", "v", "EX", "abc"}),
              "ERR value is not an integer or out of range");
    EXPECT_EQ(parse_error({"SET", "k", "v", "PX", "1.5"}),
              "ERR value is not an integer or out of range");
    EXPECT_EQ(parse_error({"SET", "k", "v", "EX", "0"}), "ERR invalid expire time in 'set' command");
    EXPECT_EQ(parse_error({"SET", "k", "v", "PX", "-5"}),
              "ERR invalid expire time in 'set' command");
    EXPECT_EQ(parse_error({"SET", "k", "v", "EX", "9223372036854775807"}),
              "ERR invalid expire time in 'set' command");
}

TEST(ParseCommandTest, DelAndExistsTakeManyKeys) {
    EXPECT_EQ(std::get<Del>(parse({"DEL", "a", "b", "c"})).keys,
              (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(std::get<Exists>(parse({"EXISTS", "a", "a"})).keys,
              (std::vector<std::string>{"a", "a"}));
}

TEST(ParseCommandTest, ExpireFamily) {
    auto expire = std::get<Expire>(parse({"EXPIRE", "k", "10"}));
    EXPECT_EQ(expire.key, "k");
    EXPECT_EQ(expire.ttl.count(), 10000);

    auto pexpire = std::get<Expire>(parse({"PEXPIRE", "k", "250"}));
    EXPECT_EQ(pexpire.ttl.count(), 250);

    // non-positive is accepted here and deletes the key on execution
    EXPECT_EQ(std::get<Expire>(parse({"EXPIRE", "k", "-1"})).ttl.count(), -1000);

    EXPECT_EQ(parse_error({"EXPIRE", "k", "soon"}), "ERR value is not an integer or out of range");
    EXPECT_EQ(parse_error({"EXPIRE", "k", "9223372036854775807"}),
              "ERR invalid expire time in 'expire' command");
}

TEST(ParseCommandTest, ExpiryBeyondLimitIsRejected) {
    const std::string max_ms = std::to_string(core::kMaxTtl.count());
    const std::string max_s = std::to_string(core::kMaxTtl.count() / 1000);

    EXPECT_EQ(std::get<Set>(parse({"SET", "k", "v", "PX", max_ms})).options.ttl.value().count(),
              core::kMaxTtl.count());
    EXPECT_EQ(std::get<Expire>(parse({"EXPIRE", "k", max_s})).ttl.count(),
              core::kMaxTtl.count() / 1000 * 1000);

    EXPECT_EQ(parse_error({"SET", "k", "v", "PX", std::to_string(core::kMaxTtl.count() + 1)}),
              "ERR invalid expire time in 'set' command");
    EXPECT_EQ(parse_error({"SET", "k", "v", "PX", "9223372036854775807"}),
              "ERR invalid expire time in 'set' command");
    EXPECT_EQ(parse_error({"SET", "k", "v", "EX", "100000000000000"}),
              "ERR invalid expire time in 'set' command");
    EXPECT_EQ(parse_error({"PEXPIRE", "k", "9223372036854775807"}),
              "ERR invalid expire time in 'pexpire' command");

    // hugely negative still means "delete now"
    EXPECT_LT(std::get<Expire>(parse({"EXPIRE", "k", "-9223372036854775807"})).ttl.count(), 0);
}

TEST(ParseCommandTest, TtlFamily) {
    EXPECT_FALSE(std::get<Ttl>(parse({"TTL", "k"})).milliseconds);
    EXPECT_TRUE(std::get<Ttl>(parse({"PTTL", "k"})).milliseconds);
    EXPECT_EQ(std::get<Persist>(parse({"PERSIST", "k"})).key, "k");
}

TEST(ParseCommandTest, KeyspaceCommands) {
    EXPECT_EQ(std::get<Keys>(parse({"KEYS", "user:*"})).pattern, "user:*");
    EXPECT_TRUE(std::holds_alternative<DbSize>(parse({"DBSIZE"})));
    EXPECT_TRUE(std::holds_alternative<FlushDb>(parse({"FLUSHDB"})));
    EXPECT_TRUE(std::holds_alternative<FlushDb>(parse({"FLUSHALL"})));
    EXPECT_TRUE(std::holds_alternative<FlushDb>(parse({"flushdb", "async"})));
    EXPECT_TRUE(std::holds_alternative<FlushDb>(parse({"FLUSHALL", "SYNC"})));
    EXPECT_EQ(parse_error({"FLUSHDB", "NOW"}), "ERR syntax error");
    EXPECT_EQ(parse_error({"FLUSHDB", "ASYNC", "SYNC"}), "ERR syntax error");
}

TEST(ParseCommandTest, ConfigGet) {
    EXPECT_EQ(std::get<ConfigGet>(parse({"CONFIG", "GET", "port"})).parameter, "port");
    EXPECT_EQ(std::get<ConfigGet>(parse({"config", "get", "maxclients"})).parameter,
              "maxclients");

    EXPECT_EQ(parse_error({"CONFIG", "SET", "port", "1"}),
              "ERR unknown subcommand 'SET'. Try CONFIG GET.");
    EXPECT_NE(parse_error({"CONFIG", "GET"}).find("'config|get'"), std::string::npos);
    EXPECT_NE(parse_error({"CONFIG"}).find("'config'"), std::string::npos);
}

TEST(ParseCommandTest, InfoAndQuit) {
    EXPECT_TRUE(std::get<Info>(parse({"INFO"})).sections.empty());
    EXPECT_EQ(std::get<Info>(parse({"INFO", "server", "stats"})).sections,
              (std::vector<std::string>{"server", "stats"}));
    EXPECT_TRUE(std::holds_alternative<Quit>(parse({"QUIT"})));
}

}  // namespace respkv::cmd::test
