#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "lru/store_shell.h"

using json = nlohmann::json;

class StoreShellTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<lru::StoreShell::Store>(3);
        shell = std::make_unique<lru::StoreShell>(store, [this](const std::string& line) {
            logged.push_back(line);
        });
    }

    std::shared_ptr<lru::StoreShell::Store> store;
    std::unique_ptr<lru::StoreShell> shell;
    std::vector<std::string> logged;
};

TEST_F(StoreShellTest, BasicCRUD) {
    // PUT
    auto put_res = shell->execute("put foo bar");
    EXPECT_EQ(put_res["status"], "ok");

    // GET
    auto get_res = shell->execute("get foo");
    EXPECT_EQ(get_res["value"], "bar");

    // DELETE
    auto del_res = shell->execute("del foo");
    EXPECT_EQ(del_res["status"], "deleted");

    // GET again (should be not_found)
    auto get_res2 = shell->execute("get foo");
    EXPECT_EQ(get_res2["code"], "not_found");
    EXPECT_TRUE(get_res2.contains("error"));

    // DELETE again
    auto del_res2 = shell->execute("del foo");
    EXPECT_EQ(del_res2["code"], "not_found");
}

TEST_F(StoreShellTest, PutKeepsRestOfLineAsValue) {
    shell->execute("put greeting hello  big world");
    EXPECT_EQ(store->peek("greeting"), "hello  big world");
}

TEST_F(StoreShellTest, PutWithoutValueIsBadRequest) {
    auto res = shell->execute("put lonely");
    EXPECT_EQ(res["code"], "bad_request");
    EXPECT_FALSE(store->contains("lonely"));
}

TEST_F(StoreShellTest, PeekKeepsOrderGetRefreshes) {
    shell->execute("put a 1");
    shell->execute("put b 2");

    EXPECT_EQ(shell->execute("peek a")["value"], "1");
    EXPECT_EQ(shell->execute("lru")["key"], "a");

    EXPECT_EQ(shell->execute("get a")["value"], "1");
    EXPECT_EQ(shell->execute("lru")["key"], "b");
    EXPECT_EQ(shell->execute("mru")["key"], "a");
}

TEST_F(StoreShellTest, EvictionAndKeys) {
    shell->execute("put a 1");
    shell->execute("put b 2");
    shell->execute("put c 3");
    shell->execute("put d 4");

    EXPECT_EQ(shell->execute("has a")["contains"], false);
    EXPECT_EQ(shell->execute("keys")["keys"], json::array({"b", "c", "d"}));
}

TEST_F(StoreShellTest, Resize) {
    shell->execute("put a 1");
    shell->execute("put b 2");
    shell->execute("put c 3");

    auto res = shell->execute("resize 1");
    EXPECT_EQ(res["status"], "ok");
    EXPECT_EQ(res["capacity"], 1);
    EXPECT_EQ(shell->execute("keys")["keys"], json::array({"c"}));

    EXPECT_EQ(shell->execute("resize 0")["code"], "invalid_capacity");
    EXPECT_EQ(shell->execute("resize -4")["code"], "invalid_capacity");
    EXPECT_EQ(shell->execute("resize many")["code"], "bad_request");
    EXPECT_EQ(store->capacity(), 1u);
}

TEST_F(StoreShellTest, ResizeRejectsTrailingJunk) {
    shell->execute("put a 1");
    EXPECT_EQ(shell->execute("resize 1abc")["code"], "bad_request");
    EXPECT_EQ(shell->execute("resize 2.5")["code"], "bad_request");
    EXPECT_EQ(store->capacity(), 3u);
}

TEST_F(StoreShellTest, EmptyStoreAccessors) {
    EXPECT_EQ(shell->execute("lru")["code"], "empty");
    EXPECT_EQ(shell->execute("mru")["code"], "empty");
    EXPECT_EQ(shell->execute("pop")["code"], "empty");
}

TEST_F(StoreShellTest, PopAndClear) {
    shell->execute("put a 1");
    shell->execute("put b 2");

    auto popped = shell->execute("pop");
    EXPECT_EQ(popped["key"], "a");
    EXPECT_EQ(popped["value"], "1");

    EXPECT_EQ(shell->execute("clear")["status"], "cleared");
    EXPECT_TRUE(store->empty());
}

TEST_F(StoreShellTest, Dump) {
    shell->execute("put a 1");
    shell->execute("put b 2");
    shell->execute("get a");

    auto dump = shell->execute("dump");
    EXPECT_EQ(dump["capacity"], 3);
    EXPECT_EQ(dump["filled"], 2);
    EXPECT_EQ(dump["entries"], json::parse(R"([["b", "2"], ["a", "1"]])"));
}

TEST_F(StoreShellTest, StatsCountHitsAndMisses) {
    shell->execute("put a 1");
    shell->execute("get a");
    shell->execute("peek a");
    shell->execute("get missing");
    shell->execute("del missing"); // not a lookup, not counted

    auto stats = shell->execute("stats");
    EXPECT_EQ(stats["hits"], 2);
    EXPECT_EQ(stats["misses"], 1);
    EXPECT_EQ(stats["filled"], 1);
    EXPECT_EQ(stats["capacity"], 3);
    EXPECT_EQ(shell->hits(), 2u);
    EXPECT_EQ(shell->misses(), 1u);
}

TEST_F(StoreShellTest, MalformedCommands) {
    EXPECT_EQ(shell->execute("")["code"], "bad_request");
    EXPECT_EQ(shell->execute("frobnicate x")["code"], "bad_request");
    EXPECT_EQ(shell->execute("get")["code"], "bad_request");
    EXPECT_EQ(shell->execute("get a b")["code"], "bad_request");
    EXPECT_EQ(shell->execute("keys now")["code"], "bad_request");
}

TEST_F(StoreShellTest, LogsEveryCommand) {
    shell->execute("put a 1");
    shell->execute("get zzz");

    ASSERT_EQ(logged.size(), 2u);
    EXPECT_EQ(logged[0], "put -> ok");
    EXPECT_EQ(logged[1], "get -> not_found");
}

TEST(StoreShellNoLogTest, WorksWithoutLogHook) {
    auto store = std::make_shared<lru::StoreShell::Store>(2);
    lru::StoreShell shell(store);
    EXPECT_EQ(shell.execute("put k v")["status"], "ok");
    EXPECT_EQ(store->peek("k"), "v");
}

TEST(ParseCapacityTest, AcceptsWholeIntegers) {
    EXPECT_EQ(lru::parse_capacity("3"), 3);
    EXPECT_EQ(lru::parse_capacity("-2"), -2);
}

TEST(ParseCapacityTest, RejectsTrailingJunk) {
    EXPECT_THROW(lru::parse_capacity("3x"), std::invalid_argument);
    EXPECT_THROW(lru::parse_capacity("x3"), std::invalid_argument);
    EXPECT_THROW(lru::parse_capacity(""), std::invalid_argument);
    EXPECT_THROW(lru::parse_capacity("99999999999999999999999"), std::out_of_range);
}

TEST(QuitCommandTest, IgnoresSurroundingWhitespace) {
    EXPECT_TRUE(lru::is_quit_command("quit"));
    EXPECT_TRUE(lru::is_quit_command("quit  "));
    EXPECT_TRUE(lru::is_quit_command("quit\r"));
    EXPECT_TRUE(lru::is_quit_command("  quit\t"));
}

TEST(QuitCommandTest, RejectsOtherLines) {
    EXPECT_FALSE(lru::is_quit_command(""));
    EXPECT_FALSE(lru::is_quit_command("quitter"));
    EXPECT_FALSE(lru::is_quit_command("quit now"));
    EXPECT_FALSE(lru::is_quit_command("get quit"));
}
