#include "flake/flake_id.hpp"
#include "flake_seed.hpp"
#include "seed_exception.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace fractalflake;
using namespace fractalflake::seed;

namespace {

// Serves a canned response and records the requested urls.
class fake_transport : public sync_transport {
public:
    explicit fake_transport(std::string body, long status = 200)
        : body_{std::move(body)}, status_{status}
    { }

    http::response fetch(const std::string &url) override
    {
        urls.push_back(url);
        if (fail)
            throw http::http_exception("Couldn't connect to server");

        http::response resp;
        resp.status = status_;
        resp.body = body_;
        return resp;
    }

    std::vector<std::string> urls;
    bool fail = false;

private:
    std::string body_;
    long status_;
};

} // namespace

class FlakeSeedTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        test_dir = std::filesystem::temp_directory_path() / "fractalflake_seed_tests";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override { std::filesystem::remove_all(test_dir); }

    static flake_seed load_string(const std::string &content)
    {
        std::istringstream in(content);
        return load(in);
    }

    static flake_seed alpha_seed()
    {
        flake_seed seed;
        seed.sync_host = "alpha";
        seed.sync_port = 9000;
        seed.node_id = 3;
        seed.epoch = 1000;
        return seed;
    }

    std::filesystem::path test_dir;
};

// ============================================
// load tests
// ============================================

TEST_F(FlakeSeedTest, LoadsAllKeys)
{
    const auto seed = load_string("host=alpha\nport=9000\nnode=3\nepoch=1000");

    EXPECT_EQ(seed.sync_host, "alpha");
    EXPECT_EQ(seed.sync_port, 9000);
    EXPECT_EQ(seed.node_id, 3u);
    EXPECT_TRUE(seed.epoch == uint128_t{1000});
}

TEST_F(FlakeSeedTest, KeyOrderDoesNotMatter)
{
    const auto seed = load_string("epoch=1000\nnode=3\nport=9000\nhost=alpha\n");

    EXPECT_EQ(seed.sync_host, "alpha");
    EXPECT_EQ(seed.sync_port, 9000);
    EXPECT_EQ(seed.node_id, 3u);
    EXPECT_TRUE(seed.epoch == uint128_t{1000});
}

TEST_F(FlakeSeedTest, MissingKeysStayZero)
{
    const auto seed = load_string("node=7\n");

    EXPECT_EQ(seed.sync_host, "");
    EXPECT_EQ(seed.sync_port, 0);
    EXPECT_EQ(seed.node_id, 7u);
    EXPECT_TRUE(seed.epoch == uint128_t{0});
}

TEST_F(FlakeSeedTest, LaterDuplicateOverwrites)
{
    const auto seed = load_string("host=alpha\nhost=beta\nport=1\nport=2\n");

    EXPECT_EQ(seed.sync_host, "beta");
    EXPECT_EQ(seed.sync_port, 2);
}

TEST_F(FlakeSeedTest, UnknownKeysAreIgnored)
{
    const auto seed = load_string("colour=blue\nlog_priority=debug\nnode=1\n");

    EXPECT_EQ(seed.node_id, 1u);
}

TEST_F(FlakeSeedTest, ValuesAreTrimmed)
{
    const auto seed = load_string("  host =  alpha  \n port = 9000 \n");

    EXPECT_EQ(seed.sync_host, "alpha");
    EXPECT_EQ(seed.sync_port, 9000);
}

TEST_F(FlakeSeedTest, EpochAcceptsFull128BitRange)
{
    const auto seed = load_string("epoch=340282366920938463463374607431768211455\n");

    EXPECT_TRUE(seed.epoch == ~uint128_t{0});
}

TEST_F(FlakeSeedTest, OutOfRangePortIsRejected)
{
    try {
        load_string("port=99999");
        FAIL() << "invalid_port_error expected";
    } catch (const invalid_port_error &e) {
        EXPECT_EQ(e.line(), 1);
        EXPECT_EQ(e.value(), "99999");
        EXPECT_STREQ(e.what(), R"(Invalid port value of "99999" at line 1)");
    }
}

TEST_F(FlakeSeedTest, InvalidNodeReportsLineAndValue)
{
    try {
        load_string("host=alpha\nnode=-1\n");
        FAIL() << "invalid_node_error expected";
    } catch (const invalid_node_error &e) {
        EXPECT_EQ(e.line(), 2);
        EXPECT_EQ(e.value(), "-1");
    }
}

TEST_F(FlakeSeedTest, InvalidEpochReportsLineAndValue)
{
    try {
        load_string("host=alpha\nport=1\nepoch=yesterday\n");
        FAIL() << "invalid_epoch_error expected";
    } catch (const invalid_epoch_error &e) {
        EXPECT_EQ(e.line(), 3);
        EXPECT_EQ(e.value(), "yesterday");
    }
}

TEST_F(FlakeSeedTest, FieldErrorsShareBaseType)
{
    EXPECT_THROW(load_string("port=x"), cfg::invalid_value_error);
    EXPECT_THROW(load_string("node=x"), cfg::invalid_value_error);
    EXPECT_THROW(load_string("epoch=x"), cfg::cfg_exception);
}

TEST_F(FlakeSeedTest, LineWithoutEqualsIsRejected)
{
    try {
        load_string("badline");
        FAIL() << "missing_equals_error expected";
    } catch (const cfg::missing_equals_error &e) {
        EXPECT_EQ(e.line(), 1);
    }
}

TEST_F(FlakeSeedTest, LoadsFromFile)
{
    const auto path = test_dir / "seed.cfg";
    {
        std::ofstream file(path);
        file << "host=alpha\nport=9000\nnode=3\nepoch=1000\n";
    }

    const auto seed = load_file(path);

    EXPECT_EQ(seed.sync_host, "alpha");
    EXPECT_TRUE(seed.epoch == uint128_t{1000});
}

TEST_F(FlakeSeedTest, MissingFileIsIoError)
{
    EXPECT_THROW(load_file(test_dir / "missing.cfg"), cfg::config_io_error);
}

// ============================================
// sync tests
// ============================================

TEST_F(FlakeSeedTest, SyncUrlUsesHostAndPort)
{
    EXPECT_EQ(sync_url(alpha_seed()), "http://alpha:9000/sync");
}

TEST_F(FlakeSeedTest, SyncReplacesEpoch)
{
    auto seed = alpha_seed();
    fake_transport transport(R"({"epoch":"123456789"})");

    sync(seed, transport);

    ASSERT_EQ(transport.urls.size(), 1);
    EXPECT_EQ(transport.urls[0], "http://alpha:9000/sync");
    EXPECT_TRUE(seed.epoch == uint128_t{123456789});
    // the rest of the seed is untouched
    EXPECT_EQ(seed.sync_host, "alpha");
    EXPECT_EQ(seed.node_id, 3u);
}

TEST_F(FlakeSeedTest, SyncIgnoresOtherFields)
{
    auto seed = alpha_seed();
    fake_transport transport(R"({"node": "9", "epoch": "158", "extra": {"a": 1}})");

    sync(seed, transport);

    EXPECT_TRUE(seed.epoch == uint128_t{158});
    EXPECT_EQ(seed.node_id, 3u);
}

TEST_F(FlakeSeedTest, SyncRejectsNonNumericEpoch)
{
    auto seed = alpha_seed();
    fake_transport transport(R"({"epoch":"notanumber"})");

    try {
        sync(seed, transport);
        FAIL() << "invalid_sync_epoch_error expected";
    } catch (const invalid_sync_epoch_error &e) {
        EXPECT_EQ(e.value(), "notanumber");
    }
    EXPECT_TRUE(seed.epoch == uint128_t{1000});
}

TEST_F(FlakeSeedTest, SyncRejectsNegativeEpoch)
{
    auto seed = alpha_seed();
    fake_transport transport(R"({"epoch":"-5"})");

    EXPECT_THROW(sync(seed, transport), invalid_sync_epoch_error);
}

TEST_F(FlakeSeedTest, SyncRejectsMalformedJson)
{
    auto seed = alpha_seed();
    fake_transport transport("<html>Internal Server Error</html>", 500);

    EXPECT_THROW(sync(seed, transport), deserialization_error);
    EXPECT_TRUE(seed.epoch == uint128_t{1000});
}

TEST_F(FlakeSeedTest, SyncRejectsMissingEpochField)
{
    auto seed = alpha_seed();
    fake_transport transport(R"({"time":"123"})");

    EXPECT_THROW(sync(seed, transport), deserialization_error);
}

TEST_F(FlakeSeedTest, SyncRejectsStructuredEpoch)
{
    auto seed = alpha_seed();
    fake_transport transport(R"({"epoch":{"value":"123"}})");

    EXPECT_THROW(sync(seed, transport), deserialization_error);
}

TEST_F(FlakeSeedTest, SyncRejectsNumericEpoch)
{
    auto seed = alpha_seed();
    fake_transport transport(R"({"epoch":123})");

    EXPECT_THROW(sync(seed, transport), deserialization_error);
    EXPECT_TRUE(seed.epoch == uint128_t{1000});
}

TEST_F(FlakeSeedTest, SyncRejectsNullAndBooleanEpoch)
{
    auto seed = alpha_seed();
    fake_transport null_transport(R"({"epoch":null})");
    fake_transport bool_transport(R"({"epoch":true})");

    EXPECT_THROW(sync(seed, null_transport), deserialization_error);
    EXPECT_THROW(sync(seed, bool_transport), deserialization_error);
    EXPECT_TRUE(seed.epoch == uint128_t{1000});
}

TEST_F(FlakeSeedTest, SyncRejectsTopLevelArray)
{
    auto seed = alpha_seed();
    fake_transport transport(R"(["123"])");

    EXPECT_THROW(sync(seed, transport), deserialization_error);
}

TEST_F(FlakeSeedTest, SyncTransportFailureIsNetworkError)
{
    auto seed = alpha_seed();
    fake_transport transport("");
    transport.fail = true;

    try {
        sync(seed, transport);
        FAIL() << "network_error expected";
    } catch (const network_error &e) {
        EXPECT_EQ(e.host(), "alpha");
        EXPECT_EQ(e.port(), 9000);
        EXPECT_NE(std::string(e.what()).find("alpha"), std::string::npos);
    }
}

TEST_F(FlakeSeedTest, UnreachableCoordinatorIsNetworkError)
{
    flake_seed seed;
    seed.sync_host = "127.0.0.1";
    seed.sync_port = 1; // nothing listens on tcpmux

    try {
        sync(seed, 5L);
        FAIL() << "network_error expected";
    } catch (const network_error &e) {
        EXPECT_EQ(e.host(), "127.0.0.1");
        EXPECT_EQ(e.port(), 1);
        EXPECT_NE(std::string(e.what()).find("127.0.0.1"), std::string::npos);
    }
}

// ============================================
// seal tests
// ============================================

TEST_F(FlakeSeedTest, SealBindsSeedAndThread)
{
    const auto seed = alpha_seed();

    auto gen = seal(seed, 12);

    EXPECT_TRUE(gen.epoch() == uint128_t{1000});
    EXPECT_EQ(gen.node_id(), 3u);
    EXPECT_EQ(gen.thread_id(), 12u);
    EXPECT_EQ(gen.sequence(), 0u);
    EXPECT_EQ(gen.last_time(), 0u);

    const auto fields = flake::decompose(gen.generate());
    EXPECT_EQ(fields.node_id, 3u);
    EXPECT_EQ(fields.thread_id, 12u);
    EXPECT_EQ(fields.sequence, 0u);
}

TEST_F(FlakeSeedTest, SealedGeneratorsAreIndependent)
{
    const auto seed = alpha_seed();

    auto first = seal(seed, 0);
    auto second = seal(seed, 1);

    first.generate();
    first.generate();

    EXPECT_EQ(first.sequence(), 2u);
    EXPECT_EQ(second.sequence(), 0u);
    EXPECT_NE(first.generate(), second.generate());
}
