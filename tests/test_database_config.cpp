#include <gtest/gtest.h>
#include "config/database_config.hpp"
#include "core/db_error.hpp"
#include <cstdio>
#include <fstream>

using namespace sqlbridge;
using config::DatabaseConfig;
using config::Driver;

namespace {

DatabaseConfig complete_config() {
    DatabaseConfig cfg;
    cfg.driver = Driver::PGSQL;
    cfg.host = "localhost";
    cfg.port = 5432;
    cfg.username = "drupal";
    cfg.password = "secret";
    cfg.database = "site";
    return cfg;
}

} // anonymous namespace

TEST(DatabaseConfigTest, ParseDriverNames) {
    EXPECT_EQ(config::parse_driver("mysql"), Driver::MYSQL);
    EXPECT_EQ(config::parse_driver("pgsql"), Driver::PGSQL);
    EXPECT_EQ(config::parse_driver("MSSQL"), Driver::MSSQL);
    EXPECT_EQ(config::parse_driver("Oracle"), Driver::ORACLE);
}

TEST(DatabaseConfigTest, UnknownDriverIsUnsupported) {
    try {
        config::parse_driver("sqlite");
        FAIL() << "Expected DbError";
    } catch (const core::DbError& e) {
        EXPECT_EQ(e.kind(), core::ErrorKind::UNSUPPORTED_DRIVER);
        EXPECT_NE(std::string(e.what()).find("sqlite"), std::string::npos);
    }
}

TEST(DatabaseConfigTest, DriverNamesRoundTrip) {
    for (Driver d : {Driver::MYSQL, Driver::PGSQL, Driver::MSSQL, Driver::ORACLE}) {
        EXPECT_EQ(config::parse_driver(config::driver_to_string(d)), d);
    }
}

TEST(DatabaseConfigTest, CompleteConfigValidates) {
    EXPECT_TRUE(complete_config().missing_fields().empty());
    EXPECT_NO_THROW(complete_config().validate());
}

TEST(DatabaseConfigTest, MissingFieldsAreNamed) {
    DatabaseConfig cfg = complete_config();
    cfg.host.clear();
    cfg.password.clear();
    cfg.port = 0;

    EXPECT_EQ(cfg.missing_fields(), (std::vector<std::string>{"host", "port", "password"}));

    try {
        cfg.validate();
        FAIL() << "Expected DbError";
    } catch (const core::DbError& e) {
        EXPECT_EQ(e.kind(), core::ErrorKind::CONFIG_INCOMPLETE);
        std::string message = e.what();
        EXPECT_NE(message.find("host"), std::string::npos);
        EXPECT_NE(message.find("password"), std::string::npos);
    }
}

TEST(DatabaseConfigTest, PortOutOfRangeIsIncomplete) {
    DatabaseConfig cfg = complete_config();
    cfg.port = 70000;
    EXPECT_THROW(cfg.validate(), core::DbError);
}

TEST(DatabaseConfigTest, ParseJson) {
    DatabaseConfig cfg = config::parse_config_json(R"({
        "driver": "mysql", "host": "db", "port": 3306,
        "username": "u", "password": "p", "database": "d", "prefix": "dr_",
        "odbc_driver": "MariaDB Unicode", "login_timeout": 5
    })");

    EXPECT_EQ(cfg.driver, Driver::MYSQL);
    EXPECT_EQ(cfg.host, "db");
    EXPECT_EQ(cfg.port, 3306);
    EXPECT_EQ(cfg.username, "u");
    EXPECT_EQ(cfg.password, "p");
    EXPECT_EQ(cfg.database, "d");
    EXPECT_EQ(cfg.prefix, "dr_");
    EXPECT_EQ(cfg.odbc_driver, "MariaDB Unicode");
    EXPECT_EQ(cfg.login_timeout, 5);
}

TEST(DatabaseConfigTest, PortMayBeNumericString) {
    DatabaseConfig cfg = config::parse_config_json(
        R"({"driver": "pgsql", "host": "db", "port": "5432"})");
    EXPECT_EQ(cfg.port, 5432);
    EXPECT_EQ(cfg.login_timeout, 15);
    EXPECT_TRUE(cfg.prefix.empty());
}

TEST(DatabaseConfigTest, NonNumericPortIsRejected) {
    EXPECT_THROW(config::parse_config_json(R"({"driver": "pgsql", "port": "54x"})"),
                 core::DbError);
}

TEST(DatabaseConfigTest, MissingDriverIsIncomplete) {
    try {
        config::parse_config_json(R"({"host": "db"})");
        FAIL() << "Expected DbError";
    } catch (const core::DbError& e) {
        EXPECT_EQ(e.kind(), core::ErrorKind::CONFIG_INCOMPLETE);
    }
}

TEST(DatabaseConfigTest, InvalidJsonIsRejected) {
    EXPECT_THROW(config::parse_config_json("{not json"), core::DbError);
    EXPECT_THROW(config::parse_config_json("[1, 2]"), core::DbError);
}

TEST(DatabaseConfigTest, LoadConfigFile) {
    const std::string path = "sqlbridge_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"driver": "oracle", "host": "ora", "port": 1521, "username": "u",
                   "password": "p", "database": "XEPDB1"})";
    }

    DatabaseConfig cfg = config::load_config_file(path);
    std::remove(path.c_str());

    EXPECT_EQ(cfg.driver, Driver::ORACLE);
    EXPECT_EQ(cfg.database, "XEPDB1");
    EXPECT_NO_THROW(cfg.validate());
}

TEST(DatabaseConfigTest, MissingFileIsReported) {
    EXPECT_THROW(config::load_config_file("/nonexistent/sqlbridge.json"), core::DbError);
}
