#include "matrix_controller/utils/StatusDatabase.hpp"
#include "gtest/gtest.h"
#include <cstdio>
#include <string>

using namespace matrix_controller;

namespace
{
int64_t QueryInt(sqlite3 *db, const std::string &sql)
{
    sqlite3_stmt *stmt = nullptr;
    EXPECT_EQ(sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr), SQLITE_OK) << sql;
    int64_t value = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW)
        value = sqlite3_column_int64(stmt, 0);
    sqlite3_finalize(stmt);
    return value;
}

matrix_interface::MatrixStatusMsg GenerateStatusProto()
{
    matrix_interface::MatrixStatusMsg msg;
    msg.set_message_id(3);
    msg.set_time_ns(1700000000123456789ULL);
    msg.set_battery_level(210);
    msg.set_fault(true);
    auto motor = msg.mutable_motors()->Add();
    motor->set_motor_id(2);
    motor->set_position(-100);
    motor->set_target(1000);
    motor->set_speed(-50);
    motor->set_busy(true);
    return msg;
}

TEST(StatusDatabaseTest, RowsUseMessageTimestamp)
{
    StatusDatabase database(":memory:");
    database.Insert(GenerateStatusProto());

    auto db = database.Handle();
    EXPECT_EQ(QueryInt(db, "select time_ns from controller"), 1700000000123456789LL);
    EXPECT_EQ(QueryInt(db, "select battery_level from controller"), 210);
    EXPECT_EQ(QueryInt(db, "select fault from controller"), 1);
    EXPECT_EQ(QueryInt(db, "select count(*) from motor2 where time_ns = 1700000000123456789"), 4);
    EXPECT_EQ(QueryInt(db, "select value from motor2 where type = 'position'"), -100);
    EXPECT_EQ(QueryInt(db, "select value from motor2 where type = 'speed'"), -50);
    EXPECT_EQ(QueryInt(db, "select count(*) from motor1"), 0);
}

TEST(StatusDatabaseTest, InvalidMotorIdIsSkipped)
{
    StatusDatabase database(":memory:");
    auto msg = GenerateStatusProto();
    msg.mutable_motors()->Add()->set_motor_id(9);
    database.Insert(msg);
    EXPECT_EQ(QueryInt(database.Handle(), "select count(*) from controller"), 1);
}

TEST(StatusDatabaseTest, FailedSchemaCreationThrows)
{
    std::string path = ::testing::TempDir() + "matrix_status_database_test.db";
    std::remove(path.c_str());
    {
        StatusDatabase database(path);
    }
    // tables already exist in the file
    EXPECT_THROW(StatusDatabase database(path), std::runtime_error);
    EXPECT_EQ(std::remove(path.c_str()), 0);
}

TEST(StatusDatabaseTest, UnopenablePathThrows)
{
    EXPECT_THROW(StatusDatabase database("/nonexistent_dir/status.db"), std::runtime_error);
}
} // namespace
