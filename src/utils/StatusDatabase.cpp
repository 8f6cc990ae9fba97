#include "matrix_controller/utils/StatusDatabase.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string_view>

namespace matrix_controller
{

StatusDatabase::StatusDatabase(const std::string &path)
{
    sqlite3 *db = nullptr;
    int rc = sqlite3_open(path.c_str(), &db);
    db_.reset(db);
    if (rc != SQLITE_OK)
    {
        throw std::runtime_error(fmt::format("Failed to open sqlite database at {}: {}", path,
                                             db != nullptr ? sqlite3_errmsg(db) : "out of memory"));
    }
    Exec("create table controller\n"
         "(\n"
         "    time_ns       integer not null,\n"
         "    battery_level integer not null,\n"
         "    fault         integer not null,\n"
         "    battery_low   integer not null\n"
         ");",
         "create table controller");
    constexpr std::string_view createTableTemplate = "create table {}\n"
                                                     "(\n"
                                                     "    time_ns integer not null,\n"
                                                     "    type    text    not null,\n"
                                                     "    value   real    not null\n"
                                                     ");";
    for (int i = 1; i <= 4; i++)
    {
        std::string tableName = fmt::format("motor{}", i);
        Exec(fmt::format(createTableTemplate, tableName), fmt::format("create table {}", tableName));
    }
}

void StatusDatabase::Exec(const std::string &sql, const std::string &what)
{
    char *errMsg = nullptr;
    int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string err = errMsg != nullptr ? errMsg : "unknown error";
        sqlite3_free(errMsg);
        throw std::runtime_error(fmt::format("Failed to {}: {}", what, err));
    }
}

void StatusDatabase::Insert(const matrix_interface::MatrixStatusMsg &msg)
{
    constexpr std::string_view controllerTemplate = "insert into controller (time_ns, battery_level, fault, battery_low)\n"
                                                    "values ({}, {}, {}, {});";
    constexpr std::string_view motorTemplate = "insert into {0} (time_ns, type, value)\n"
                                               "values ({1}, \'position\', {2});"
                                               "insert into {0} (time_ns, type, value)\n"
                                               "values ({1}, \'target\', {3});"
                                               "insert into {0} (time_ns, type, value)\n"
                                               "values ({1}, \'speed\', {4});"
                                               "insert into {0} (time_ns, type, value)\n"
                                               "values ({1}, \'busy\', {5});";
    uint64_t timeNs = msg.time_ns();
    std::string sqlStatement = fmt::format(controllerTemplate, timeNs, msg.battery_level(),
                                           static_cast<int>(msg.fault()), static_cast<int>(msg.battery_low()));
    for (const auto &motor : msg.motors())
    {
        if (motor.motor_id() < 1 || motor.motor_id() > 4)
        {
            spdlog::warn("Status message {} has invalid motor id {}", msg.message_id(), motor.motor_id());
            continue;
        }
        sqlStatement += fmt::format(motorTemplate, fmt::format("motor{}", motor.motor_id()), timeNs,
                                    motor.position(), motor.target(), motor.speed(), static_cast<int>(motor.busy()));
    }
    try
    {
        Exec("BEGIN TRANSACTION;" + sqlStatement + "END TRANSACTION;",
             fmt::format("insert status message {}", msg.message_id()));
    }
    catch (const std::exception &)
    {
        sqlite3_exec(db_.get(), "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

} // namespace matrix_controller
