#ifndef MATRIX_CONTROLLER_UTILS_STATUSDATABASE_HPP
#define MATRIX_CONTROLLER_UTILS_STATUSDATABASE_HPP
#include <matrix_controller_protobuf/matrix_status_msg.pb.h>
#include <memory>
#include <sqlite3.h>
#include <string>

namespace matrix_controller
{
/**
 * Sqlite store for status messages: one "controller" table and one table per motor ("motor1".."motor4").
 * Rows are stamped with the time_ns of the message they came from.
 */
class StatusDatabase
{
  public:
    explicit StatusDatabase(const std::string &path);

    // Inserts one message in a single transaction, rolled back and rethrown on failure
    void Insert(const matrix_interface::MatrixStatusMsg &msg);

    [[nodiscard]] sqlite3 *Handle() const
    {
        return db_.get();
    }

  private:
    void Exec(const std::string &sql, const std::string &what);
    std::unique_ptr<sqlite3, decltype(&sqlite3_close)> db_{nullptr, &sqlite3_close};
};
} // namespace matrix_controller
#endif // MATRIX_CONTROLLER_UTILS_STATUSDATABASE_HPP
