#include "core/postgres_color_source.hpp"
#include "logging/logger.hpp"
#include <libpq-fe.h>
#include <memory>
#include <stdexcept>

namespace
{
    // One row per color of the group in display order, each carrying the
    // minutes elapsed since the shift start (same value on every row).
    const char *const kColorRotationQuery =
        "SELECT c.color, "
        "       FLOOR(EXTRACT(EPOCH FROM (LOCALTIME - a.shiftdatechangetime)) / 60)::int AS minutes_since_start "
        "FROM ticketprintergroupcolors c "
        "CROSS JOIN (SELECT shiftdatechangetime FROM applicationinfo LIMIT 1) a "
        "WHERE c.ticketprintergroupno = $1::int "
        "ORDER BY c.corder";

    struct ConnectionDeleter
    {
        void operator()(PGconn *conn) const { PQfinish(conn); }
    };

    struct ResultDeleter
    {
        void operator()(PGresult *result) const { PQclear(result); }
    };

    using ConnectionPtr = std::unique_ptr<PGconn, ConnectionDeleter>;
    using ResultPtr = std::unique_ptr<PGresult, ResultDeleter>;
}

std::string colorNameFromCode(long long code)
{
    switch (code)
    {
    case -65536:
        return "Red";
    case -256:
        return "Yellow";
    case -16711681:
        return "Blue";
    case -16711936:
        return "Green";
    case -23296:
        return "Orange";
    default:
        return "Unknown";
    }
}

ColorData rotateColors(const std::vector<long long> &codes, int minutes_since_start, int rotation_minutes)
{
    ColorData colors;
    const int total = static_cast<int>(codes.size());
    if (total == 0)
    {
        return colors;
    }

    int minutes = minutes_since_start % (24 * 60);
    if (minutes < 0)
    {
        minutes += 24 * 60;
    }
    const int interval = (minutes / (rotation_minutes > 0 ? rotation_minutes : 30)) % total;

    for (int i = 0; i < total; ++i)
    {
        const int position = (i - interval + total) % total + 1;
        colors["color" + std::to_string(position)] = colorNameFromCode(codes[i]);
    }
    return colors;
}

PostgresColorSource::PostgresColorSource(int connect_timeout_seconds, int rotation_minutes)
    : connect_timeout_seconds_(connect_timeout_seconds), rotation_minutes_(rotation_minutes)
{
}

ColorData PostgresColorSource::fetchColors(const DatabaseCredentials &credentials)
{
    Logger::info("PostgresColorSource: connecting to database server " + credentials.server);

    const std::string timeout = std::to_string(connect_timeout_seconds_);
    const char *keywords[] = {"host", "port", "dbname", "user", "password", "connect_timeout", nullptr};
    const char *values[] = {
        credentials.server.c_str(),
        credentials.port.empty() ? nullptr : credentials.port.c_str(),
        credentials.database.c_str(),
        credentials.username.c_str(),
        credentials.password.c_str(),
        timeout.c_str(),
        nullptr};

    ConnectionPtr conn(PQconnectdbParams(keywords, values, 0));
    if (!conn)
    {
        throw std::runtime_error("Out of memory creating database connection");
    }
    if (PQstatus(conn.get()) != CONNECTION_OK)
    {
        throw std::runtime_error("Database connection failed: " + std::string(PQerrorMessage(conn.get())));
    }

    const std::string group = std::to_string(credentials.printer_group);
    const char *params[] = {group.c_str()};
    ResultPtr result(PQexecParams(conn.get(), kColorRotationQuery, 1, nullptr, params, nullptr, nullptr, 0));
    if (!result || PQresultStatus(result.get()) != PGRES_TUPLES_OK)
    {
        throw std::runtime_error("Color query failed: " + std::string(PQerrorMessage(conn.get())));
    }

    const int rows = PQntuples(result.get());
    if (rows == 0)
    {
        return {};
    }

    std::vector<long long> codes;
    codes.reserve(static_cast<size_t>(rows));
    for (int row = 0; row < rows; ++row)
    {
        codes.push_back(std::stoll(PQgetvalue(result.get(), row, 0)));
    }
    const int minutes_since_start = std::stoi(PQgetvalue(result.get(), 0, 1));

    return rotateColors(codes, minutes_since_start, rotation_minutes_);
}
