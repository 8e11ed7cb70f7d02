#include "skopje/db/loader.hpp"

namespace skopje::db {

uint64_t PgLoader::execute(const std::string& statement, const Row& params) {
    auto conn = pool_.acquire();
    try {
        return exec_params(conn.get(), statement, params).affected_rows();
    } catch (const SkopjeException& e) {
        report_failure("execute", e);
        throw;
    }
}

void PgLoader::report_failure(const char* operation, const SkopjeException& e) {
    std::string line = std::string(operation) + " failed: " + e.message();
    if (!e.context().empty()) {
        line += " [" + e.context() + "]";
    }
    if (e.code() == ErrorCode::RACE_LOST) {
        LOG_WARNING(line);
    } else {
        LOG_ERROR(line);
    }
}

} // namespace skopje::db
