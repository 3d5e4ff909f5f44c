#include <faultline/store/cassandra_driver.h>

#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <cassandra.h>

namespace faultline::store {

namespace {

struct CassFree {
    void operator()(CassCluster* p) const { cass_cluster_free(p); }
    void operator()(CassSession* p) const { cass_session_free(p); }
    void operator()(CassFuture* p) const { cass_future_free(p); }
    void operator()(CassStatement* p) const { cass_statement_free(p); }
    void operator()(const CassResult* p) const { cass_result_free(p); }
    void operator()(CassIterator* p) const { cass_iterator_free(p); }
};

using ClusterPtr = std::unique_ptr<CassCluster, CassFree>;
using SessionPtr = std::unique_ptr<CassSession, CassFree>;
using FuturePtr = std::unique_ptr<CassFuture, CassFree>;
using StatementPtr = std::unique_ptr<CassStatement, CassFree>;
using ResultPtr = std::unique_ptr<const CassResult, CassFree>;
using IteratorPtr = std::unique_ptr<CassIterator, CassFree>;

constexpr std::array<std::string_view, 4> kColumns{"id", "name", "status", "type"};

bool isIdentifier(std::string_view s) {
    if (s.empty() || s.size() > 48)
        return false;
    auto alpha = [](char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); };
    if (!alpha(s.front()))
        return false;
    for (char c : s) {
        if (!alpha(c) && !(c >= '0' && c <= '9') && c != '_')
            return false;
    }
    return true;
}

bool isColumn(std::string_view key) {
    for (auto c : kColumns) {
        if (c == key)
            return true;
    }
    return false;
}

// Column text of a document field: strings as-is, anything else as JSON
std::string columnText(const Document& v) {
    return v.is_string() ? v.get<std::string>() : v.dump();
}

std::optional<std::string> documentKey(const Document& doc) {
    if (auto it = doc.find("id"); it != doc.end() && !it->is_null())
        return columnText(*it);
    if (auto it = doc.find("_id"); it != doc.end() && !it->is_null())
        return columnText(*it);
    return std::nullopt;
}

CassConsistency consistencyFor(const CallContext& ctx) {
    if (ctx.consistencyLevel == "strong")
        return CASS_CONSISTENCY_QUORUM;
    if (ctx.consistencyLevel == "session")
        return CASS_CONSISTENCY_LOCAL_QUORUM;
    return CASS_CONSISTENCY_ONE;
}

Error futureError(CassFuture* future, const std::string& what) {
    const char* message = nullptr;
    size_t length = 0;
    cass_future_error_message(future, &message, &length);
    return Error{ErrorCode::StoreError, what + ": " + std::string(message, length)};
}

} // namespace

struct CassandraStoreDriver::Impl {
    std::string contactPoints;
    std::string keyspace;
    int replicationFactor = 3;
    std::chrono::milliseconds requestTimeout;

    ClusterPtr cluster;
    SessionPtr session;
    std::atomic<bool> connected{false};

    Result<ResultPtr> execute(const std::string& query, const std::vector<std::string>& binds,
                              CassConsistency consistency) {
        if (!connected.load())
            return Error{ErrorCode::StoreError, "cassandra session is not connected"};
        StatementPtr statement(cass_statement_new(query.c_str(), binds.size()));
        for (std::size_t i = 0; i < binds.size(); ++i)
            cass_statement_bind_string(statement.get(), i, binds[i].c_str());
        cass_statement_set_consistency(statement.get(), consistency);
        cass_statement_set_paging_size(statement.get(), -1);

        FuturePtr future(cass_session_execute(session.get(), statement.get()));
        cass_future_wait(future.get());
        if (cass_future_error_code(future.get()) != CASS_OK)
            return futureError(future.get(), query.substr(0, query.find(' ')));
        return ResultPtr(cass_future_get_result(future.get()));
    }

    std::string qualified(const std::string& table) const { return keyspace + "." + table; }

    // SELECT body ... WHERE <filter>; only the known columns can be filtered on
    Result<std::vector<Document>> select(const std::string& table, const Document& filter,
                                         CassConsistency consistency) {
        if (!filter.is_object())
            return Error{ErrorCode::InvalidArgument, "filter must be an object"};
        std::string where;
        std::vector<std::string> binds;
        bool byKeyOnly = true;
        for (auto it = filter.begin(); it != filter.end(); ++it) {
            const std::string column = it.key() == "_id" ? "id" : it.key();
            if (!isColumn(column)) {
                return Error{ErrorCode::InvalidArgument,
                             "cannot filter on column '" + it.key() + "'"};
            }
            where += (where.empty() ? " WHERE " : " AND ") + column + " = ?";
            binds.push_back(columnText(it.value()));
            if (column != "id")
                byKeyOnly = false;
        }
        std::string query = "SELECT body FROM " + qualified(table) + where;
        if (!where.empty() && !byKeyOnly)
            query += " ALLOW FILTERING";

        auto result = execute(query, binds, consistency);
        if (!result)
            return result.error();

        std::vector<Document> out;
        IteratorPtr rows(cass_iterator_from_result(result.value().get()));
        while (cass_iterator_next(rows.get())) {
            const CassValue* body = cass_row_get_column(cass_iterator_get_row(rows.get()), 0);
            const char* text = nullptr;
            size_t length = 0;
            if (cass_value_get_string(body, &text, &length) != CASS_OK)
                continue;
            auto doc = Document::parse(std::string(text, length), nullptr, false);
            if (!doc.is_discarded())
                out.push_back(std::move(doc));
        }
        return out;
    }

    Result<void> upsert(const std::string& table, const Document& doc,
                        CassConsistency consistency) {
        auto key = documentKey(doc);
        if (!key)
            return Error{ErrorCode::InvalidArgument, "document has no id or _id"};
        std::vector<std::string> binds{*key};
        for (std::size_t i = 1; i < kColumns.size(); ++i) {
            auto it = doc.find(std::string(kColumns[i]));
            binds.push_back(it == doc.end() || it->is_null() ? std::string() : columnText(*it));
        }
        binds.push_back(doc.dump());
        auto r = execute("INSERT INTO " + qualified(table) +
                             " (id, name, status, type, body) VALUES (?, ?, ?, ?, ?)",
                         binds, consistency);
        if (!r)
            return r.error();
        return Result<void>();
    }
};

CassandraStoreDriver::CassandraStoreDriver(std::string contactPoints, std::string keyspace,
                                           int replicationFactor,
                                           std::chrono::milliseconds requestTimeout)
    : impl_(std::make_unique<Impl>()) {
    if (!isIdentifier(keyspace))
        throw std::invalid_argument("invalid Cassandra keyspace: " + keyspace);
    impl_->contactPoints = std::move(contactPoints);
    impl_->keyspace = std::move(keyspace);
    impl_->replicationFactor = replicationFactor;
    impl_->requestTimeout = requestTimeout;
}

CassandraStoreDriver::~CassandraStoreDriver() {
    if (impl_->session && impl_->connected.load()) {
        FuturePtr closing(cass_session_close(impl_->session.get()));
        cass_future_wait(closing.get());
    }
}

Result<void> CassandraStoreDriver::connect() {
    std::lock_guard<std::mutex> lk(connectMutex_);
    if (impl_->connected.load())
        return Result<void>();

    impl_->cluster.reset(cass_cluster_new());
    impl_->session.reset(cass_session_new());
    if (cass_cluster_set_contact_points(impl_->cluster.get(), impl_->contactPoints.c_str()) !=
        CASS_OK) {
        return Error{ErrorCode::InvalidArgument,
                     "invalid Cassandra contact points: " + impl_->contactPoints};
    }
    cass_cluster_set_request_timeout(impl_->cluster.get(),
                                     static_cast<unsigned>(impl_->requestTimeout.count()));
    cass_cluster_set_connect_timeout(impl_->cluster.get(),
                                     static_cast<unsigned>(impl_->requestTimeout.count()));

    FuturePtr future(cass_session_connect(impl_->session.get(), impl_->cluster.get()));
    cass_future_wait(future.get());
    if (cass_future_error_code(future.get()) != CASS_OK)
        return futureError(future.get(), "connect to " + impl_->contactPoints);
    impl_->connected.store(true);

    auto ks = impl_->execute("CREATE KEYSPACE IF NOT EXISTS " + impl_->keyspace +
                                 " WITH replication = {'class': 'SimpleStrategy', "
                                 "'replication_factor': " +
                                 std::to_string(impl_->replicationFactor) + "}",
                             {}, CASS_CONSISTENCY_QUORUM);
    if (!ks) {
        impl_->connected.store(false);
        return ks.error();
    }
    spdlog::info("[CassandraStoreDriver] connected to {} (keyspace {})", impl_->contactPoints,
                 impl_->keyspace);
    return Result<void>();
}

Result<void> CassandraStoreDriver::ensureTable(const std::string& table) {
    if (!isIdentifier(table))
        return Error{ErrorCode::InvalidArgument, "invalid table name: " + table};
    auto r = impl_->execute("CREATE TABLE IF NOT EXISTS " + impl_->qualified(table) +
                                " (id text PRIMARY KEY, name text, status text, type text, "
                                "body text)",
                            {}, CASS_CONSISTENCY_QUORUM);
    if (!r)
        return r.error();
    return Result<void>();
}

Result<void> CassandraStoreDriver::dropTable(const std::string& table) {
    if (!isIdentifier(table))
        return Error{ErrorCode::InvalidArgument, "invalid table name: " + table};
    auto r = impl_->execute("DROP TABLE IF EXISTS " + impl_->qualified(table), {},
                            CASS_CONSISTENCY_QUORUM);
    if (!r)
        return r.error();
    return Result<void>();
}

Result<void> CassandraStoreDriver::insert(const std::string& table, const Document& doc,
                                          const CallContext& ctx) {
    if (!isIdentifier(table))
        return Error{ErrorCode::InvalidArgument, "invalid table name: " + table};
    if (!doc.is_object())
        return Error{ErrorCode::InvalidArgument, "document must be an object"};
    return impl_->upsert(table, doc, consistencyFor(ctx));
}

Result<std::vector<Document>> CassandraStoreDriver::find(const std::string& table,
                                                         const Document& filter,
                                                         const CallContext& ctx) {
    if (!isIdentifier(table))
        return Error{ErrorCode::InvalidArgument, "invalid table name: " + table};
    return impl_->select(table, filter, consistencyFor(ctx));
}

Result<std::size_t> CassandraStoreDriver::update(const std::string& table, const Document& filter,
                                                 const Document& patch, const CallContext& ctx) {
    if (!isIdentifier(table))
        return Error{ErrorCode::InvalidArgument, "invalid table name: " + table};
    if (!patch.is_object())
        return Error{ErrorCode::InvalidArgument, "patch must be an object"};
    if (patch.contains("id") || patch.contains("_id"))
        return Error{ErrorCode::InvalidArgument, "the id column cannot be updated"};

    const auto consistency = consistencyFor(ctx);
    auto rows = impl_->select(table, filter, consistency);
    if (!rows)
        return rows.error();
    std::size_t modified = 0;
    for (auto& doc : rows.value()) {
        doc.update(patch);
        if (auto r = impl_->upsert(table, doc, consistency); !r)
            return r.error();
        ++modified;
    }
    return modified;
}

Result<std::size_t> CassandraStoreDriver::remove(const std::string& table, const Document& filter,
                                                 const CallContext& ctx) {
    if (!isIdentifier(table))
        return Error{ErrorCode::InvalidArgument, "invalid table name: " + table};
    const auto consistency = consistencyFor(ctx);
    auto rows = impl_->select(table, filter, consistency);
    if (!rows)
        return rows.error();
    std::size_t removed = 0;
    for (const auto& doc : rows.value()) {
        auto key = documentKey(doc);
        if (!key)
            continue;
        auto r = impl_->execute("DELETE FROM " + impl_->qualified(table) + " WHERE id = ?", {*key},
                                consistency);
        if (!r)
            return r.error();
        ++removed;
    }
    return removed;
}

} // namespace faultline::store
