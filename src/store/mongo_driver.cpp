#include <faultline/store/mongo_driver.h>

#include <spdlog/spdlog.h>

#include <stdexcept>

#include <bsoncxx/exception/exception.hpp>
#include <bsoncxx/json.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/exception/operation_exception.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/options/delete.hpp>
#include <mongocxx/options/find.hpp>
#include <mongocxx/options/insert.hpp>
#include <mongocxx/options/update.hpp>
#include <mongocxx/pool.hpp>
#include <mongocxx/read_preference.hpp>
#include <mongocxx/uri.hpp>
#include <mongocxx/write_concern.hpp>

namespace faultline::store {

namespace {

// The driver requires exactly one instance per process, created before any pool
mongocxx::instance& driverInstance() {
    static mongocxx::instance instance{};
    return instance;
}

mongocxx::write_concern writeConcernFor(const CallContext& ctx) {
    mongocxx::write_concern wc;
    if (ctx.consistencyLevel == "strong" || ctx.consistencyLevel == "session")
        wc.acknowledge_level(mongocxx::write_concern::level::k_majority);
    else
        wc.acknowledge_level(mongocxx::write_concern::level::k_acknowledged);
    return wc;
}

mongocxx::read_preference readPreferenceFor(const CallContext& ctx) {
    mongocxx::read_preference rp;
    if (ctx.consistencyLevel == "strong")
        rp.mode(mongocxx::read_preference::read_mode::k_primary);
    else if (ctx.consistencyLevel == "session")
        rp.mode(mongocxx::read_preference::read_mode::k_primary_preferred);
    else
        rp.mode(mongocxx::read_preference::read_mode::k_secondary_preferred);
    return rp;
}

bsoncxx::document::value toBson(const Document& doc) {
    return bsoncxx::from_json(doc.dump());
}

template <typename F> auto guarded(const char* op, F&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const bsoncxx::exception& e) {
        return Error{ErrorCode::InvalidArgument, std::string(op) + ": " + e.what()};
    } catch (const mongocxx::exception& e) {
        spdlog::debug("[MongoStoreDriver] {} failed: {}", op, e.what());
        return Error{ErrorCode::StoreError, std::string(op) + ": " + e.what()};
    }
}

} // namespace

struct MongoStoreDriver::Impl {
    Impl(const std::string& uri, std::string db) : pool(mongocxx::uri{uri}), database(std::move(db)) {}

    mongocxx::pool pool;
    std::string database;
};

MongoStoreDriver::MongoStoreDriver(const std::string& uri, std::string database) {
    driverInstance();
    try {
        impl_ = std::make_unique<Impl>(uri, std::move(database));
    } catch (const mongocxx::exception& e) {
        throw std::invalid_argument(std::string("invalid MongoDB URI: ") + e.what());
    }
}

MongoStoreDriver::~MongoStoreDriver() = default;

Result<void> MongoStoreDriver::connect() {
    return guarded("ping", [&]() -> Result<void> {
        auto client = impl_->pool.acquire();
        (*client)[impl_->database].run_command(bsoncxx::from_json(R"({"ping": 1})"));
        return Result<void>();
    });
}

Result<void> MongoStoreDriver::ensureTable(const std::string& table) {
    return guarded("create collection", [&]() -> Result<void> {
        auto client = impl_->pool.acquire();
        auto db = (*client)[impl_->database];
        if (db.has_collection(table))
            return Result<void>();
        try {
            db.create_collection(table);
        } catch (const mongocxx::operation_exception&) {
            // Lost a creation race with another client
            if (!db.has_collection(table))
                throw;
        }
        return Result<void>();
    });
}

Result<void> MongoStoreDriver::dropTable(const std::string& table) {
    return guarded("drop collection", [&]() -> Result<void> {
        auto client = impl_->pool.acquire();
        (*client)[impl_->database][table].drop();
        return Result<void>();
    });
}

Result<void> MongoStoreDriver::insert(const std::string& table, const Document& doc,
                                      const CallContext& ctx) {
    if (!doc.is_object())
        return Error{ErrorCode::InvalidArgument, "document must be an object"};
    return guarded("insert", [&]() -> Result<void> {
        auto client = impl_->pool.acquire();
        mongocxx::options::insert opts;
        opts.write_concern(writeConcernFor(ctx));
        (*client)[impl_->database][table].insert_one(toBson(doc), opts);
        return Result<void>();
    });
}

Result<std::vector<Document>> MongoStoreDriver::find(const std::string& table,
                                                     const Document& filter,
                                                     const CallContext& ctx) {
    return guarded("find", [&]() -> Result<std::vector<Document>> {
        auto client = impl_->pool.acquire();
        mongocxx::options::find opts;
        opts.read_preference(readPreferenceFor(ctx));
        std::vector<Document> out;
        auto cursor = (*client)[impl_->database][table].find(toBson(filter), opts);
        for (auto&& doc : cursor)
            out.push_back(Document::parse(bsoncxx::to_json(doc)));
        return out;
    });
}

Result<std::size_t> MongoStoreDriver::update(const std::string& table, const Document& filter,
                                             const Document& patch, const CallContext& ctx) {
    if (!patch.is_object())
        return Error{ErrorCode::InvalidArgument, "patch must be an object"};
    return guarded("update", [&]() -> Result<std::size_t> {
        auto client = impl_->pool.acquire();
        mongocxx::options::update opts;
        opts.write_concern(writeConcernFor(ctx));
        auto result = (*client)[impl_->database][table].update_many(
            toBson(filter), toBson(Document{{"$set", patch}}), opts);
        return static_cast<std::size_t>(result ? result->modified_count() : 0);
    });
}

Result<std::size_t> MongoStoreDriver::remove(const std::string& table, const Document& filter,
                                             const CallContext& ctx) {
    return guarded("delete", [&]() -> Result<std::size_t> {
        auto client = impl_->pool.acquire();
        mongocxx::options::delete_options opts;
        opts.write_concern(writeConcernFor(ctx));
        auto result = (*client)[impl_->database][table].delete_many(toBson(filter), opts);
        return static_cast<std::size_t>(result ? result->deleted_count() : 0);
    });
}

} // namespace faultline::store
