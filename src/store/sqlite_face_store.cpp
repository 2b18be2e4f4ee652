/** \file sqlite_face_store.cpp
 *  \brief SQLite FaceRecordStore and connection pool.
 */

#include "visage/store/sqlite_face_store.hpp"
#include "visage/core/logging.hpp"
#include "visage/kernels/distance.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <deque>
#include <utility>

#include <sqlite3.h>

namespace visage::store {

namespace {

constexpr const char* kSchema = R"(
    CREATE TABLE IF NOT EXISTS people (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        display_name TEXT NOT NULL,
        avatar_url TEXT,
        created_at INTEGER NOT NULL
    );
    CREATE TABLE IF NOT EXISTS photos (
        id INTEGER PRIMARY KEY,
        gallery_id INTEGER NOT NULL
    );
    CREATE TABLE IF NOT EXISTS photo_faces (
        id INTEGER PRIMARY KEY,
        photo_id INTEGER NOT NULL REFERENCES photos(id),
        descriptor BLOB NOT NULL,
        bbox_x REAL, bbox_y REAL, bbox_w REAL, bbox_h REAL,
        detection_confidence REAL,
        person_id INTEGER NULL REFERENCES people(id),
        verified INTEGER NOT NULL DEFAULT 0,
        recognition_confidence REAL NULL
    );
    CREATE INDEX IF NOT EXISTS idx_faces_person ON photo_faces(person_id);
    CREATE INDEX IF NOT EXISTS idx_faces_photo ON photo_faces(photo_id);
    CREATE INDEX IF NOT EXISTS idx_photos_gallery ON photos(gallery_id);
)";

constexpr const char* kFaceColumns =
    "id, photo_id, descriptor, bbox_x, bbox_y, bbox_w, bbox_h, detection_confidence, "
    "person_id, verified, recognition_confidence";

auto sqlite_error(sqlite3* db, const std::string& what, const char* component) -> std::unexpected<core::error> {
    const char* detail = db ? sqlite3_errmsg(db) : "no connection";
    core::logger().error("[store.sqlite] {}: {}", what, detail);
    return core::make_error(core::error_code::store_failure, what + ": " + detail, component);
}

auto now_seconds() -> Timestamp {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

auto sorted_unique(std::span<const FaceId> ids) -> std::vector<FaceId> {
    std::vector<FaceId> out(ids.begin(), ids.end());
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

inline auto to_sql(std::uint64_t id) -> sqlite3_int64 { return static_cast<sqlite3_int64>(id); }

/** Prepared statement with RAII finalize. */
class Statement {
public:
    static auto prepare(sqlite3* db, const std::string& sql, const char* component)
        -> std::expected<Statement, core::error> {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            return sqlite_error(db, "Failed to prepare statement", component);
        }
        return Statement(db, stmt, component);
    }

    ~Statement() { if (stmt_) sqlite3_finalize(stmt_); }
    Statement(Statement&& o) noexcept
        : db_(o.db_), stmt_(std::exchange(o.stmt_, nullptr)), component_(o.component_) {}
    Statement& operator=(Statement&&) = delete;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int idx, std::uint64_t v) { sqlite3_bind_int64(stmt_, idx, to_sql(v)); }
    void bind_int(int idx, std::int64_t v) { sqlite3_bind_int64(stmt_, idx, v); }
    void bind(int idx, double v) { sqlite3_bind_double(stmt_, idx, v); }
    void bind(int idx, const std::string& s) {
        sqlite3_bind_text(stmt_, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
    }
    void bind(int idx, const std::optional<std::string>& s) {
        if (s) bind(idx, *s); else sqlite3_bind_null(stmt_, idx);
    }
    void bind(int idx, const std::vector<float>& v) {
        sqlite3_bind_blob(stmt_, idx, v.data(), static_cast<int>(v.size() * sizeof(float)),
                          SQLITE_TRANSIENT);
    }
    template <typename T>
    void bind_optional(int idx, const std::optional<T>& v) {
        if (v) bind(idx, *v); else sqlite3_bind_null(stmt_, idx);
    }

    /** \brief Step once. true = a row is available, false = done. */
    auto step() -> std::expected<bool, core::error> {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        return sqlite_error(db_, "Statement step failed", component_);
    }

    auto exec() -> std::expected<void, core::error> {
        auto r = step();
        if (!r) return std::unexpected(r.error());
        return {};
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    auto u64(int col) const -> std::uint64_t {
        return static_cast<std::uint64_t>(sqlite3_column_int64(stmt_, col));
    }
    auto i64(int col) const -> std::int64_t { return sqlite3_column_int64(stmt_, col); }
    auto real(int col) const -> double { return sqlite3_column_double(stmt_, col); }
    auto is_null(int col) const -> bool { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }
    auto text(int col) const -> std::string {
        const auto* p = sqlite3_column_text(stmt_, col);
        return p ? std::string(reinterpret_cast<const char*>(p),
                               static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col)))
                 : std::string{};
    }
    auto floats(int col) const -> std::vector<float> {
        const auto* data = sqlite3_column_blob(stmt_, col);
        const auto bytes = static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col));
        std::vector<float> out(bytes / sizeof(float));
        if (data && !out.empty()) std::memcpy(out.data(), data, out.size() * sizeof(float));
        return out;
    }

    [[nodiscard]] auto changes() const -> std::size_t {
        return static_cast<std::size_t>(sqlite3_changes(db_));
    }

private:
    Statement(sqlite3* db, sqlite3_stmt* stmt, const char* component)
        : db_(db), stmt_(stmt), component_(component) {}

    sqlite3* db_;
    sqlite3_stmt* stmt_;
    const char* component_;
};

auto exec_sql(sqlite3* db, const char* sql, const char* component) -> std::expected<void, core::error> {
    char* err_msg = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string detail = err_msg ? err_msg : "unknown";
        sqlite3_free(err_msg);
        core::logger().error("[store.sqlite] SQL error: {}", detail);
        return core::make_error(core::error_code::store_failure, "SQL error: " + detail, component);
    }
    return {};
}

/** Transaction that rolls back unless committed. */
class Transaction {
public:
    static auto begin(sqlite3* db, bool immediate, const char* component)
        -> std::expected<Transaction, core::error> {
        auto r = exec_sql(db, immediate ? "BEGIN IMMEDIATE" : "BEGIN DEFERRED", component);
        if (!r) return std::unexpected(r.error());
        return Transaction(db, component);
    }

    ~Transaction() {
        if (db_ && !done_) {
            if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
                core::logger().error("[store.sqlite] rollback failed: {}", sqlite3_errmsg(db_));
            }
        }
    }
    Transaction(Transaction&& o) noexcept
        : db_(std::exchange(o.db_, nullptr)), component_(o.component_), done_(o.done_) {}
    Transaction& operator=(Transaction&&) = delete;
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    auto commit() -> std::expected<void, core::error> {
        auto r = exec_sql(db_, "COMMIT", component_);
        if (r) done_ = true;
        return r;
    }

private:
    Transaction(sqlite3* db, const char* component) : db_(db), component_(component) {}

    sqlite3* db_;
    const char* component_;
    bool done_{false};
};

auto read_face(const Statement& st) -> FaceRecord {
    FaceRecord f;
    f.id = st.u64(0);
    f.photo_id = st.u64(1);
    f.descriptor = st.floats(2);
    f.bounding_box = BoundingBox{static_cast<float>(st.real(3)), static_cast<float>(st.real(4)),
                                 static_cast<float>(st.real(5)), static_cast<float>(st.real(6))};
    f.detection_confidence = static_cast<float>(st.real(7));
    if (!st.is_null(8)) f.person_id = st.u64(8);
    f.verified = st.i64(9) != 0;
    if (!st.is_null(10)) f.recognition_confidence = static_cast<float>(st.real(10));
    return f;
}

auto read_person(const Statement& st) -> Person {
    Person p;
    p.id = st.u64(0);
    p.display_name = st.text(1);
    if (!st.is_null(2)) p.avatar_url = st.text(2);
    p.created_at = st.i64(3);
    return p;
}

auto load_face(sqlite3* db, FaceId id, const char* component)
    -> std::expected<std::optional<FaceRecord>, core::error> {
    auto st = Statement::prepare(db, std::string("SELECT ") + kFaceColumns +
                                     " FROM photo_faces WHERE id = ?", component);
    if (!st) return std::unexpected(st.error());
    st->bind(1, id);
    auto row = st->step();
    if (!row) return std::unexpected(row.error());
    if (!*row) return std::optional<FaceRecord>{};
    return std::optional<FaceRecord>{read_face(*st)};
}

auto load_person(sqlite3* db, PersonId id, const char* component)
    -> std::expected<std::optional<Person>, core::error> {
    auto st = Statement::prepare(
        db, "SELECT id, display_name, avatar_url, created_at FROM people WHERE id = ?", component);
    if (!st) return std::unexpected(st.error());
    st->bind(1, id);
    auto row = st->step();
    if (!row) return std::unexpected(row.error());
    if (!*row) return std::optional<Person>{};
    return std::optional<Person>{read_person(*st)};
}

auto photo_exists(sqlite3* db, PhotoId id, const char* component) -> std::expected<bool, core::error> {
    auto st = Statement::prepare(db, "SELECT 1 FROM photos WHERE id = ?", component);
    if (!st) return std::unexpected(st.error());
    st->bind(1, id);
    return st->step();
}

auto select_faces(sqlite3* db, const std::string& where, std::uint64_t key, const char* component)
    -> std::expected<std::vector<FaceRecord>, core::error> {
    auto st = Statement::prepare(db, std::string("SELECT ") + kFaceColumns + " FROM photo_faces WHERE " +
                                         where + " ORDER BY id", component);
    if (!st) return std::unexpected(st.error());
    st->bind(1, key);
    std::vector<FaceRecord> out;
    while (true) {
        auto row = st->step();
        if (!row) return std::unexpected(row.error());
        if (!*row) break;
        out.push_back(read_face(*st));
    }
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// SqliteConnectionPool

SqliteConnectionPool::Lease::~Lease() { release(); }

SqliteConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr)), db_(std::exchange(other.db_, nullptr)) {}

SqliteConnectionPool::Lease& SqliteConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = std::exchange(other.pool_, nullptr);
        db_ = std::exchange(other.db_, nullptr);
    }
    return *this;
}

void SqliteConnectionPool::Lease::release() noexcept {
    if (pool_ && db_) pool_->release(db_);
    pool_ = nullptr;
    db_ = nullptr;
}

SqliteConnectionPool::SqliteConnectionPool(SqlitePoolConfig config)
    : config_(std::move(config)) {
    if (config_.path == ":memory:" || config_.max_connections == 0) {
        config_.max_connections = 1;
    }
}

SqliteConnectionPool::~SqliteConnectionPool() {
    std::lock_guard lock(mutex_);
    for (auto* db : idle_) sqlite3_close(db);
    idle_.clear();
}

auto SqliteConnectionPool::open(SqlitePoolConfig config)
    -> std::expected<std::shared_ptr<SqliteConnectionPool>, core::error> {
    auto pool = std::make_shared<SqliteConnectionPool>(std::move(config));
    auto lease = pool->acquire();
    if (!lease) return std::unexpected(lease.error());
    core::logger().info("[store.sqlite] opened {} (max {} connections)",
                        pool->config_.path, pool->config_.max_connections);
    return pool;
}

auto SqliteConnectionPool::open_connection() -> std::expected<sqlite3*, core::error> {
    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    if (sqlite3_open_v2(config_.path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        auto err = sqlite_error(db, "Cannot open database " + config_.path, "store.sqlite.pool");
        sqlite3_close(db);
        return err;
    }
    sqlite3_busy_timeout(db, config_.busy_timeout_ms);
    auto r = exec_sql(db, "PRAGMA journal_mode=WAL; PRAGMA synchronous=NORMAL; PRAGMA foreign_keys=ON;",
                      "store.sqlite.pool");
    if (!r) {
        sqlite3_close(db);
        return std::unexpected(r.error());
    }
    return db;
}

auto SqliteConnectionPool::acquire() -> std::expected<Lease, core::error> {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return !idle_.empty() || open_count_ < config_.max_connections; });
    if (!idle_.empty()) {
        sqlite3* db = idle_.back();
        idle_.pop_back();
        return Lease(this, db);
    }
    ++open_count_;
    lock.unlock();

    auto db = open_connection();
    if (!db) {
        std::lock_guard relock(mutex_);
        --open_count_;
        cv_.notify_one();
        return std::unexpected(db.error());
    }
    return Lease(this, *db);
}

void SqliteConnectionPool::release(sqlite3* db) noexcept {
    {
        std::lock_guard lock(mutex_);
        idle_.push_back(db);
    }
    cv_.notify_one();
}

auto SqliteConnectionPool::open_connections() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return open_count_;
}

// ---------------------------------------------------------------------------
// Cursor

namespace {

class SqliteVerifiedCursor final : public DescriptorCursor {
public:
    SqliteVerifiedCursor(std::shared_ptr<SqliteConnectionPool> pool, std::size_t batch)
        : pool_(std::move(pool)), batch_(std::max<std::size_t>(1, batch)) {}

    auto next() -> std::expected<std::optional<DescriptorEntry>, core::error> override {
        if (buffer_.empty() && !exhausted_) {
            auto r = fetch();
            if (!r) {
                exhausted_ = true;
                return std::unexpected(r.error());
            }
        }
        if (buffer_.empty()) return std::optional<DescriptorEntry>{};
        DescriptorEntry e = std::move(buffer_.front());
        buffer_.pop_front();
        return std::optional<DescriptorEntry>{std::move(e)};
    }

private:
    auto fetch() -> std::expected<void, core::error> {
        constexpr const char* component = "store.sqlite.cursor";
        auto lease = pool_->acquire();
        if (!lease) return std::unexpected(lease.error());
        auto st = Statement::prepare(
            lease->get(),
            "SELECT id, person_id, descriptor FROM photo_faces "
            "WHERE verified = 1 AND id > ? ORDER BY id LIMIT ?", component);
        if (!st) return std::unexpected(st.error());
        st->bind_int(1, last_ ? to_sql(*last_) : -1);
        st->bind_int(2, static_cast<std::int64_t>(batch_));
        std::size_t fetched = 0;
        while (true) {
            auto row = st->step();
            if (!row) return std::unexpected(row.error());
            if (!*row) break;
            DescriptorEntry e{st->u64(0), std::nullopt, st->floats(2)};
            if (!st->is_null(1)) e.person_id = st->u64(1);
            last_ = e.face_id;
            buffer_.push_back(std::move(e));
            ++fetched;
        }
        if (fetched < batch_) exhausted_ = true;
        return {};
    }

    std::shared_ptr<SqliteConnectionPool> pool_;
    std::size_t batch_;
    std::deque<DescriptorEntry> buffer_;
    std::optional<FaceId> last_;
    bool exhausted_{false};
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// SqliteFaceStore

SqliteFaceStore::SqliteFaceStore(std::shared_ptr<SqliteConnectionPool> pool, SqliteStoreConfig config)
    : pool_(std::move(pool)), config_(config) {}

SqliteFaceStore::~SqliteFaceStore() = default;

auto SqliteFaceStore::open(std::shared_ptr<SqliteConnectionPool> pool, SqliteStoreConfig config)
    -> std::expected<std::unique_ptr<SqliteFaceStore>, core::error> {
    if (!pool) {
        return core::make_error(core::error_code::invalid_argument, "Connection pool is null",
                                "store.sqlite.open");
    }
    {
        auto lease = pool->acquire();
        if (!lease) return std::unexpected(lease.error());
        auto r = exec_sql(lease->get(), kSchema, "store.sqlite.open");
        if (!r) return std::unexpected(r.error());
    }
    return std::unique_ptr<SqliteFaceStore>(new SqliteFaceStore(std::move(pool), config));
}

auto SqliteFaceStore::add_photo(const Photo& photo) -> std::expected<void, core::error> {
    constexpr const char* component = "store.sqlite.add_photo";
    auto lease = pool_->acquire();
    if (!lease) return std::unexpected(lease.error());
    sqlite3* db = lease->get();
    auto tx = Transaction::begin(db, true, component);
    if (!tx) return std::unexpected(tx.error());

    auto sel = Statement::prepare(db, "SELECT gallery_id FROM photos WHERE id = ?", component);
    if (!sel) return std::unexpected(sel.error());
    sel->bind(1, photo.id);
    auto row = sel->step();
    if (!row) return std::unexpected(row.error());
    if (*row) {
        if (sel->u64(0) == photo.gallery_id) return tx->commit();
        return core::make_error(core::error_code::validation_failed,
                                "Photo already registered under a different gallery", component);
    }
    auto ins = Statement::prepare(db, "INSERT INTO photos (id, gallery_id) VALUES (?, ?)", component);
    if (!ins) return std::unexpected(ins.error());
    ins->bind(1, photo.id);
    ins->bind(2, photo.gallery_id);
    if (auto r = ins->exec(); !r) return r;
    return tx->commit();
}

auto SqliteFaceStore::add_face(const FaceRecord& face) -> std::expected<void, core::error> {
    constexpr const char* component = "store.sqlite.add_face";
    std::vector<float> descriptor = face.descriptor;
    if (descriptor.empty() || !kernels::all_finite(descriptor) || !kernels::normalize(descriptor)) {
        return core::make_error(core::error_code::validation_failed,
                                "Descriptor must be non-empty, finite and non-zero", component, {face.id});
    }
    if (config_.dimension != 0 && descriptor.size() != config_.dimension) {
        return core::make_error(core::error_code::validation_failed, "Descriptor dimension mismatch",
                                component, {face.id});
    }

    auto lease = pool_->acquire();
    if (!lease) return std::unexpected(lease.error());
    sqlite3* db = lease->get();
    auto tx = Transaction::begin(db, true, component);
    if (!tx) return std::unexpected(tx.error());

    if (config_.dimension == 0) {
        auto dim = Statement::prepare(db, "SELECT length(descriptor) FROM photo_faces LIMIT 1", component);
        if (!dim) return std::unexpected(dim.error());
        auto row = dim->step();
        if (!row) return std::unexpected(row.error());
        if (*row && dim->u64(0) != descriptor.size() * sizeof(float)) {
            return core::make_error(core::error_code::validation_failed, "Descriptor dimension mismatch",
                                    component, {face.id});
        }
    }
    auto photo = photo_exists(db, face.photo_id, component);
    if (!photo) return std::unexpected(photo.error());
    if (!*photo) {
        return core::make_error(core::error_code::not_found, "Photo not found", component, {face.photo_id});
    }
    auto existing = load_face(db, face.id, component);
    if (!existing) return std::unexpected(existing.error());
    if (*existing) {
        return core::make_error(core::error_code::validation_failed, "Face id already exists",
                                component, {face.id});
    }

    auto ins = Statement::prepare(db,
        "INSERT INTO photo_faces (id, photo_id, descriptor, bbox_x, bbox_y, bbox_w, bbox_h, "
        "detection_confidence, person_id, verified, recognition_confidence) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, NULL, 0, NULL)", component);
    if (!ins) return std::unexpected(ins.error());
    ins->bind(1, face.id);
    ins->bind(2, face.photo_id);
    ins->bind(3, descriptor);
    ins->bind(4, static_cast<double>(face.bounding_box.x));
    ins->bind(5, static_cast<double>(face.bounding_box.y));
    ins->bind(6, static_cast<double>(face.bounding_box.width));
    ins->bind(7, static_cast<double>(face.bounding_box.height));
    ins->bind(8, static_cast<double>(face.detection_confidence));
    if (auto r = ins->exec(); !r) return r;
    return tx->commit();
}

auto SqliteFaceStore::remove_photo(PhotoId photo) -> std::expected<std::vector<FaceRecord>, core::error> {
    constexpr const char* component = "store.sqlite.remove_photo";
    auto lease = pool_->acquire();
    if (!lease) return std::unexpected(lease.error());
    sqlite3* db = lease->get();
    auto tx = Transaction::begin(db, true, component);
    if (!tx) return std::unexpected(tx.error());

    auto exists = photo_exists(db, photo, component);
    if (!exists) return std::unexpected(exists.error());
    if (!*exists) return core::make_error(core::error_code::not_found, "Photo not found", component, {photo});

    auto faces = select_faces(db, "photo_id = ?", photo, component);
    if (!faces) return std::unexpected(faces.error());
    for (const char* sql : {"DELETE FROM photo_faces WHERE photo_id = ?", "DELETE FROM photos WHERE id = ?"}) {
        auto del = Statement::prepare(db, sql, component);
        if (!del) return std::unexpected(del.error());
        del->bind(1, photo);
        if (auto r = del->exec(); !r) return std::unexpected(r.error());
    }
    if (auto r = tx->commit(); !r) return std::unexpected(r.error());
    return faces;
}

namespace {

auto insert_person(sqlite3* db, const PersonDraft& draft, const char* component)
    -> std::expected<Person, core::error> {
    auto ins = Statement::prepare(db,
        "INSERT INTO people (display_name, avatar_url, created_at) VALUES (?, ?, ?)", component);
    if (!ins) return std::unexpected(ins.error());
    Person p{0, draft.display_name, draft.avatar_url, now_seconds()};
    ins->bind(1, p.display_name);
    ins->bind(2, p.avatar_url);
    ins->bind_int(3, p.created_at);
    if (auto r = ins->exec(); !r) return std::unexpected(r.error());
    p.id = static_cast<PersonId>(sqlite3_last_insert_rowid(db));
    return p;
}

auto person_not_found(PersonId id, const char* component) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::not_found, "Person not found", component, {id});
}

auto require_person(sqlite3* db, PersonId id, const char* component) -> std::expected<Person, core::error> {
    auto p = load_person(db, id, component);
    if (!p) return std::unexpected(p.error());
    if (!*p) return person_not_found(id, component);
    return **p;
}

} // anonymous namespace

auto SqliteFaceStore::create_person(const PersonDraft& draft) -> std::expected<Person, core::error> {
    constexpr const char* component = "store.sqlite.create_person";
    if (draft.display_name.empty()) {
        return core::make_error(core::error_code::validation_failed,
                                "Person display name must not be empty", component);
    }
    auto lease = pool_->acquire();
    if (!lease) return std::unexpected(lease.error());
    auto tx = Transaction::begin(lease->get(), true, component);
    if (!tx) return std::unexpected(tx.error());
    auto p = insert_person(lease->get(), draft, component);
    if (!p) return p;
    if (auto r = tx->commit(); !r) return std::unexpected(r.error());
    return p;
}

auto SqliteFaceStore::get_person(PersonId id) const -> std::expected<Person, core::error> {
    auto lease = pool_->acquire();
    if (!lease) return std::unexpected(lease.error());
    return require_person(lease->get(), id, "store.sqlite.get_person");
}

auto SqliteFaceStore::list_people() const -> std::expected<std::vector<PersonSummary>, core::error> {
    constexpr const char* component = "store.sqlite.list_people";
    auto lease = pool_->acquire();
    if (!lease) return std::unexpected(lease.error());
    auto st = Statement::prepare(lease->get(),
        "SELECT p.id, p.display_name, p.avatar_url, p.created_at, "
        "COUNT(f.id), COALESCE(SUM(f.verified), 0) "
        "FROM people p LEFT JOIN photo_faces f ON f.person_id = p.id "
        "GROUP BY p.id ORDER BY p.id", component);
    if (!st) return std::unexpected(st.error());
    std::vector<PersonSummary> out;
    while (true) {
        auto row = st->step();
        if (!row) return std::unexpected(row.error());
        if (!*row) break;
        out.push_back(PersonSummary{read_person(*st), static_cast<std::size_t>(st->u64(4)),
                                    static_cast<std::size_t>(st->u64(5))});
    }
    return out;
}

auto SqliteFaceStore::update_person(PersonId id, const PersonUpdate& update)
    -> std::expected<Person, core::error> {
    constexpr const char* component = "store.sqlite.update_person";
    if (update.display_name && update.display_name->empty()) {
        return core::make_error(core::error_code::validation_failed,
                                "Person display name must not be empty", component, {id});
    }
    auto lease = pool_->acquire();
    if (!lease) return std::unexpected(lease.error());
    sqlite3* db = lease->get();
    auto tx = Transaction::begin(db, true, component);
    if (!tx) return std::unexpected(tx.error());

    auto person = require_person(db, id, component);
    if (!person) return person;
    if (update.display_name) person->display_name = *update.display_name;
    if (update.avatar_url) person->avatar_url = *update.avatar_url;

    auto st = Statement::prepare(db, "UPDATE people SET display_name = ?, avatar_url = ? WHERE id = ?",
                                 component);
    if (!st) return std::unexpected(st.error());
    st->bind(1, person->display_name);
    st->bind(2, person->avatar_url);
    st->bind(3, id);
    if (auto r = st->exec(); !r) return std::unexpected(r.error());
    if (auto r = tx->commit(); !r) return std::unexpected(r.error());
    return person;
}

auto SqliteFaceStore::delete_person(PersonId id, DeleteCascade policy)
    -> std::expected<DeletionSummary, core::error> {
    constexpr const char* component = "store.sqlite.delete_person";
    auto lease = pool_->acquire();
    if (!lease) return std::unexpected(lease.error());
    sqlite3* db = lease->get();
    auto tx = Transaction::begin(db, true, component);
    if (!tx) return std::unexpected(tx.error());

    if (auto p = require_person(db, id, component); !p) return std::unexpected(p.error());

    DeletionSummary summary;
    {
        auto st = Statement::prepare(db,
            "SELECT COUNT(*) FROM photo_faces WHERE person_id = ? AND verified = 1", component);
        if (!st) return std::unexpected(st.error());
        st->bind(1, id);
        auto row = st->step();
        if (!row) return std::unexpected(row.error());
        summary.removed_verified = *row && st->u64(0) > 0;
    }
    {
        const char* sql = policy == DeleteCascade::detach
            ? "UPDATE photo_faces SET person_id = NULL, verified = 0, recognition_confidence = NULL "
              "WHERE person_id = ?"
            : "DELETE FROM photo_faces WHERE person_id = ?";
        auto st = Statement::prepare(db, sql, component);
        if (!st) return std::unexpected(st.error());
        st->bind(1, id);
        if (auto r = st->exec(); !r) return std::unexpected(r.error());
        (policy == DeleteCascade::detach ? summary.detached : summary.removed) = st->changes();
    }
    {
        auto st = Statement::prepare(db, "DELETE FROM people WHERE id = ?", component);
        if (!st) return std::unexpected(st.error());
        st->bind(1, id);
        if (auto r = st->exec(); !r) return std::unexpected(r.error());
    }
    if (auto r = tx->commit(); !r) return std::unexpected(r.error());
    return summary;
}

auto SqliteFaceStore::create_person_with_faces(const PersonDraft& draft, std::span<const FaceId> faces)
    -> std::expected<Person, core::error> {
    constexpr const char* component = "store.sqlite.create_person_with_faces";
    if (faces.empty()) {
        return core::make_error(core::error_code::validation_failed,
                                "Cannot create a person from an empty face list", component);
    }
    if (draft.display_name.empty()) {
        return core::make_error(core::error_code::validation_failed,
                                "Person display name must not be empty", component);
    }
    const auto ids = sorted_unique(faces);

    auto lease = pool_->acquire();
    if (!lease) return std::unexpected(lease.error());
    sqlite3* db = lease->get();
    auto tx = Transaction::begin(db, true, component);
    if (!tx) return std::unexpected(tx.error());

    std::vector<std::uint64_t> offending;
    {
        auto st = Statement::prepare(db, "SELECT person_id FROM photo_faces WHERE id = ?", component);
        if (!st) return std::unexpected(st.error());
        for (FaceId id : ids) {
            st->reset();
            st->bind(1, id);
            auto row = st->step();
            if (!row) return std::unexpected(row.error());
            if (!*row || !st->is_null(0)) offending.push_back(id);
        }
    }
    if (!offending.empty()) {
        return core::make_error(core::error_code::validation_failed,
                                "Faces are unknown or already assigned", component, std::move(offending));
    }

    auto person = insert_person(db, draft, component);
    if (!person) return person;
    auto st = Statement::prepare(db,
        "UPDATE photo_faces SET person_id = ?, verified = 1, recognition_confidence = 1.0 WHERE id = ?",
        component);
    if (!st) return std::unexpected(st.error());
    for (FaceId id : ids) {
        st->reset();
        st->bind(1, person->id);
        st->bind(2, id);
        if (auto r = st->exec(); !r) return std::unexpected(r.error());
    }
    if (auto r = tx->commit(); !r) return std::unexpected(r.error());
    return person;
}

auto SqliteFaceStore::get_face(FaceId id) const -> std::expected<FaceRecord, core::error> {
    constexpr const char* component = "store.sqlite.get_face";
    auto lease = pool_->acquire();
    if (!lease) return std::unexpected(lease.error());
    auto face = load_face(lease->get(), id, component);
    if (!face) return std::unexpected(face.error());
    if (!*face) return core::make_error(core::error_code::not_found, "Face not found", component, {id});
    return **face;
}

auto SqliteFaceStore::faces_for_person(PersonId id) const
    -> std::expected<std::vector<FaceRecord>, core::error> {
    constexpr const char* component = "store.sqlite.faces_for_person";
    auto lease = pool_->acquire();
    if (!lease) return std::unexpected(lease.error());
    auto tx = Transaction::begin(lease->get(), false, component);
    if (!tx) return std::unexpected(tx.error());
    if (auto p = require_person(lease->get(), id, component); !p) return std::unexpected(p.error());
    auto faces = select_faces(lease->get(), "person_id = ?", id, component);
    if (!faces) return faces;
    if (auto r = tx->commit(); !r) return std::unexpected(r.error());
    return faces;
}

auto SqliteFaceStore::faces_on_photo(PhotoId id) const
    -> std::expected<std::vector<FaceRecord>, core::error> {
    constexpr const char* component = "store.sqlite.faces_on_photo";
    auto lease = pool_->acquire();
    if (!lease) return std::unexpected(lease.error());
    auto tx = Transaction::begin(lease->get(), false, component);
    if (!tx) return std::unexpected(tx.error());
    auto exists = photo_exists(lease->get(), id, component);
    if (!exists) return std::unexpected(exists.error());
    if (!*exists) return core::make_error(core::error_code::not_found, "Photo not found", component, {id});
    auto faces = select_faces(lease->get(), "photo_id = ?", id, component);
    if (!faces) return faces;
    if (auto r = tx->commit(); !r) return std::unexpected(r.error());
    return faces;
}

auto SqliteFaceStore::set_assignment(FaceId face, PersonId person, bool verified,
                                     std::optional<float> confidence)
    -> std::expected<FaceRecord, core::error> {
    constexpr const char* component = "store.sqlite.set_assignment";
    if (confidence && (!std::isfinite(*confidence) || *confidence < 0.0f || *confidence > 1.0f)) {
        return core::make_error(core::error_code::validation_failed,
                                "Recognition confidence must lie in [0, 1]", component, {face});
    }
    auto lease = pool_->acquire();
    if (!lease) return std::unexpected(lease.error());
    sqlite3* db = lease->get();
    auto tx = Transaction::begin(db, true, component);
    if (!tx) return std::unexpected(tx.error());

    auto previous = load_face(db, face, component);
    if (!previous) return std::unexpected(previous.error());
    if (!*previous) return core::make_error(core::error_code::not_found, "Face not found", component, {face});
    if (auto p = require_person(db, person, component); !p) return std::unexpected(p.error());

    auto st = Statement::prepare(db,
        "UPDATE photo_faces SET person_id = ?, verified = ?, recognition_confidence = ? WHERE id = ?",
        component);
    if (!st) return std::unexpected(st.error());
    st->bind(1, person);
    st->bind_int(2, verified ? 1 : 0);
    if (verified) {
        st->bind(3, 1.0);
    } else if (confidence) {
        st->bind(3, static_cast<double>(*confidence));
    } else {
        st->bind_optional<double>(3, std::nullopt);
    }
    st->bind(4, face);
    if (auto r = st->exec(); !r) return std::unexpected(r.error());
    if (auto r = tx->commit(); !r) return std::unexpected(r.error());
    return **previous;
}

auto SqliteFaceStore::clear_assignment(FaceId face) -> std::expected<FaceRecord, core::error> {
    constexpr const char* component = "store.sqlite.clear_assignment";
    auto lease = pool_->acquire();
    if (!lease) return std::unexpected(lease.error());
    sqlite3* db = lease->get();
    auto tx = Transaction::begin(db, true, component);
    if (!tx) return std::unexpected(tx.error());

    auto previous = load_face(db, face, component);
    if (!previous) return std::unexpected(previous.error());
    if (!*previous) return core::make_error(core::error_code::not_found, "Face not found", component, {face});
    if ((*previous)->person_id) {
        auto st = Statement::prepare(db,
            "UPDATE photo_faces SET person_id = NULL, verified = 0, recognition_confidence = NULL "
            "WHERE id = ?", component);
        if (!st) return std::unexpected(st.error());
        st->bind(1, face);
        if (auto r = st->exec(); !r) return std::unexpected(r.error());
    }
    if (auto r = tx->commit(); !r) return std::unexpected(r.error());
    return **previous;
}

auto SqliteFaceStore::batch_set_verified(std::span<const FaceId> faces, PersonId person)
    -> std::expected<std::size_t, core::error> {
    constexpr const char* component = "store.sqlite.batch_set_verified";
    const auto ids = sorted_unique(faces);
    auto lease = pool_->acquire();
    if (!lease) return std::unexpected(lease.error());
    sqlite3* db = lease->get();
    auto tx = Transaction::begin(db, true, component);
    if (!tx) return std::unexpected(tx.error());
    if (auto p = require_person(db, person, component); !p) return std::unexpected(p.error());

    auto st = Statement::prepare(db,
        "UPDATE photo_faces SET verified = 1, recognition_confidence = 1.0 "
        "WHERE id = ? AND person_id = ?", component);
    if (!st) return std::unexpected(st.error());
    std::size_t count = 0;
    for (FaceId id : ids) {
        st->reset();
        st->bind(1, id);
        st->bind(2, person);
        if (auto r = st->exec(); !r) return std::unexpected(r.error());
        count += st->changes();
    }
    if (auto r = tx->commit(); !r) return std::unexpected(r.error());
    return count;
}

auto SqliteFaceStore::unlink_faces(PersonId person, std::span<const FaceId> faces)
    -> std::expected<std::vector<FaceRecord>, core::error> {
    constexpr const char* component = "store.sqlite.unlink_faces";
    const auto ids = sorted_unique(faces);
    auto lease = pool_->acquire();
    if (!lease) return std::unexpected(lease.error());
    sqlite3* db = lease->get();
    auto tx = Transaction::begin(db, true, component);
    if (!tx) return std::unexpected(tx.error());
    if (auto p = require_person(db, person, component); !p) return std::unexpected(p.error());

    auto upd = Statement::prepare(db,
        "UPDATE photo_faces SET person_id = NULL, verified = 0, recognition_confidence = NULL "
        "WHERE id = ?", component);
    if (!upd) return std::unexpected(upd.error());
    std::vector<FaceRecord> unlinked;
    for (FaceId id : ids) {
        auto face = load_face(db, id, component);
        if (!face) return std::unexpected(face.error());
        if (!*face || (*face)->person_id != person) continue;
        upd->reset();
        upd->bind(1, id);
        if (auto r = upd->exec(); !r) return std::unexpected(r.error());
        unlinked.push_back(std::move(**face));
    }
    if (auto r = tx->commit(); !r) return std::unexpected(r.error());
    return unlinked;
}

auto SqliteFaceStore::verified_descriptors() const
    -> std::expected<std::unique_ptr<DescriptorCursor>, core::error> {
    return std::unique_ptr<DescriptorCursor>(
        std::make_unique<SqliteVerifiedCursor>(pool_, config_.scan_batch_size));
}

auto SqliteFaceStore::unassigned_descriptors(const ClusterScope& scope) const
    -> std::expected<std::vector<DescriptorEntry>, core::error> {
    constexpr const char* component = "store.sqlite.unassigned_descriptors";
    auto lease = pool_->acquire();
    if (!lease) return std::unexpected(lease.error());
    sqlite3* db = lease->get();
    auto tx = Transaction::begin(db, false, component);
    if (!tx) return std::unexpected(tx.error());

    std::vector<std::uint64_t> missing;
    for (PhotoId photo : scope.photo_ids) {
        auto exists = photo_exists(db, photo, component);
        if (!exists) return std::unexpected(exists.error());
        if (!*exists) missing.push_back(photo);
    }
    if (!missing.empty()) {
        return core::make_error(core::error_code::not_found, "Photo not found", component, std::move(missing));
    }

    std::string sql = "SELECT f.id, f.descriptor FROM photo_faces f JOIN photos p ON p.id = f.photo_id "
                      "WHERE f.person_id IS NULL";
    if (scope.gallery_id) sql += " AND p.gallery_id = ?";
    if (!scope.photo_ids.empty()) {
        sql += " AND f.photo_id IN (";
        for (std::size_t i = 0; i < scope.photo_ids.size(); ++i) sql += i == 0 ? "?" : ", ?";
        sql += ")";
    }
    sql += " ORDER BY f.id";

    auto st = Statement::prepare(db, sql, component);
    if (!st) return std::unexpected(st.error());
    int idx = 1;
    if (scope.gallery_id) st->bind(idx++, *scope.gallery_id);
    for (PhotoId photo : scope.photo_ids) st->bind(idx++, photo);

    std::vector<DescriptorEntry> out;
    while (true) {
        auto row = st->step();
        if (!row) return std::unexpected(row.error());
        if (!*row) break;
        out.push_back(DescriptorEntry{st->u64(0), std::nullopt, st->floats(1)});
    }
    if (auto r = tx->commit(); !r) return std::unexpected(r.error());
    return out;
}

} // namespace visage::store
