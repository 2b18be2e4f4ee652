#pragma once

/** \file sqlite_face_store.hpp
 *  \brief FaceRecordStore backed by SQLite, with a small connection pool.
 *
 * Schema (created on open if missing):
 *   people(id, display_name, avatar_url, created_at)
 *   photos(id, gallery_id)
 *   photo_faces(id, photo_id, descriptor BLOB, bbox_*, detection_confidence,
 *               person_id, verified, recognition_confidence)
 *
 * Every call leases one connection and runs in one transaction
 * (BEGIN IMMEDIATE for writes). Connections use the WAL journal and a busy
 * timeout so readers and the single writer do not fail on contention.
 *
 * Example usage:
 * ```cpp
 * auto pool = SqliteConnectionPool::open({.path = "faces.db"});
 * auto store = SqliteFaceStore::open(*pool, {.dimension = 512});
 * ```
 */

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "visage/store/face_record_store.hpp"

struct sqlite3;

namespace visage::store {

/** \brief Connection pool configuration. */
struct SqlitePoolConfig {
    std::string path;                  /**< database file; ":memory:" forces a single connection */
    std::size_t max_connections{4};
    int busy_timeout_ms{5000};
};

/** \brief Long-lived pool of SQLite connections.
 *
 * Connections are opened lazily up to max_connections; acquire() blocks while
 * all are leased. The pool must outlive every Lease.
 */
class SqliteConnectionPool {
public:
    /** \brief RAII handle on one pooled connection. */
    class Lease {
    public:
        Lease(SqliteConnectionPool* pool, sqlite3* db) noexcept : pool_(pool), db_(db) {}
        ~Lease();
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        [[nodiscard]] auto get() const noexcept -> sqlite3* { return db_; }

    private:
        void release() noexcept;

        SqliteConnectionPool* pool_{nullptr};
        sqlite3* db_{nullptr};
    };

    /** \brief Create a pool and open its first connection to verify the path. */
    static auto open(SqlitePoolConfig config)
        -> std::expected<std::shared_ptr<SqliteConnectionPool>, core::error>;

    explicit SqliteConnectionPool(SqlitePoolConfig config);
    ~SqliteConnectionPool();

    SqliteConnectionPool(const SqliteConnectionPool&) = delete;
    SqliteConnectionPool& operator=(const SqliteConnectionPool&) = delete;

    auto acquire() -> std::expected<Lease, core::error>;

    [[nodiscard]] auto open_connections() const -> std::size_t;
    [[nodiscard]] auto path() const noexcept -> const std::string& { return config_.path; }

private:
    auto open_connection() -> std::expected<sqlite3*, core::error>;
    void release(sqlite3* db) noexcept;

    SqlitePoolConfig config_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<sqlite3*> idle_;
    std::size_t open_count_{0};
};

/** \brief SqliteFaceStore configuration. */
struct SqliteStoreConfig {
    std::size_t dimension{0};          /**< required descriptor dimension (0 = set by first face) */
    std::size_t scan_batch_size{256};  /**< rows fetched per cursor batch */
};

class SqliteFaceStore final : public FaceRecordStore {
public:
    /** \brief Bind to a pool and create the schema if missing. */
    static auto open(std::shared_ptr<SqliteConnectionPool> pool, SqliteStoreConfig config = {})
        -> std::expected<std::unique_ptr<SqliteFaceStore>, core::error>;

    ~SqliteFaceStore() override;

    auto add_photo(const Photo& photo) -> std::expected<void, core::error> override;
    auto add_face(const FaceRecord& face) -> std::expected<void, core::error> override;
    auto remove_photo(PhotoId photo) -> std::expected<std::vector<FaceRecord>, core::error> override;

    auto create_person(const PersonDraft& draft) -> std::expected<Person, core::error> override;
    auto get_person(PersonId id) const -> std::expected<Person, core::error> override;
    auto list_people() const -> std::expected<std::vector<PersonSummary>, core::error> override;
    auto update_person(PersonId id, const PersonUpdate& update)
        -> std::expected<Person, core::error> override;
    auto delete_person(PersonId id, DeleteCascade policy)
        -> std::expected<DeletionSummary, core::error> override;
    auto create_person_with_faces(const PersonDraft& draft, std::span<const FaceId> faces)
        -> std::expected<Person, core::error> override;

    auto get_face(FaceId id) const -> std::expected<FaceRecord, core::error> override;
    auto faces_for_person(PersonId id) const -> std::expected<std::vector<FaceRecord>, core::error> override;
    auto faces_on_photo(PhotoId id) const -> std::expected<std::vector<FaceRecord>, core::error> override;

    auto set_assignment(FaceId face, PersonId person, bool verified,
                        std::optional<float> confidence)
        -> std::expected<FaceRecord, core::error> override;
    auto clear_assignment(FaceId face) -> std::expected<FaceRecord, core::error> override;
    auto batch_set_verified(std::span<const FaceId> faces, PersonId person)
        -> std::expected<std::size_t, core::error> override;
    auto unlink_faces(PersonId person, std::span<const FaceId> faces)
        -> std::expected<std::vector<FaceRecord>, core::error> override;

    auto verified_descriptors() const
        -> std::expected<std::unique_ptr<DescriptorCursor>, core::error> override;
    auto unassigned_descriptors(const ClusterScope& scope) const
        -> std::expected<std::vector<DescriptorEntry>, core::error> override;

private:
    SqliteFaceStore(std::shared_ptr<SqliteConnectionPool> pool, SqliteStoreConfig config);

    std::shared_ptr<SqliteConnectionPool> pool_;
    SqliteStoreConfig config_;
};

} // namespace visage::store
