#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include "sqlconnection.hpp"

using PConn = std::shared_ptr<SQLConnection>;
using ConnectionFactory = std::function<PSQLConnection()>;

namespace pool {

enum class DbIntent { Read,
    Write };
enum class PoolAcquireError { Timeout,
    Shutdown };

struct PoolStats {
    std::size_t size { 0 };
    std::size_t in_use { 0 };
    std::size_t waiters { 0 };
};

struct AcquirePolicy {
    std::chrono::milliseconds acquire_timeout { 1500 }; // never block forever
};

class IDbPool;

// --------- RAII Lease ----------
class Lease {
public:
    Lease(IDbPool* owner, PConn conn, DbIntent intent)
        : owner_(owner)
        , conn_(std::move(conn))
        , intent_(intent) { }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    Lease(Lease&& other) noexcept { move_from(other); }
    Lease& operator=(Lease&& other) noexcept {
        if (this != &other) {
            release_();
            move_from(other);
        }
        return *this;
    }

    ~Lease() { release_(); }

    SQLConnection& conn() const { return *conn_; }
    DbIntent intent() const { return intent_; }
    explicit operator bool() const { return !!conn_; }

private:
    void release_();
    void move_from(Lease& o) noexcept {
        owner_ = o.owner_;
        o.owner_ = nullptr;
        conn_ = std::move(o.conn_);
        intent_ = o.intent_;
    }

    IDbPool* owner_ { nullptr };
    PConn conn_ {};
    DbIntent intent_ { DbIntent::Read };
};

// --------- Pool interface ----------
class IDbPool {
public:
    virtual ~IDbPool() = default;

    struct AcquireResult {
        bool ok { false };
        Lease lease { nullptr, nullptr, DbIntent::Read };
        PoolAcquireError error { PoolAcquireError::Timeout };
    };

    virtual AcquireResult acquire(DbIntent intent,
        std::chrono::milliseconds timeoutOverride = std::chrono::milliseconds::zero())
        = 0;

    virtual PoolStats stats() const = 0;
    virtual void shutdown() = 0;
    virtual std::size_t capacity() const = 0;
    virtual const std::string& dsn() const = 0;

    // acquire() that throws when no connection frees up in time
    Lease lease(DbIntent intent) {
        auto ac = acquire(intent);
        if (!ac.ok) {
            THROW(ac.error == PoolAcquireError::Shutdown ? "connection pool is shut down"
                                                         : "timed out waiting for a database connection");
        }
        return std::move(ac.lease);
    }

protected:
    // Only pools are allowed to "return" leases
    virtual void release(PConn conn, DbIntent intent) = 0;
    friend class Lease;
};

inline void Lease::release_() {
    if (owner_ && conn_) {
        // a connection must never go back to the pool with an open transaction
        if (conn_->in_transaction()) {
            try {
                conn_->rollback();
            } catch (const std::exception&) {
                conn_->disconnect();
            }
        }
        owner_->release(conn_, intent_);
    }
    owner_ = nullptr;
    conn_.reset();
}

// Runs @p fn on a leased connection inside a transaction; commits on return, rolls back on throw.
template <class F>
auto with_tr(IDbPool& db, DbIntent intent, F&& fn) -> std::invoke_result_t<F, SQLConnection&> {
    Lease lease = db.lease(intent);
    Transaction tr(lease.conn());
    using R = std::invoke_result_t<F, SQLConnection&>;
    if constexpr (std::is_void_v<R>) {
        std::forward<F>(fn)(lease.conn());
        tr.commit();
    } else {
        R result = std::forward<F>(fn)(lease.conn());
        tr.commit();
        return result;
    }
}

// Same without a transaction
template <class F>
auto with_conn(IDbPool& db, DbIntent intent, F&& fn) -> std::invoke_result_t<F, SQLConnection&> {
    Lease lease = db.lease(intent);
    return std::forward<F>(fn)(lease.conn());
}

} // namespace pool

// Fixed-capacity pool: every connection is opened up front and closed on shutdown.
class DbPool final : public pool::IDbPool {
public:
    DbPool(std::size_t capacity,
        std::string dsn,
        ConnectionFactory factory,
        pool::AcquirePolicy policy = {})
        : cap_(capacity)
        , dsn_(std::move(dsn))
        , policy_(policy)
        , factory_(std::move(factory)) { load_(); }

    ~DbPool() override { shutdown(); }

    AcquireResult acquire(
        pool::DbIntent intent,
        std::chrono::milliseconds to = std::chrono::milliseconds::zero()) override {
        auto deadline = std::chrono::steady_clock::now() + (to.count() ? to : policy_.acquire_timeout);

        std::unique_lock<std::mutex> lk(mx_);
        ++stats_.waiters;
        Finally on_exit([&]() { --stats_.waiters; });

        while (!shutdown_ && free_.empty()) {
            if (cv_.wait_until(lk, deadline) == std::cv_status::timeout && free_.empty()) {
                return { false, { nullptr, nullptr, pool::DbIntent::Read }, pool::PoolAcquireError::Timeout };
            }
        }
        if (shutdown_) {
            return { false, { nullptr, nullptr, pool::DbIntent::Read }, pool::PoolAcquireError::Shutdown };
        }

        auto conn = std::move(free_.front());
        free_.pop_front();
        ++stats_.in_use;

        return { true, pool::Lease { this, std::move(conn), intent }, {} };
    }

    pool::PoolStats stats() const override {
        std::lock_guard<std::mutex> lk(mx_);
        auto s = stats_;
        s.size = cap_;
        return s;
    }

    void shutdown() override {
        std::lock_guard<std::mutex> lk(mx_);
        if (shutdown_) return;
        shutdown_ = true;
        for (auto& c : free_) c->disconnect();
        free_.clear();
        cv_.notify_all();
    }

    std::size_t capacity() const override { return cap_; }
    const std::string& dsn() const override { return dsn_; }

protected:
    void release(PConn conn, pool::DbIntent) override {
        std::lock_guard<std::mutex> lk(mx_);
        if (conn && !shutdown_ && conn->is_open()) {
            free_.push_back(std::move(conn));
        } else if (conn) {
            conn->disconnect();
        }
        if (stats_.in_use)
            --stats_.in_use;
        cv_.notify_one();
    }

private:
    void load_() {
        if (cap_ == 0) THROW("DbPool: capacity must be at least 1");
        if (!factory_) THROW("DbPool: null connection factory");
        std::lock_guard<std::mutex> lk(mx_);
        free_.clear();
        for (std::size_t i = 0; i < cap_; ++i) {
            PSQLConnection up = factory_();
            if (!up) THROW("DbPool: factory returned null connection");
            up->connect(dsn_);
            free_.push_back(PConn(up.release()));
        }
        stats_ = {};
        stats_.size = cap_;
    }

    std::size_t cap_;
    std::string dsn_;
    pool::AcquirePolicy policy_;

    mutable std::mutex mx_;
    std::condition_variable cv_;
    std::deque<PConn> free_;
    bool shutdown_ { false };
    pool::PoolStats stats_;
    ConnectionFactory factory_;
};
